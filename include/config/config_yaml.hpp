#pragma once

#include "config/Config.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mg::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<WorkersConfig> {
    static Node encode(const WorkersConfig& rhs) {
        Node node;
        node["threads"] = rhs.threads;
        return node;
    }

    static bool decode(const Node& node, WorkersConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.threads = node["threads"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<ThrottleConfig> {
    static Node encode(const ThrottleConfig& rhs) {
        Node node;
        node["local"] = rhs.local;
        node["smb"] = rhs.smb;
        node["sftp"] = rhs.sftp;
        node["ftp"] = rhs.ftp;
        node["cloud"] = rhs.cloud;
        node["wait_timeout_ms"] = rhs.wait_timeout.count();
        node["high_priority_burst"] = rhs.high_priority_burst;
        node["degrade_after_timeouts"] = rhs.degrade_after_timeouts;
        node["restore_after_successes"] = rhs.restore_after_successes;
        node["default_buffer_size"] = rhs.default_buffer_size;
        return node;
    }

    static bool decode(const Node& node, ThrottleConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.local = node["local"].as<unsigned int>(24);
        rhs.smb = node["smb"].as<unsigned int>(2);
        rhs.sftp = node["sftp"].as<unsigned int>(3);
        rhs.ftp = node["ftp"].as<unsigned int>(2);
        rhs.cloud = node["cloud"].as<unsigned int>(8);
        rhs.wait_timeout = std::chrono::milliseconds(node["wait_timeout_ms"].as<long>(0));
        rhs.high_priority_burst = node["high_priority_burst"].as<unsigned int>(4);
        rhs.degrade_after_timeouts = node["degrade_after_timeouts"].as<unsigned int>(3);
        rhs.restore_after_successes = node["restore_after_successes"].as<unsigned int>(10);
        rhs.default_buffer_size = node["default_buffer_size"].as<size_t>(DEFAULT_BUFFER_SIZE);
        return true;
    }
};

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["directory"] = rhs.directory.string();
        node["max_size_mb"] = rhs.max_size_mb;
        node["ttl_hours"] = rhs.ttl.count();
        node["eviction_target_ratio"] = rhs.eviction_target_ratio;
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.directory = node["directory"].as<std::string>("/var/cache/mediagate/network_cache");
        rhs.max_size_mb = node["max_size_mb"].as<uintmax_t>(DEFAULT_CACHE_SIZE_MB);
        rhs.ttl = std::chrono::hours(node["ttl_hours"].as<long>(24));
        rhs.eviction_target_ratio = node["eviction_target_ratio"].as<double>(0.8);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["buffer_size"] = rhs.buffer_size;
        node["staging_directory"] = rhs.staging_directory.string();
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.buffer_size = node["buffer_size"].as<size_t>(DEFAULT_BUFFER_SIZE);
        rhs.staging_directory = node["staging_directory"].as<std::string>("/var/cache/mediagate/staging");
        return true;
    }
};

template<>
struct convert<UndoConfig> {
    static Node encode(const UndoConfig& rhs) {
        Node node;
        node["window_seconds"] = rhs.window.count();
        node["trash_grace_minutes"] = rhs.trash_grace.count();
        node["sweep_interval_seconds"] = rhs.sweep_interval.count();
        node["sweep_roots"] = rhs.sweep_roots;
        return node;
    }

    static bool decode(const Node& node, UndoConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.window = std::chrono::seconds(node["window_seconds"].as<long>(10));
        rhs.trash_grace = std::chrono::minutes(node["trash_grace_minutes"].as<long>(5));
        rhs.sweep_interval = std::chrono::seconds(node["sweep_interval_seconds"].as<long>(60));
        rhs.sweep_roots = node["sweep_roots"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<CredentialsConfig> {
    static Node encode(const CredentialsConfig& rhs) {
        Node node;
        node["store_path"] = rhs.store_path.string();
        node["key_path"] = rhs.key_path.string();
        return node;
    }

    static bool decode(const Node& node, CredentialsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.store_path = node["store_path"].as<std::string>("/var/lib/mediagate/credentials.bin");
        rhs.key_path = node["key_path"].as<std::string>("/var/lib/mediagate/credentials.key");
        return true;
    }
};

template<>
struct convert<CloudProviderConfig> {
    static Node encode(const CloudProviderConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["client_id"] = rhs.client_id;
        node["client_secret"] = rhs.client_secret;
        node["token_endpoint"] = rhs.token_endpoint;
        node["api_base"] = rhs.api_base;
        node["content_base"] = rhs.content_base;
        node["token_store"] = rhs.token_store.string();
        return node;
    }

    static bool decode(const Node& node, CloudProviderConfig& rhs) {
        if (!node.IsMap() || !node["name"]) return false;
        rhs.name = node["name"].as<std::string>();
        rhs.client_id = node["client_id"].as<std::string>("");
        rhs.client_secret = node["client_secret"].as<std::string>("");
        rhs.token_endpoint = node["token_endpoint"].as<std::string>("");
        rhs.api_base = node["api_base"].as<std::string>("");
        rhs.content_base = node["content_base"].as<std::string>(rhs.api_base);
        rhs.token_store = node["token_store"].as<std::string>("/var/lib/mediagate/" + rhs.name + ".tokens");
        return true;
    }
};

template<>
struct convert<CloudConfig> {
    static Node encode(const CloudConfig& rhs) {
        Node node;
        for (const auto& p : rhs.providers) node["providers"].push_back(convert<CloudProviderConfig>::encode(p));
        return node;
    }

    static bool decode(const Node& node, CloudConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.providers.clear();
        if (const auto providers = node["providers"]) {
            for (const auto& p : providers) {
                CloudProviderConfig cfg;
                if (!convert<CloudProviderConfig>::decode(p, cfg)) return false;
                rhs.providers.push_back(std::move(cfg));
            }
        }
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mediagate"] = to_std_string(spdlog::level::to_string_view(rhs.mediagate));
        node["creds"]     = to_std_string(spdlog::level::to_string_view(rhs.creds));
        node["throttle"]  = to_std_string(spdlog::level::to_string_view(rhs.throttle));
        node["protocol"]  = to_std_string(spdlog::level::to_string_view(rhs.protocol));
        node["cloud"]     = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["auth"]      = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["cache"]     = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["transfer"]  = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["undo"]      = to_std_string(spdlog::level::to_string_view(rhs.undo));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mediagate = levelOr(node["mediagate"], spdlog::level::info);
        rhs.creds     = levelOr(node["creds"], spdlog::level::warn);
        rhs.throttle  = levelOr(node["throttle"], spdlog::level::warn);
        rhs.protocol  = levelOr(node["protocol"], spdlog::level::warn);
        rhs.cloud     = levelOr(node["cloud"], spdlog::level::warn);
        rhs.auth      = levelOr(node["auth"], spdlog::level::warn);
        rhs.cache     = levelOr(node["cache"], spdlog::level::warn);
        rhs.transfer  = levelOr(node["transfer"], spdlog::level::info);
        rhs.undo      = levelOr(node["undo"], spdlog::level::info);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::warn);
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/mediagate");
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
