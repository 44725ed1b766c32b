#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace mg::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["workers"]) YAML::convert<WorkersConfig>::decode(node, cfg.workers);
    if (auto node = root["throttle"]) YAML::convert<ThrottleConfig>::decode(node, cfg.throttle);
    if (auto node = root["cache"]) YAML::convert<CacheConfig>::decode(node, cfg.cache);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["undo"]) YAML::convert<UndoConfig>::decode(node, cfg.undo);
    if (auto node = root["credentials"]) YAML::convert<CredentialsConfig>::decode(node, cfg.credentials);
    if (auto node = root["cloud"]) YAML::convert<CloudConfig>::decode(node, cfg.cloud);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.cache.eviction_target_ratio <= 0.0 || cfg.cache.eviction_target_ratio > 1.0)
        throw std::invalid_argument("cache.eviction_target_ratio must be in (0, 1]");
    if (cfg.workers.threads == 0) throw std::invalid_argument("workers.threads must be positive");

    return cfg;
}

}

unsigned int ThrottleConfig::ceilingFor(const types::Protocol p) const {
    switch (p) {
        case types::Protocol::Local: return local;
        case types::Protocol::SMB: return smb;
        case types::Protocol::SFTP: return sftp;
        case types::Protocol::FTP: return ftp;
        case types::Protocol::Cloud: return cloud;
    }
    return 1;
}

const CloudProviderConfig* Config::provider(const std::string& name) const {
    for (const auto& p : cloud.providers)
        if (p.name == name) return &p;
    return nullptr;
}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"workers", c.workers},
        {"throttle", c.throttle},
        {"cache", c.cache},
        {"transfer", c.transfer},
        {"undo", c.undo},
        {"credentials", c.credentials},
        {"cloud", c.cloud},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("workers")) j.at("workers").get_to(c.workers);
    if (j.contains("throttle")) j.at("throttle").get_to(c.throttle);
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("transfer")) j.at("transfer").get_to(c.transfer);
    if (j.contains("undo")) j.at("undo").get_to(c.undo);
    if (j.contains("credentials")) j.at("credentials").get_to(c.credentials);
    if (j.contains("cloud")) j.at("cloud").get_to(c.cloud);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const WorkersConfig& c) {
    j = {{"threads", c.threads}};
}

void from_json(const nlohmann::json& j, WorkersConfig& c) {
    c.threads = j.value("threads", 4u);
}

void to_json(nlohmann::json& j, const ThrottleConfig& c) {
    j = {
        {"local", c.local},
        {"smb", c.smb},
        {"sftp", c.sftp},
        {"ftp", c.ftp},
        {"cloud", c.cloud},
        {"wait_timeout_ms", c.wait_timeout.count()},
        {"high_priority_burst", c.high_priority_burst},
        {"degrade_after_timeouts", c.degrade_after_timeouts},
        {"restore_after_successes", c.restore_after_successes},
        {"default_buffer_size", c.default_buffer_size}
    };
}

void from_json(const nlohmann::json& j, ThrottleConfig& c) {
    c.local = j.value("local", 24u);
    c.smb = j.value("smb", 2u);
    c.sftp = j.value("sftp", 3u);
    c.ftp = j.value("ftp", 2u);
    c.cloud = j.value("cloud", 8u);
    c.wait_timeout = std::chrono::milliseconds(j.value("wait_timeout_ms", 0L));
    c.high_priority_burst = j.value("high_priority_burst", 4u);
    c.degrade_after_timeouts = j.value("degrade_after_timeouts", 3u);
    c.restore_after_successes = j.value("restore_after_successes", 10u);
    c.default_buffer_size = j.value("default_buffer_size", DEFAULT_BUFFER_SIZE);
}

void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = {
        {"directory", c.directory.string()},
        {"max_size_mb", c.max_size_mb},
        {"ttl_hours", c.ttl.count()},
        {"eviction_target_ratio", c.eviction_target_ratio}
    };
}

void from_json(const nlohmann::json& j, CacheConfig& c) {
    c.directory = j.value("directory", std::string("/var/cache/mediagate/network_cache"));
    c.max_size_mb = j.value("max_size_mb", DEFAULT_CACHE_SIZE_MB);
    c.ttl = std::chrono::hours(j.value("ttl_hours", 24L));
    c.eviction_target_ratio = j.value("eviction_target_ratio", 0.8);
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"buffer_size", c.buffer_size},
        {"staging_directory", c.staging_directory.string()}
    };
}

void from_json(const nlohmann::json& j, TransferConfig& c) {
    c.buffer_size = j.value("buffer_size", DEFAULT_BUFFER_SIZE);
    c.staging_directory = j.value("staging_directory", std::string("/var/cache/mediagate/staging"));
}

void to_json(nlohmann::json& j, const UndoConfig& c) {
    j = {
        {"window_seconds", c.window.count()},
        {"trash_grace_minutes", c.trash_grace.count()},
        {"sweep_interval_seconds", c.sweep_interval.count()},
        {"sweep_roots", c.sweep_roots}
    };
}

void from_json(const nlohmann::json& j, UndoConfig& c) {
    c.window = std::chrono::seconds(j.value("window_seconds", 10L));
    c.trash_grace = std::chrono::minutes(j.value("trash_grace_minutes", 5L));
    c.sweep_interval = std::chrono::seconds(j.value("sweep_interval_seconds", 60L));
    c.sweep_roots = j.value("sweep_roots", std::vector<std::string>{});
}

void to_json(nlohmann::json& j, const CredentialsConfig& c) {
    j = {
        {"store_path", c.store_path.string()},
        {"key_path", c.key_path.string()}
    };
}

void from_json(const nlohmann::json& j, CredentialsConfig& c) {
    c.store_path = j.value("store_path", std::string("/var/lib/mediagate/credentials.bin"));
    c.key_path = j.value("key_path", std::string("/var/lib/mediagate/credentials.key"));
}

void to_json(nlohmann::json& j, const CloudProviderConfig& c) {
    // client_secret intentionally not serialized
    j = {
        {"name", c.name},
        {"client_id", c.client_id},
        {"token_endpoint", c.token_endpoint},
        {"api_base", c.api_base},
        {"content_base", c.content_base},
        {"token_store", c.token_store.string()}
    };
}

void from_json(const nlohmann::json& j, CloudProviderConfig& c) {
    c.name = j.at("name").get<std::string>();
    c.client_id = j.value("client_id", std::string{});
    c.client_secret = j.value("client_secret", std::string{});
    c.token_endpoint = j.value("token_endpoint", std::string{});
    c.api_base = j.value("api_base", std::string{});
    c.content_base = j.value("content_base", c.api_base);
    c.token_store = j.value("token_store", std::string{});
}

void to_json(nlohmann::json& j, const CloudConfig& c) {
    j = {{"providers", c.providers}};
}

void from_json(const nlohmann::json& j, CloudConfig& c) {
    c.providers = j.value("providers", std::vector<CloudProviderConfig>{});
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"mediagate", c.mediagate},
        {"creds", c.creds},
        {"throttle", c.throttle},
        {"protocol", c.protocol},
        {"cloud", c.cloud},
        {"auth", c.auth},
        {"cache", c.cache},
        {"transfer", c.transfer},
        {"undo", c.undo}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.mediagate = j.value("mediagate", spdlog::level::info);
    c.creds = j.value("creds", spdlog::level::warn);
    c.throttle = j.value("throttle", spdlog::level::warn);
    c.protocol = j.value("protocol", spdlog::level::warn);
    c.cloud = j.value("cloud", spdlog::level::warn);
    c.auth = j.value("auth", spdlog::level::warn);
    c.cache = j.value("cache", spdlog::level::warn);
    c.transfer = j.value("transfer", spdlog::level::info);
    c.undo = j.value("undo", spdlog::level::info);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", c.console_log_level},
        {"file_log_level", c.file_log_level},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = j.value("console_log_level", spdlog::level::info);
    c.file_log_level = j.value("file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string("/var/log/mediagate"));
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

} // namespace mg::config
