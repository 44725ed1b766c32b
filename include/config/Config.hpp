#pragma once

#include "types/Protocol.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace mg::config {

constexpr static uintmax_t DEFAULT_CACHE_SIZE_MB = 500;
constexpr static size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64 KiB

struct WorkersConfig {
    unsigned int threads = 4;
};

struct ThrottleConfig {
    unsigned int local = 24;
    unsigned int smb = 2;
    unsigned int sftp = 3;
    unsigned int ftp = 2;
    unsigned int cloud = 8;
    std::chrono::milliseconds wait_timeout{0}; // 0 = wait indefinitely
    unsigned int high_priority_burst = 4;
    unsigned int degrade_after_timeouts = 3;
    unsigned int restore_after_successes = 10;
    size_t default_buffer_size = DEFAULT_BUFFER_SIZE;

    [[nodiscard]] unsigned int ceilingFor(types::Protocol p) const;
};

struct CacheConfig {
    std::filesystem::path directory = "/var/cache/mediagate/network_cache";
    uintmax_t max_size_mb = DEFAULT_CACHE_SIZE_MB;
    std::chrono::hours ttl = std::chrono::hours(24);
    double eviction_target_ratio = 0.8;

    [[nodiscard]] uintmax_t maxBytes() const { return max_size_mb * 1024 * 1024; }
};

struct TransferConfig {
    size_t buffer_size = DEFAULT_BUFFER_SIZE;
    std::filesystem::path staging_directory = "/var/cache/mediagate/staging";
};

struct UndoConfig {
    std::chrono::seconds window = std::chrono::seconds(10);
    std::chrono::minutes trash_grace = std::chrono::minutes(5);
    std::chrono::seconds sweep_interval = std::chrono::seconds(60);
    std::vector<std::string> sweep_roots;
};

struct CredentialsConfig {
    std::filesystem::path store_path = "/var/lib/mediagate/credentials.bin";
    std::filesystem::path key_path = "/var/lib/mediagate/credentials.key";
};

struct CloudProviderConfig {
    std::string name;
    std::string client_id;
    std::string client_secret;
    std::string token_endpoint;
    std::string api_base;
    std::string content_base;
    std::filesystem::path token_store;
};

struct CloudConfig {
    std::vector<CloudProviderConfig> providers;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mediagate = spdlog::level::info;   // startup/shutdown, engine lifecycle
    spdlog::level::level_enum creds     = spdlog::level::warn;   // lookup misses, store I/O failures
    spdlog::level::level_enum throttle  = spdlog::level::warn;   // degradation, wait timeouts
    spdlog::level::level_enum protocol  = spdlog::level::warn;   // client I/O failures
    spdlog::level::level_enum cloud     = spdlog::level::warn;   // REST errors, token refreshes
    spdlog::level::level_enum auth      = spdlog::level::warn;   // silent re-auth attempts
    spdlog::level::level_enum cache     = spdlog::level::warn;   // eviction, write failures
    spdlog::level::level_enum transfer  = spdlog::level::info;   // copy/move/delete summaries
    spdlog::level::level_enum undo      = spdlog::level::info;   // undo results, trash sweeps
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/mediagate";
    LogLevelsConfig levels;
};

struct Config {
    WorkersConfig workers;
    ThrottleConfig throttle;
    CacheConfig cache;
    TransferConfig transfer;
    UndoConfig undo;
    CredentialsConfig credentials;
    CloudConfig cloud;
    LoggingConfig logging;

    [[nodiscard]] const CloudProviderConfig* provider(const std::string& name) const;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const WorkersConfig& c);
void from_json(const nlohmann::json& j, WorkersConfig& c);
void to_json(nlohmann::json& j, const ThrottleConfig& c);
void from_json(const nlohmann::json& j, ThrottleConfig& c);
void to_json(nlohmann::json& j, const CacheConfig& c);
void from_json(const nlohmann::json& j, CacheConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void from_json(const nlohmann::json& j, TransferConfig& c);
void to_json(nlohmann::json& j, const UndoConfig& c);
void from_json(const nlohmann::json& j, UndoConfig& c);
void to_json(nlohmann::json& j, const CredentialsConfig& c);
void from_json(const nlohmann::json& j, CredentialsConfig& c);
void to_json(nlohmann::json& j, const CloudProviderConfig& c);
void from_json(const nlohmann::json& j, CloudProviderConfig& c);
void to_json(nlohmann::json& j, const CloudConfig& c);
void from_json(const nlohmann::json& j, CloudConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace mg::config
