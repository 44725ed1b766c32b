#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace mg::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    static void init(const std::filesystem::path& logDir);

    // Console-only loggers at debug, nothing written to disk.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> mediagate() { return get("mediagate"); }
    static std::shared_ptr<spdlog::logger> creds()     { return get("creds"); }
    static std::shared_ptr<spdlog::logger> throttle()  { return get("throttle"); }
    static std::shared_ptr<spdlog::logger> protocol()  { return get("protocol"); }
    static std::shared_ptr<spdlog::logger> cloud()     { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> auth()      { return get("auth"); }
    static std::shared_ptr<spdlog::logger> cache()     { return get("cache"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> undo()      { return get("undo"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void registerLogger(const std::string& name, spdlog::level::level_enum lvl,
                               const std::vector<spdlog::sink_ptr>& sinks);
};

}
