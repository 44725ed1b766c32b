#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace mg::log {

void Registry::registerLogger(const std::string& name, const spdlog::level::level_enum lvl,
                              const std::vector<spdlog::sink_ptr>& sinks) {
    spdlog::drop(name);
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "mediagate.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_, main_file_sink_};
    const auto& sub = cnf.levels.subsystem_levels;
    registerLogger("mediagate", sub.mediagate, sinks);
    registerLogger("creds",     sub.creds,     sinks);
    registerLogger("throttle",  sub.throttle,  sinks);
    registerLogger("protocol",  sub.protocol,  sinks);
    registerLogger("cloud",     sub.cloud,     sinks);
    registerLogger("auth",      sub.auth,      sinks);
    registerLogger("cache",     sub.cache,     sinks);
    registerLogger("transfer",  sub.transfer,  sinks);
    registerLogger("undo",      sub.undo,      sinks);

    initialized_ = true;
    mediagate()->info("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

void Registry::initForTesting() {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(spdlog::level::debug);
    console_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_};
    for (const auto* name : {"mediagate", "creds", "throttle", "protocol", "cloud", "auth", "cache", "transfer", "undo"})
        registerLogger(name, spdlog::level::debug, sinks);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
