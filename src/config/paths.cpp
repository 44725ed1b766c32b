#include "config/paths.hpp"

#include <cstdlib>
#include <mutex>

namespace mg::paths {

namespace {
std::mutex mutex;
std::filesystem::path logPath = "/var/log/mediagate";
}

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("MEDIAGATE_CONFIG"); env && *env) return env;
    return "/etc/mediagate/config.yaml";
}

std::filesystem::path getLogPath() {
    std::scoped_lock lock(mutex);
    return logPath;
}

void setLogPath(const std::filesystem::path& dir) {
    std::scoped_lock lock(mutex);
    logPath = dir;
}

void setLogPathForTesting() {
    setLogPath(std::filesystem::temp_directory_path() / "mediagate-test-logs");
}

}
