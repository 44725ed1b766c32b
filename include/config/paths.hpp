#pragma once

#include <filesystem>

namespace mg::paths {

// MEDIAGATE_CONFIG overrides the default /etc/mediagate/config.yaml
std::filesystem::path getConfigPath();

std::filesystem::path getLogPath();
void setLogPath(const std::filesystem::path& dir);
void setLogPathForTesting();

}
