#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mg::types {

struct FileInfo {
    std::string path{};        // full resource path string
    std::string name{};
    uint64_t size{};
    int64_t modified{};        // epoch ms, 0 when the server does not report it
    bool isDirectory{false};
};

void to_json(nlohmann::json& j, const FileInfo& f);
void from_json(const nlohmann::json& j, FileInfo& f);

}
