#include "types/FileInfo.hpp"

#include <nlohmann/json.hpp>

namespace mg::types {

void to_json(nlohmann::json& j, const FileInfo& f) {
    j = {
        {"path", f.path},
        {"name", f.name},
        {"size", f.size},
        {"modified", f.modified},
        {"is_directory", f.isDirectory}
    };
}

void from_json(const nlohmann::json& j, FileInfo& f) {
    f.path = j.at("path").get<std::string>();
    f.name = j.value("name", std::string{});
    f.size = j.value("size", uint64_t{0});
    f.modified = j.value("modified", int64_t{0});
    f.isDirectory = j.value("is_directory", false);
}

}
