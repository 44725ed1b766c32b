#pragma once

#include "types/Protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mg::types {

struct Resource {
    std::string id{};
    std::string name{};
    Protocol protocol{Protocol::Local};
    std::string root{};
    std::optional<std::string> credentialRef{};
    bool writable{true};

    // learned from a throughput test, override protocol defaults for this endpoint only
    std::optional<unsigned int> recommendedConcurrency{};
    std::optional<size_t> recommendedBufferSize{};

    // set when the backing credentials changed after the resource was last used
    bool needsReauth{false};

    static Resource create(const std::string& name, const std::string& root, bool writable = true);
};

void to_json(nlohmann::json& j, const Resource& r);
void from_json(const nlohmann::json& j, Resource& r);

}
