#pragma once

#include "types/Resource.hpp"
#include "types/ResourcePath.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mg::throttle { class Throttle; }
namespace mg::cache { class ContentCache; }
namespace mg::credentials { class Store; }

namespace mg::engine {

struct SpeedTestResult {
    unsigned int concurrency{};
    size_t bufferSize{};
};

class ResourceManager {
public:
    ResourceManager(std::shared_ptr<throttle::Throttle> throttle, std::shared_ptr<cache::ContentCache> cache,
                    std::shared_ptr<const credentials::Store> store);

    // Returns the id. Throws std::invalid_argument on a bad root or a duplicate id.
    std::string add(types::Resource resource);

    // Throws std::out_of_range for an unknown id.
    void update(const types::Resource& resource);

    // Drops throttle overrides and every cache entry under the resource root.
    bool remove(const std::string& id);

    [[nodiscard]] std::optional<types::Resource> find(const std::string& id) const;

    // Resource whose root is the longest prefix of `path`.
    [[nodiscard]] std::optional<types::Resource> findByPath(const types::ResourcePath& path) const;

    [[nodiscard]] std::vector<types::Resource> all() const;

    void applySpeedTest(const std::string& id, const SpeedTestResult& result);

    // Marks credential-backed resources as needing re-authentication when the store changed
    // since the last call. Returns the number of resources newly marked.
    size_t refreshCredentialState();

    void markAuthenticated(const std::string& id);

private:
    std::shared_ptr<throttle::Throttle> throttle_;
    std::shared_ptr<cache::ContentCache> cache_;
    std::shared_ptr<const credentials::Store> store_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, types::Resource> resources_;
    uint64_t seenGeneration_{0};

    void applyRecommendationsLocked(const types::Resource& r, const std::optional<types::Resource>& previous);
    static std::string keyOf(const types::Resource& r);
};

}
