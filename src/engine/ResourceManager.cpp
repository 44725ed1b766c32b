#include "engine/ResourceManager.hpp"
#include "throttle/Throttle.hpp"
#include "cache/ContentCache.hpp"
#include "credentials/Store.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <stdexcept>

using namespace mg::engine;
using namespace mg::types;
using namespace mg::log;

namespace {

bool usesNetworkCredentials(const Protocol p) {
    return p == Protocol::SMB || p == Protocol::SFTP || p == Protocol::FTP;
}

}

ResourceManager::ResourceManager(std::shared_ptr<throttle::Throttle> throttle, std::shared_ptr<cache::ContentCache> cache,
                                 std::shared_ptr<const credentials::Store> store)
    : throttle_(std::move(throttle)), cache_(std::move(cache)), store_(std::move(store)) {
    if (!throttle_) throw std::invalid_argument("ResourceManager requires a throttle");
    if (store_) seenGeneration_ = store_->generation();
}

std::string ResourceManager::keyOf(const Resource& r) {
    auto parsed = ResourcePath::parse(r.root);
    if (!parsed) throw std::invalid_argument("Invalid resource root '" + r.root + "': " + parsed.describe());
    return parsed.value().resourceKey();
}

void ResourceManager::applyRecommendationsLocked(const Resource& r, const std::optional<Resource>& previous) {
    const auto key = keyOf(r);

    if (r.recommendedConcurrency) throttle_->setRecommendedConcurrency(key, *r.recommendedConcurrency);
    else if (previous && previous->recommendedConcurrency) throttle_->clearRecommendedConcurrency(key);

    if (r.recommendedBufferSize) throttle_->setRecommendedBufferSize(key, *r.recommendedBufferSize);
}

std::string ResourceManager::add(Resource resource) {
    auto parsed = ResourcePath::parse(resource.root);
    if (!parsed) throw std::invalid_argument("Invalid resource root '" + resource.root + "': " + parsed.describe());
    if (resource.id.empty()) resource.id = Resource::create(resource.name, resource.root).id;

    resource.protocol = parsed.value().protocol;
    resource.root = parsed.value().toString();

    std::unique_lock lock(mutex_);
    if (resources_.contains(resource.id))
        throw std::invalid_argument("Resource already exists: " + resource.id);

    applyRecommendationsLocked(resource, std::nullopt);
    Registry::mediagate()->info("[ResourceManager] Added {} ({})", resource.name, resource.root);

    const auto id = resource.id;
    resources_.emplace(id, std::move(resource));
    return id;
}

void ResourceManager::update(const Resource& resource) {
    std::unique_lock lock(mutex_);
    const auto it = resources_.find(resource.id);
    if (it == resources_.end()) throw std::out_of_range("Unknown resource: " + resource.id);

    const auto previous = it->second;
    if (keyOf(previous) != keyOf(resource)) {
        // endpoint changed: overrides learned for the old one no longer apply
        if (previous.recommendedConcurrency) throttle_->clearRecommendedConcurrency(keyOf(previous));
        if (cache_) cache_->invalidatePrefix(previous.root);
    }

    it->second = resource;
    applyRecommendationsLocked(resource, keyOf(previous) == keyOf(resource) ? std::optional(previous) : std::nullopt);
    Registry::mediagate()->debug("[ResourceManager] Updated {}", resource.id);
}

bool ResourceManager::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    const auto it = resources_.find(id);
    if (it == resources_.end()) return false;

    const auto r = std::move(it->second);
    resources_.erase(it);

    if (r.recommendedConcurrency) throttle_->clearRecommendedConcurrency(keyOf(r));
    const auto dropped = cache_ ? cache_->invalidatePrefix(r.root) : 0;

    Registry::mediagate()->info("[ResourceManager] Removed {} ({}), {} cache entr{} invalidated", r.name, r.root,
                                dropped, dropped == 1 ? "y" : "ies");
    return true;
}

std::optional<Resource> ResourceManager::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    if (const auto it = resources_.find(id); it != resources_.end()) return it->second;
    return std::nullopt;
}

std::optional<Resource> ResourceManager::findByPath(const ResourcePath& path) const {
    const auto full = path.toString();

    std::shared_lock lock(mutex_);
    const Resource* best = nullptr;
    for (const auto& [_, r] : resources_) {
        const auto& root = r.root;
        const bool under = full == root || (full.starts_with(root) &&
                                            (root.ends_with("/") || full[root.size()] == '/'));
        if (under && (!best || root.size() > best->root.size())) best = &r;
    }
    if (!best) return std::nullopt;
    return *best;
}

std::vector<Resource> ResourceManager::all() const {
    std::shared_lock lock(mutex_);
    std::vector<Resource> out;
    out.reserve(resources_.size());
    for (const auto& [_, r] : resources_) out.push_back(r);
    return out;
}

void ResourceManager::applySpeedTest(const std::string& id, const SpeedTestResult& result) {
    if (result.concurrency == 0) throw std::invalid_argument("Recommended concurrency must be at least 1");

    std::unique_lock lock(mutex_);
    const auto it = resources_.find(id);
    if (it == resources_.end()) throw std::out_of_range("Unknown resource: " + id);

    auto& r = it->second;
    r.recommendedConcurrency = result.concurrency;
    if (result.bufferSize > 0) r.recommendedBufferSize = result.bufferSize;
    applyRecommendationsLocked(r, std::nullopt);

    Registry::throttle()->info("[ResourceManager] Speed test for {}: concurrency {}, buffer {} bytes", r.name,
                               result.concurrency, r.recommendedBufferSize.value_or(0));
}

size_t ResourceManager::refreshCredentialState() {
    if (!store_) return 0;

    std::unique_lock lock(mutex_);
    const auto gen = store_->generation();
    if (gen == seenGeneration_) return 0;
    seenGeneration_ = gen;

    size_t marked = 0;
    for (auto& [_, r] : resources_) {
        if (!usesNetworkCredentials(r.protocol) || r.needsReauth) continue;
        r.needsReauth = true;
        ++marked;
    }
    if (marked > 0) Registry::creds()->info("[ResourceManager] Credentials changed, {} resource(s) need re-authentication", marked);
    return marked;
}

void ResourceManager::markAuthenticated(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (const auto it = resources_.find(id); it != resources_.end()) it->second.needsReauth = false;
}
