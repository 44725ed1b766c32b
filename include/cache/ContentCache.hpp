#pragma once

#include "cache/CacheStats.hpp"
#include "config/Config.hpp"
#include "types/Result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mg::cache {

struct CachedHandle {
    std::string key;
    std::filesystem::path file;
    uint64_t size{};
};

// Disk-backed cache of remote file bytes keyed by sha256("{path}|{modifiedTime}").
// One file per key under the cache directory; writes are staged and renamed into place.
class ContentCache {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    ContentCache(std::filesystem::path directory, uint64_t maxBytes, std::chrono::seconds ttl,
                 double targetRatio = 0.8, NowFn now = Clock::now);
    explicit ContentCache(const config::CacheConfig& cfg);

    static std::string keyFor(const std::string& path, int64_t modifiedTime);

    [[nodiscard]] std::optional<std::vector<uint8_t>> get(const std::string& path, int64_t modifiedTime);
    [[nodiscard]] std::optional<std::filesystem::path> getFile(const std::string& path, int64_t modifiedTime);

    types::Result<CachedHandle> put(const std::string& path, int64_t modifiedTime, const std::vector<uint8_t>& bytes);
    types::Result<CachedHandle> put(const std::string& path, int64_t modifiedTime, std::istream& in);

    bool invalidate(const std::string& path, int64_t modifiedTime);

    // Drops the entry at `pathPrefix` and every entry below it. Only entries this process has put or
    // read are attributable to a path.
    size_t invalidatePrefix(const std::string& pathPrefix);

    void clearAll();

    [[nodiscard]] CacheStatsSnapshot stats() const;

    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }
    [[nodiscard]] uint64_t maxBytes() const { return maxBytes_; }

private:
    struct IndexEntry {
        std::string path;
        Clock::time_point lastTouch;
    };

    struct DiskEntry {
        std::string key;
        std::filesystem::path file;
        uint64_t size{};
        Clock::time_point touched;
    };

    static constexpr auto kStagingMarker = ".tmp-";

    std::filesystem::path dir_;
    uint64_t maxBytes_;
    std::chrono::seconds ttl_;
    double targetRatio_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, IndexEntry> index_;
    CacheStats stats_;

    // Returns the live entry for key, or nullopt after lazily deleting an expired one.
    std::optional<std::filesystem::path> lookupLocked(const std::string& key);
    types::Result<CachedHandle> commitLocked(const std::string& path, const std::string& key,
                                             const std::filesystem::path& staging);
    [[nodiscard]] std::vector<DiskEntry> scanLocked() const;
    void evictIfNeededLocked();
    [[nodiscard]] std::filesystem::path stagingPath(const std::string& key) const;
    static bool isStaging(const std::filesystem::path& p);
};

}
