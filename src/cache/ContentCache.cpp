#include "cache/ContentCache.hpp"
#include "crypto/hash.hpp"
#include "log/Registry.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <fstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace mg::cache;
using namespace mg::types;
namespace fs = std::filesystem;

ContentCache::ContentCache(fs::path directory, const uint64_t maxBytes, const std::chrono::seconds ttl,
                           const double targetRatio, NowFn now)
    : dir_(std::move(directory)), maxBytes_(maxBytes), ttl_(ttl), targetRatio_(targetRatio), now_(std::move(now)) {
    if (maxBytes_ == 0) throw std::invalid_argument("ContentCache max size must be positive");
    if (targetRatio_ <= 0.0 || targetRatio_ > 1.0) throw std::invalid_argument("ContentCache target ratio must be in (0, 1]");
    fs::create_directories(dir_);

    // Leftovers from a crashed writer are never valid entries.
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(dir_, ec))
        if (isStaging(e.path())) fs::remove(e.path(), ec);
}

ContentCache::ContentCache(const config::CacheConfig& cfg)
    : ContentCache(cfg.directory, cfg.maxBytes(), std::chrono::duration_cast<std::chrono::seconds>(cfg.ttl),
                   cfg.eviction_target_ratio) {}

std::string ContentCache::keyFor(const std::string& path, const int64_t modifiedTime) {
    return crypto::hash::sha256Hex(path + "|" + std::to_string(modifiedTime));
}

bool ContentCache::isStaging(const fs::path& p) {
    return p.filename().string().find(kStagingMarker) != std::string::npos;
}

fs::path ContentCache::stagingPath(const std::string& key) const {
    static thread_local boost::uuids::random_generator gen;
    return dir_ / (key + kStagingMarker + boost::uuids::to_string(gen()));
}

std::optional<fs::path> ContentCache::lookupLocked(const std::string& key) {
    const auto file = dir_ / key;
    std::error_code ec;
    const auto mtime = fs::last_write_time(file, ec);
    if (ec) return std::nullopt;

    if (now_() - util::toSystemTime(mtime) > ttl_) {
        fs::remove(file, ec);
        index_.erase(key);
        log::Registry::cache()->debug("[ContentCache] Dropped expired entry {}", key);
        return std::nullopt;
    }

    return file;
}

std::optional<std::vector<uint8_t>> ContentCache::get(const std::string& path, const int64_t modifiedTime) {
    const auto key = keyFor(path, modifiedTime);
    std::scoped_lock lock(mutex_);

    const auto file = lookupLocked(key);
    if (!file) {
        stats_.record_miss();
        return std::nullopt;
    }

    std::ifstream in(*file, std::ios::binary);
    if (!in) {
        stats_.record_miss();
        return std::nullopt;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    index_[key] = {path, now_()};
    stats_.record_hit(bytes.size());
    return bytes;
}

std::optional<fs::path> ContentCache::getFile(const std::string& path, const int64_t modifiedTime) {
    const auto key = keyFor(path, modifiedTime);
    std::scoped_lock lock(mutex_);

    auto file = lookupLocked(key);
    if (!file) {
        stats_.record_miss();
        return std::nullopt;
    }

    index_[key] = {path, now_()};
    stats_.record_hit();
    return file;
}

Result<CachedHandle> ContentCache::put(const std::string& path, const int64_t modifiedTime,
                                       const std::vector<uint8_t>& bytes) {
    if (bytes.size() > maxBytes_)
        return Error(ErrorKind::InvalidArgument, "Entry of " + std::to_string(bytes.size()) +
                     " bytes exceeds cache ceiling of " + std::to_string(maxBytes_));

    const auto key = keyFor(path, modifiedTime);
    const auto staging = stagingPath(key);
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(staging, ec);
            log::Registry::cache()->error("[ContentCache] Failed to stage {}", staging.string());
            return Error(ErrorKind::Transport, "Failed to write cache entry for " + path);
        }
    }

    std::scoped_lock lock(mutex_);
    return commitLocked(path, key, staging);
}

Result<CachedHandle> ContentCache::put(const std::string& path, const int64_t modifiedTime, std::istream& in) {
    const auto key = keyFor(path, modifiedTime);
    const auto staging = stagingPath(key);
    std::error_code ec;

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        std::vector<char> buf(config::DEFAULT_BUFFER_SIZE);
        uint64_t written = 0;
        while (in && out) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto n = in.gcount();
            if (n <= 0) break;
            out.write(buf.data(), n);
            written += static_cast<uint64_t>(n);
            if (written > maxBytes_) {
                out.close();
                fs::remove(staging, ec);
                return Error(ErrorKind::InvalidArgument, "Stream for " + path + " exceeds cache ceiling");
            }
        }
        out.close();
        if (!out || in.bad()) {
            fs::remove(staging, ec);
            log::Registry::cache()->error("[ContentCache] Failed to stage stream for {}", path);
            return Error(ErrorKind::Transport, "Failed to write cache entry for " + path);
        }
    }

    std::scoped_lock lock(mutex_);
    return commitLocked(path, key, staging);
}

Result<CachedHandle> ContentCache::commitLocked(const std::string& path, const std::string& key,
                                                const fs::path& staging) {
    const auto file = dir_ / key;
    std::error_code ec;
    fs::rename(staging, file, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Error(ErrorKind::Transport, "Failed to commit cache entry for " + path, ec.message());
    }

    const auto size = fs::file_size(file, ec);
    // mtime is the write time the TTL counts from
    fs::last_write_time(file, util::toFileTime(now_()), ec);

    index_[key] = {path, now_()};
    stats_.record_insert(size);
    evictIfNeededLocked();

    return CachedHandle{key, file, size};
}

std::vector<ContentCache::DiskEntry> ContentCache::scanLocked() const {
    std::vector<DiskEntry> entries;
    std::error_code ec;
    for (const auto& e : fs::directory_iterator(dir_, ec)) {
        if (!e.is_regular_file(ec) || isStaging(e.path())) continue;

        DiskEntry d;
        d.key = e.path().filename().string();
        d.file = e.path();
        d.size = e.file_size(ec);
        if (const auto it = index_.find(d.key); it != index_.end()) d.touched = it->second.lastTouch;
        else d.touched = util::toSystemTime(e.last_write_time(ec));
        entries.push_back(std::move(d));
    }
    return entries;
}

void ContentCache::evictIfNeededLocked() {
    auto entries = scanLocked();
    uint64_t total = 0;
    for (const auto& e : entries) total += e.size;
    if (total <= maxBytes_) return;

    const auto target = static_cast<uint64_t>(static_cast<double>(maxBytes_) * targetRatio_);
    std::ranges::sort(entries, {}, &DiskEntry::touched);

    uint64_t evicted = 0, freed = 0;
    for (const auto& e : entries) {
        if (total <= target) break;
        std::error_code ec;
        if (!fs::remove(e.file, ec) || ec) continue;
        index_.erase(e.key);
        total -= e.size;
        freed += e.size;
        ++evicted;
    }

    stats_.record_eviction(evicted);
    log::Registry::cache()->info("[ContentCache] Evicted {} entries ({} bytes), now {} of {} bytes",
                                 evicted, freed, total, maxBytes_);
}

bool ContentCache::invalidate(const std::string& path, const int64_t modifiedTime) {
    const auto key = keyFor(path, modifiedTime);
    std::scoped_lock lock(mutex_);
    index_.erase(key);
    std::error_code ec;
    const bool removed = fs::remove(dir_ / key, ec);
    if (removed) stats_.record_invalidation();
    return removed;
}

size_t ContentCache::invalidatePrefix(const std::string& pathPrefix) {
    // whole path segments only: "/photos/a.jpg" does not cover "/photos/a.jpg.bak"
    const auto folder = pathPrefix.ends_with('/') ? pathPrefix : pathPrefix + "/";
    const auto covered = [&](const std::string& path) { return path == pathPrefix || path.starts_with(folder); };

    std::scoped_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = index_.begin(); it != index_.end();) {
        if (!covered(it->second.path)) {
            ++it;
            continue;
        }
        std::error_code ec;
        if (fs::remove(dir_ / it->first, ec)) ++removed;
        it = index_.erase(it);
    }
    if (removed) {
        stats_.record_invalidation(removed);
        log::Registry::cache()->info("[ContentCache] Invalidated {} entries under {}", removed, pathPrefix);
    }
    return removed;
}

void ContentCache::clearAll() {
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    std::vector<fs::path> doomed;
    for (const auto& e : fs::directory_iterator(dir_, ec))
        if (!isStaging(e.path())) doomed.push_back(e.path());

    uint64_t removed = 0;
    for (const auto& p : doomed)
        if (fs::remove_all(p, ec) > 0) ++removed;
    index_.clear();
    stats_.record_invalidation(removed);
    log::Registry::cache()->info("[ContentCache] Cleared {} entries", removed);
}

CacheStatsSnapshot ContentCache::stats() const {
    std::scoped_lock lock(mutex_);
    auto snap = stats_.snapshot();
    for (const auto& e : scanLocked()) {
        ++snap.count;
        snap.total_bytes += e.size;
    }
    snap.max_bytes = maxBytes_;
    return snap;
}
