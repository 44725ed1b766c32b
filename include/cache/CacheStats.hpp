#pragma once

#include <atomic>
#include <cstdint>

#include <nlohmann/json_fwd.hpp>

namespace mg::cache {

// 64-byte cache line padding helper to avoid false sharing.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
    char pad[kCacheLine - (sizeof(std::atomic<T>) % kCacheLine ? (sizeof(std::atomic<T>) % kCacheLine) : kCacheLine)]{};
};

struct CacheStatsSnapshot {
    uint64_t count{};
    uint64_t total_bytes{};
    uint64_t max_bytes{};

    uint64_t hits{};
    uint64_t misses{};
    uint64_t evictions{};
    uint64_t inserts{};
    uint64_t invalidations{};

    uint64_t bytes_read{};
    uint64_t bytes_written{};

    [[nodiscard]] double hitRate() const noexcept;
};

struct CacheStats {
    PaddedAtomic<uint64_t> hits;
    PaddedAtomic<uint64_t> misses;

    PaddedAtomic<uint64_t> evictions;
    PaddedAtomic<uint64_t> inserts;
    PaddedAtomic<uint64_t> invalidations;

    PaddedAtomic<uint64_t> bytes_read;
    PaddedAtomic<uint64_t> bytes_written;

    void record_hit(uint64_t bytes = 0) noexcept;
    void record_miss() noexcept;
    void record_insert(uint64_t bytes = 0) noexcept;
    void record_eviction(uint64_t n = 1) noexcept;
    void record_invalidation(uint64_t n = 1) noexcept;

    // count/total/max are filled in by the cache from its directory
    [[nodiscard]] CacheStatsSnapshot snapshot() const noexcept;
};

void to_json(nlohmann::json& j, const CacheStatsSnapshot& s);

}
