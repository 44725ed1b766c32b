#include "cache/CacheStats.hpp"

#include <nlohmann/json.hpp>

using namespace mg::cache;

double CacheStatsSnapshot::hitRate() const noexcept {
    const auto denom = hits + misses;
    return denom ? static_cast<double>(hits) / static_cast<double>(denom) : 0.0;
}

void CacheStats::record_hit(const uint64_t bytes) noexcept {
    hits.v.fetch_add(1, std::memory_order_relaxed);
    if (bytes) bytes_read.v.fetch_add(bytes, std::memory_order_relaxed);
}

void CacheStats::record_miss() noexcept {
    misses.v.fetch_add(1, std::memory_order_relaxed);
}

void CacheStats::record_insert(const uint64_t bytes) noexcept {
    inserts.v.fetch_add(1, std::memory_order_relaxed);
    if (bytes) bytes_written.v.fetch_add(bytes, std::memory_order_relaxed);
}

void CacheStats::record_eviction(const uint64_t n) noexcept {
    evictions.v.fetch_add(n, std::memory_order_relaxed);
}

void CacheStats::record_invalidation(const uint64_t n) noexcept {
    invalidations.v.fetch_add(n, std::memory_order_relaxed);
}

CacheStatsSnapshot CacheStats::snapshot() const noexcept {
    CacheStatsSnapshot s;
    s.hits = hits.v.load(std::memory_order_relaxed);
    s.misses = misses.v.load(std::memory_order_relaxed);
    s.evictions = evictions.v.load(std::memory_order_relaxed);
    s.inserts = inserts.v.load(std::memory_order_relaxed);
    s.invalidations = invalidations.v.load(std::memory_order_relaxed);
    s.bytes_read = bytes_read.v.load(std::memory_order_relaxed);
    s.bytes_written = bytes_written.v.load(std::memory_order_relaxed);
    return s;
}

void mg::cache::to_json(nlohmann::json& j, const CacheStatsSnapshot& s) {
    j = nlohmann::json{
        {"count", s.count},
        {"total_bytes", s.total_bytes},
        {"max_bytes", s.max_bytes},
        {"hits", s.hits},
        {"misses", s.misses},
        {"hit_rate", s.hitRate()},
        {"evictions", s.evictions},
        {"inserts", s.inserts},
        {"invalidations", s.invalidations},
        {"bytes_read", s.bytes_read},
        {"bytes_written", s.bytes_written},
    };
}
