#pragma once

#include "throttle/Gate.hpp"
#include "config/Config.hpp"
#include "types/Protocol.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mg::throttle {

struct SlotRequest {
    types::Protocol protocol;
    std::string resourceKey;
};

// One bounded gate per (protocol, resourceKey). Constructed once and passed explicitly to
// the orchestrator and the engine.
class Throttle {
public:
    explicit Throttle(config::ThrottleConfig cfg);

    template <typename Fn>
    auto withThrottle(const types::Protocol protocol, const std::string& resourceKey, const Priority priority,
                      Fn&& op, const concurrency::CancelToken& cancel = concurrency::CancelToken::none())
        -> decltype(op()) {
        using R = decltype(op());
        using T = typename R::value_type;

        auto permit = acquire(protocol, resourceKey, priority, cancel);
        if (!permit) return permit.template propagate<T>();

        R result = op();
        recordOutcome(resourceKey, result.ok(), result.isError() ? &result.error() : nullptr);
        return result;
    }

    [[nodiscard]] types::Result<Permit> acquire(types::Protocol protocol, const std::string& resourceKey,
                                                Priority priority,
                                                const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    // Deduplicated and taken in sorted key order so two transfers in opposite directions
    // never hold one slot each while waiting on the other.
    [[nodiscard]] types::Result<std::vector<Permit>> acquireAll(std::vector<SlotRequest> slots, Priority priority,
                                                                const concurrency::CancelToken& cancel);

    void setRecommendedConcurrency(const std::string& resourceKey, unsigned int n);
    void clearRecommendedConcurrency(const std::string& resourceKey);

    void setRecommendedBufferSize(const std::string& resourceKey, size_t bytes);
    [[nodiscard]] size_t recommendedBufferSize(const std::string& resourceKey) const;
    [[nodiscard]] size_t recommendedBufferSize(const std::string& resourceKey, size_t fallback) const;

    void reportTimeout(const std::string& resourceKey);
    void reportSuccess(const std::string& resourceKey);
    [[nodiscard]] bool isDegraded(const std::string& resourceKey) const;

    [[nodiscard]] unsigned int ceilingFor(types::Protocol protocol, const std::string& resourceKey) const;
    [[nodiscard]] GateSnapshot snapshot(types::Protocol protocol, const std::string& resourceKey) const;

    [[nodiscard]] const config::ThrottleConfig& config() const { return cfg_; }

private:
    struct Health {
        unsigned int consecutiveTimeouts{0};
        unsigned int consecutiveSuccesses{0};
        bool degraded{false};
    };

    config::ThrottleConfig cfg_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Gate>> gates_;   // "<PROTOCOL>|<resourceKey>"
    std::unordered_map<std::string, unsigned int> recommendedConcurrency_;
    std::unordered_map<std::string, size_t> recommendedBufferSize_;
    std::unordered_map<std::string, Health> health_;

    static std::string gateId(types::Protocol protocol, const std::string& resourceKey);

    std::shared_ptr<Gate> gateFor(types::Protocol protocol, const std::string& resourceKey);
    [[nodiscard]] unsigned int ceilingLocked(types::Protocol protocol, const std::string& resourceKey) const;
    void applyCeilingsLocked(const std::string& resourceKey);

    void recordOutcome(const std::string& resourceKey, bool ok, const types::Error* error);
};

}
