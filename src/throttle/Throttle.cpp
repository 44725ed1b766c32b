#include "throttle/Throttle.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

using namespace mg::throttle;
using namespace mg::types;
using namespace mg::concurrency;

Throttle::Throttle(config::ThrottleConfig cfg) : cfg_(std::move(cfg)) {}

std::string Throttle::gateId(const Protocol protocol, const std::string& resourceKey) {
    return to_string(protocol) + "|" + resourceKey;
}

unsigned int Throttle::ceilingLocked(const Protocol protocol, const std::string& resourceKey) const {
    unsigned int base = cfg_.ceilingFor(protocol);
    if (const auto it = recommendedConcurrency_.find(resourceKey); it != recommendedConcurrency_.end())
        base = it->second;

    if (const auto it = health_.find(resourceKey); it != health_.end() && it->second.degraded)
        return std::max(1u, base / 2);

    return std::max(1u, base);
}

unsigned int Throttle::ceilingFor(const Protocol protocol, const std::string& resourceKey) const {
    std::scoped_lock lock(mutex_);
    return ceilingLocked(protocol, resourceKey);
}

std::shared_ptr<Gate> Throttle::gateFor(const Protocol protocol, const std::string& resourceKey) {
    std::scoped_lock lock(mutex_);
    const auto id = gateId(protocol, resourceKey);
    auto it = gates_.find(id);
    if (it == gates_.end())
        it = gates_.emplace(id, std::make_shared<Gate>(resourceKey, ceilingLocked(protocol, resourceKey),
                                                       cfg_.high_priority_burst)).first;
    return it->second;
}

void Throttle::applyCeilingsLocked(const std::string& resourceKey) {
    for (const auto& [id, gate] : gates_) {
        if (gate->key() != resourceKey) continue;
        const auto protocol = protocolFromString(id.substr(0, id.find('|')));
        if (protocol) gate->setCeiling(ceilingLocked(*protocol, resourceKey));
    }
}

Result<Permit> Throttle::acquire(const Protocol protocol, const std::string& resourceKey, const Priority priority,
                                 const CancelToken& cancel) {
    const auto gate = gateFor(protocol, resourceKey);
    const auto timeout = cfg_.wait_timeout.count() > 0
        ? std::optional(cfg_.wait_timeout)
        : std::nullopt;

    auto permit = gate->acquire(priority, cancel, timeout);
    if (permit.is(ErrorKind::ThrottledTimeout))
        log::Registry::throttle()->warn("[Throttle] {} ({} priority)", permit.error().message, to_string(priority));
    return permit;
}

Result<std::vector<Permit>> Throttle::acquireAll(std::vector<SlotRequest> slots, const Priority priority,
                                                 const CancelToken& cancel) {
    std::ranges::sort(slots, [](const auto& a, const auto& b) {
        return gateId(a.protocol, a.resourceKey) < gateId(b.protocol, b.resourceKey);
    });
    const auto dup = std::ranges::unique(slots, [](const auto& a, const auto& b) {
        return a.protocol == b.protocol && a.resourceKey == b.resourceKey;
    });
    slots.erase(dup.begin(), dup.end());

    std::vector<Permit> permits;
    permits.reserve(slots.size());
    for (const auto& s : slots) {
        auto permit = acquire(s.protocol, s.resourceKey, priority, cancel);
        if (!permit) return permit.propagate<std::vector<Permit>>();
        permits.push_back(std::move(permit).value());
    }
    return permits;
}

void Throttle::setRecommendedConcurrency(const std::string& resourceKey, const unsigned int n) {
    std::scoped_lock lock(mutex_);
    recommendedConcurrency_[resourceKey] = std::max(1u, n);
    applyCeilingsLocked(resourceKey);
    log::Registry::throttle()->debug("[Throttle] Recommended concurrency for {} set to {}", resourceKey, n);
}

void Throttle::clearRecommendedConcurrency(const std::string& resourceKey) {
    std::scoped_lock lock(mutex_);
    recommendedConcurrency_.erase(resourceKey);
    applyCeilingsLocked(resourceKey);
}

void Throttle::setRecommendedBufferSize(const std::string& resourceKey, const size_t bytes) {
    std::scoped_lock lock(mutex_);
    if (bytes == 0) recommendedBufferSize_.erase(resourceKey);
    else recommendedBufferSize_[resourceKey] = bytes;
}

size_t Throttle::recommendedBufferSize(const std::string& resourceKey) const {
    return recommendedBufferSize(resourceKey, cfg_.default_buffer_size);
}

size_t Throttle::recommendedBufferSize(const std::string& resourceKey, const size_t fallback) const {
    std::scoped_lock lock(mutex_);
    const auto it = recommendedBufferSize_.find(resourceKey);
    return it != recommendedBufferSize_.end() ? it->second : fallback;
}

void Throttle::reportTimeout(const std::string& resourceKey) {
    std::scoped_lock lock(mutex_);
    auto& h = health_[resourceKey];
    h.consecutiveSuccesses = 0;
    ++h.consecutiveTimeouts;

    if (!h.degraded && h.consecutiveTimeouts >= cfg_.degrade_after_timeouts) {
        h.degraded = true;
        applyCeilingsLocked(resourceKey);
        log::Registry::throttle()->warn("[Throttle] {} degraded after {} consecutive timeouts",
                                        resourceKey, h.consecutiveTimeouts);
    }
}

void Throttle::reportSuccess(const std::string& resourceKey) {
    std::scoped_lock lock(mutex_);
    const auto it = health_.find(resourceKey);
    if (it == health_.end()) return;

    auto& h = it->second;
    h.consecutiveTimeouts = 0;
    if (!h.degraded) return;

    if (++h.consecutiveSuccesses >= cfg_.restore_after_successes) {
        h.degraded = false;
        h.consecutiveSuccesses = 0;
        applyCeilingsLocked(resourceKey);
        log::Registry::throttle()->info("[Throttle] {} restored to full concurrency", resourceKey);
    }
}

bool Throttle::isDegraded(const std::string& resourceKey) const {
    std::scoped_lock lock(mutex_);
    const auto it = health_.find(resourceKey);
    return it != health_.end() && it->second.degraded;
}

GateSnapshot Throttle::snapshot(const Protocol protocol, const std::string& resourceKey) const {
    std::scoped_lock lock(mutex_);
    GateSnapshot snap;
    if (const auto it = gates_.find(gateId(protocol, resourceKey)); it != gates_.end()) snap = it->second->snapshot();
    else snap.ceiling = ceilingLocked(protocol, resourceKey);

    if (const auto it = health_.find(resourceKey); it != health_.end()) snap.degraded = it->second.degraded;
    return snap;
}

void Throttle::recordOutcome(const std::string& resourceKey, const bool ok, const Error* error) {
    if (ok) {
        reportSuccess(resourceKey);
        return;
    }
    if (!error || error->kind != ErrorKind::Transport) return;

    auto msg = error->message + " " + error->cause;
    std::ranges::transform(msg, msg.begin(), [](const unsigned char c) { return std::tolower(c); });
    if (msg.find("timeout") != std::string::npos || msg.find("timed out") != std::string::npos)
        reportTimeout(resourceKey);
}
