#include "throttle/Gate.hpp"

#include <algorithm>

using namespace mg::throttle;
using namespace mg::types;

std::string mg::throttle::to_string(const Priority p) {
    return p == Priority::High ? "high" : "normal";
}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::move(other.gate_);
    }
    return *this;
}

void Permit::release() noexcept {
    if (gate_) {
        gate_->release();
        gate_.reset();
    }
}

Gate::Gate(std::string key, const unsigned int ceiling, const unsigned int burst)
    : key_(std::move(key)), burst_(std::max(1u, burst)), ceiling_(std::max(1u, ceiling)) {}

bool Gate::isNext(const uint64_t ticket) const {
    const bool normalStarved = !normalQueue_.empty() && consecutiveHigh_ >= burst_;
    if (!highQueue_.empty() && !normalStarved) return highQueue_.front() == ticket;
    if (!normalQueue_.empty()) return normalQueue_.front() == ticket;
    return false;
}

void Gate::admit(const Priority priority) {
    auto& q = priority == Priority::High ? highQueue_ : normalQueue_;
    q.pop_front();
    ++active_;

    if (priority == Priority::Normal) consecutiveHigh_ = 0;
    else if (!normalQueue_.empty()) ++consecutiveHigh_;
    else consecutiveHigh_ = 0;
}

void Gate::abandon(const Priority priority, const uint64_t ticket) {
    auto& q = priority == Priority::High ? highQueue_ : normalQueue_;
    std::erase(q, ticket);
    if (normalQueue_.empty()) consecutiveHigh_ = 0;
    cv_.notify_all();
}

Result<Permit> Gate::acquire(const Priority priority,
                             const concurrency::CancelToken& cancel,
                             const std::optional<std::chrono::milliseconds> timeout) {
    if (cancel.isCancelled()) return Cancelled{};

    std::unique_lock lock(mutex_);
    const auto ticket = nextTicket_++;
    (priority == Priority::High ? highQueue_ : normalQueue_).push_back(ticket);

    const auto deadline = timeout
        ? std::optional(std::chrono::steady_clock::now() + *timeout)
        : std::nullopt;

    while (!(active_ < ceiling_ && isNext(ticket))) {
        if (cancel.isCancelled()) {
            abandon(priority, ticket);
            return Cancelled{};
        }

        auto wakeAt = std::chrono::steady_clock::now() + kCancelPoll;
        if (deadline) {
            if (std::chrono::steady_clock::now() >= *deadline) {
                abandon(priority, ticket);
                return Error(ErrorKind::ThrottledTimeout,
                             "Timed out after " + std::to_string(timeout->count()) + "ms waiting for a slot on " + key_);
            }
            wakeAt = std::min(wakeAt, *deadline);
        }
        cv_.wait_until(lock, wakeAt);
    }

    admit(priority);
    // the next queued ticket may also fit under the ceiling
    cv_.notify_all();
    lock.unlock();
    return Permit(shared_from_this());
}

void Gate::release() {
    {
        std::scoped_lock lock(mutex_);
        if (active_ > 0) --active_;
    }
    cv_.notify_all();
}

void Gate::setCeiling(const unsigned int ceiling) {
    {
        std::scoped_lock lock(mutex_);
        ceiling_ = std::max(1u, ceiling);
    }
    cv_.notify_all();
}

GateSnapshot Gate::snapshot() const {
    std::scoped_lock lock(mutex_);
    return {
        .ceiling = ceiling_,
        .active = active_,
        .waitingHigh = highQueue_.size(),
        .waitingNormal = normalQueue_.size(),
        .degraded = false
    };
}
