#pragma once

#include "concurrency/CancelToken.hpp"
#include "types/Result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mg::throttle {

enum class Priority { Normal, High };

std::string to_string(Priority p);

struct GateSnapshot {
    unsigned int ceiling{};
    unsigned int active{};
    size_t waitingHigh{};
    size_t waitingNormal{};
    bool degraded{false};
};

class Gate;

// Scoped slot: released on destruction or explicit release(), whichever comes first.
class Permit {
public:
    Permit() = default;
    explicit Permit(std::shared_ptr<Gate> gate) : gate_(std::move(gate)) {}
    ~Permit() { release(); }

    Permit(Permit&& other) noexcept : gate_(std::move(other.gate_)) {}
    Permit& operator=(Permit&& other) noexcept;

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    void release() noexcept;
    [[nodiscard]] bool held() const { return gate_ != nullptr; }

private:
    std::shared_ptr<Gate> gate_;
};

// Bounded-concurrency gate for one (protocol, resourceKey). High priority waiters go first,
// except that after `burst` consecutive high admissions with normal callers queued the oldest
// normal waiter is admitted. FIFO by ticket inside a class.
class Gate : public std::enable_shared_from_this<Gate> {
public:
    Gate(std::string key, unsigned int ceiling, unsigned int burst);

    [[nodiscard]] types::Result<Permit> acquire(Priority priority,
                                                const concurrency::CancelToken& cancel,
                                                std::optional<std::chrono::milliseconds> timeout);

    void release();

    // New admissions only; holders above a lowered ceiling finish normally.
    void setCeiling(unsigned int ceiling);

    [[nodiscard]] const std::string& key() const { return key_; }
    [[nodiscard]] GateSnapshot snapshot() const;

private:
    static constexpr auto kCancelPoll = std::chrono::milliseconds(20);

    std::string key_;
    unsigned int burst_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    unsigned int ceiling_;
    unsigned int active_{0};
    uint64_t nextTicket_{0};
    unsigned int consecutiveHigh_{0};
    std::deque<uint64_t> highQueue_;
    std::deque<uint64_t> normalQueue_;

    [[nodiscard]] bool isNext(uint64_t ticket) const;
    void admit(Priority priority);
    void abandon(Priority priority, uint64_t ticket);
};

}
