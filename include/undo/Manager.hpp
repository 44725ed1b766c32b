#pragma once

#include "undo/UndoRecord.hpp"
#include "protocol/Registry.hpp"
#include "throttle/Throttle.hpp"
#include "types/Result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace mg::transfer { class Orchestrator; }

namespace mg::undo {

struct UndoReport {
    UndoKind kind{UndoKind::Copy};
    size_t restored{0};
    size_t failed{0};
    std::vector<types::Error> errors{};
};

// Holds at most one undoable operation for a short window: Empty -> Recorded -> Consumed | Expired.
class Manager {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    Manager(std::shared_ptr<protocol::Registry> registry, std::shared_ptr<transfer::Orchestrator> orchestrator,
            std::shared_ptr<throttle::Throttle> throttle, std::chrono::seconds window, NowFn now = Clock::now);

    void saveOperation(UndoRecord record);

    [[nodiscard]] bool isUndoAvailable();

    // Consumes the live record whatever the outcome.
    types::Result<UndoReport> undo();

    void clear();

    [[nodiscard]] std::chrono::seconds window() const { return window_; }

private:
    std::shared_ptr<protocol::Registry> registry_;
    std::shared_ptr<transfer::Orchestrator> orchestrator_;
    std::shared_ptr<throttle::Throttle> throttle_;
    std::chrono::seconds window_;
    NowFn now_;

    std::mutex mutex_;
    std::optional<UndoRecord> record_;

    [[nodiscard]] bool liveLocked();

    types::Result<UndoReport> undoCopy(const UndoRecord& record);
    types::Result<UndoReport> undoMove(const UndoRecord& record);
    types::Result<UndoReport> undoDelete(const UndoRecord& record);
    types::Result<UndoReport> undoRename(const UndoRecord& record);

    // Client call holding a slot for the path's endpoint.
    template <typename Fn>
    auto throttled(const types::ResourcePath& path, Fn&& op) -> decltype(op()) {
        return throttle_->withThrottle(path.protocol, path.resourceKey(), throttle::Priority::Normal,
                                       std::forward<Fn>(op));
    }

    types::VoidResult restoreFromTrash(protocol::Client& client, const types::ResourcePath& entry,
                                       const types::ResourcePath& original);
};

}
