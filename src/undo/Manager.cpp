#include "undo/Manager.hpp"
#include "undo/TrashManager.hpp"
#include "transfer/Orchestrator.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace mg::undo;
using namespace mg::types;

namespace {

void tally(UndoReport& report, const VoidResult& r) {
    if (r) {
        ++report.restored;
        return;
    }
    ++report.failed;
    if (r.isError()) report.errors.push_back(r.error());
}

}

Manager::Manager(std::shared_ptr<protocol::Registry> registry, std::shared_ptr<transfer::Orchestrator> orchestrator,
                 std::shared_ptr<throttle::Throttle> throttle, const std::chrono::seconds window, NowFn now)
    : registry_(std::move(registry)), orchestrator_(std::move(orchestrator)), throttle_(std::move(throttle)),
      window_(window), now_(std::move(now)) {
    if (!registry_) throw std::invalid_argument("Undo manager requires a protocol registry");
    if (!orchestrator_) throw std::invalid_argument("Undo manager requires a transfer orchestrator");
    if (!throttle_) throw std::invalid_argument("Undo manager requires a throttle");
    if (window_.count() <= 0) throw std::invalid_argument("Undo window must be positive");
    if (!now_) now_ = Clock::now;
}

void Manager::saveOperation(UndoRecord record) {
    std::scoped_lock lock(mutex_);
    log::Registry::undo()->debug("[UndoManager] Recorded {} of {} item(s)", to_string(record.kind),
                                 record.originalPaths.size());
    record_ = std::move(record);
}

bool Manager::liveLocked() {
    if (!record_) return false;
    if (now_() - record_->createdAt > window_) {
        log::Registry::undo()->debug("[UndoManager] {} record expired", to_string(record_->kind));
        record_.reset();
        return false;
    }
    return true;
}

bool Manager::isUndoAvailable() {
    std::scoped_lock lock(mutex_);
    return liveLocked();
}

void Manager::clear() {
    std::scoped_lock lock(mutex_);
    record_.reset();
}

Result<UndoReport> Manager::undo() {
    UndoRecord record;
    {
        std::scoped_lock lock(mutex_);
        if (!liveLocked()) return Error(ErrorKind::NotFound, "No operation to undo");
        record = std::move(*record_);
        record_.reset();
    }

    log::Registry::undo()->info("[UndoManager] Undoing {} of {} item(s)", to_string(record.kind),
                                record.originalPaths.size());

    try {
        switch (record.kind) {
            case UndoKind::Copy: return undoCopy(record);
            case UndoKind::Move: return undoMove(record);
            case UndoKind::Delete: return undoDelete(record);
            case UndoKind::Rename: return undoRename(record);
        }
        return Error(ErrorKind::InvalidArgument, "Unknown undo kind");
    } catch (const std::exception& e) {
        log::Registry::undo()->error("[UndoManager] Undo of {} threw: {}", to_string(record.kind), e.what());
        return Error(ErrorKind::Transport, "Undo failed", e.what());
    }
}

Result<UndoReport> Manager::undoCopy(const UndoRecord& record) {
    UndoReport report{.kind = UndoKind::Copy};
    for (const auto& p : record.resultingPaths) {
        auto path = ResourcePath::parse(p);
        if (!path) {
            tally(report, path.propagate<Unit>());
            continue;
        }
        auto client = registry_->find(path.value());
        if (!client) {
            tally(report, client.propagate<Unit>());
            continue;
        }
        tally(report, throttled(path.value(), [&] { return client.value()->remove(path.value()); }));
    }
    return report;
}

Result<UndoReport> Manager::undoMove(const UndoRecord& record) {
    UndoReport report{.kind = UndoKind::Move};
    const auto n = std::min(record.originalPaths.size(), record.resultingPaths.size());
    for (size_t i = 0; i < n; ++i) {
        auto original = ResourcePath::parse(record.originalPaths[i]);
        if (!original) {
            tally(report, original.propagate<Unit>());
            continue;
        }

        auto moved = orchestrator_->move({record.resultingPaths[i]}, original.value().parent().toString(), false,
                                         nullptr, concurrency::CancelToken::none());
        if (!moved) {
            tally(report, moved.propagate<Unit>());
            continue;
        }
        if (moved.value().succeeded == 0) {
            ++report.failed;
            for (const auto& e : moved.value().errors) report.errors.push_back(e);
            continue;
        }
        ++report.restored;
    }
    return report;
}

VoidResult Manager::restoreFromTrash(protocol::Client& client, const ResourcePath& entry, const ResourcePath& original) {
    auto target = original;
    for (unsigned int attempt = 1;; ++attempt) {
        auto present = throttled(target, [&] { return client.exists(target); });
        if (!present) return present.propagate<Unit>();
        if (!present.value()) break;
        target = original.withFilename(TrashManager::restoredName(original.filename(), attempt));
    }
    if (target != original)
        log::Registry::undo()->info("[UndoManager] {} is occupied, restoring as {}", original.toString(),
                                    target.filename());
    return throttled(entry, [&] { return client.move(entry, target, false); });
}

Result<UndoReport> Manager::undoDelete(const UndoRecord& record) {
    UndoReport report{.kind = UndoKind::Delete};

    std::vector<ResourcePath> originals;
    for (const auto& p : record.originalPaths) {
        auto parsed = ResourcePath::parse(p);
        if (!parsed) {
            tally(report, parsed.propagate<Unit>());
            continue;
        }
        originals.push_back(std::move(parsed).value());
    }

    for (const auto& t : record.resultingPaths) {
        auto trash = ResourcePath::parse(t);
        if (!trash) {
            tally(report, trash.propagate<Unit>());
            continue;
        }
        auto client = registry_->find(trash.value());
        if (!client) {
            tally(report, client.propagate<Unit>());
            continue;
        }
        auto& c = *client.value();

        auto entries = throttled(trash.value(), [&] {
            return c.listFiles(trash.value(), concurrency::CancelToken::none());
        });
        if (!entries) {
            tally(report, entries.propagate<Unit>());
            continue;
        }

        size_t left = entries.value().size();
        const auto parent = trash.value().parent();
        for (const auto& entry : entries.value()) {
            const auto entryPath = trash.value().join(entry.name);

            // original whose path ends in "/<name>" and lives beside this trash folder
            const ResourcePath* original = nullptr;
            for (const auto& o : originals)
                if (o.parent() == parent && o.filename() == entry.name) {
                    original = &o;
                    break;
                }

            if (!original) {
                log::Registry::undo()->warn("[UndoManager] {} has no recorded original, leaving it in place",
                                            entryPath.toString());
                continue;
            }

            const auto r = restoreFromTrash(c, entryPath, *original);
            tally(report, r);
            if (r) --left;
        }

        if (left == 0) {
            if (auto removed = throttled(trash.value(), [&] { return c.remove(trash.value()); }); !removed)
                log::Registry::undo()->warn("[UndoManager] Could not remove {}: {}", t, removed.describe());
        }
    }

    log::Registry::undo()->info("[UndoManager] Restored {} item(s), {} failed", report.restored, report.failed);
    return report;
}

Result<UndoReport> Manager::undoRename(const UndoRecord& record) {
    UndoReport report{.kind = UndoKind::Rename};
    for (const auto& [oldPath, newPath] : record.renamePairs) {
        auto from = ResourcePath::parse(newPath);
        auto to = ResourcePath::parse(oldPath);
        if (!from || !to) {
            tally(report, !from ? from.propagate<Unit>() : to.propagate<Unit>());
            continue;
        }
        auto client = registry_->find(from.value());
        if (!client) {
            tally(report, client.propagate<Unit>());
            continue;
        }
        auto renamed = throttled(from.value(), [&] { return client.value()->rename(from.value(), to.value().filename()); });
        tally(report, renamed ? success() : renamed.propagate<Unit>());
    }
    return report;
}
