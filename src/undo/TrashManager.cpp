#include "undo/TrashManager.hpp"
#include "undo/UndoRecord.hpp"
#include "log/Registry.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <charconv>
#include <map>

using namespace mg::undo;
using namespace mg::types;

std::string mg::undo::to_string(const UndoKind kind) {
    switch (kind) {
        case UndoKind::Copy: return "copy";
        case UndoKind::Move: return "move";
        case UndoKind::Delete: return "delete";
        case UndoKind::Rename: return "rename";
    }
    return "unknown";
}

TrashManager::TrashManager(std::shared_ptr<protocol::Registry> registry, NowMsFn nowMs)
    : registry_(std::move(registry)), nowMs_(std::move(nowMs)) {
    if (!registry_) throw std::invalid_argument("TrashManager requires a protocol registry");
    if (!nowMs_) nowMs_ = util::nowMs;
}

void TrashManager::setFolderObserver(FolderObserver observer) {
    std::scoped_lock lock(mutex_);
    observer_ = std::move(observer);
}

bool TrashManager::isTrashFolderName(const std::string& name) {
    return trashTimestamp(name).has_value();
}

std::optional<int64_t> TrashManager::trashTimestamp(const std::string& name) {
    const std::string_view prefix = kTrashPrefix;
    if (!name.starts_with(prefix) || name.size() == prefix.size()) return std::nullopt;

    int64_t ts = 0;
    const auto* first = name.data() + prefix.size();
    const auto* last = name.data() + name.size();
    const auto [ptr, ec] = std::from_chars(first, last, ts);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return ts;
}

std::string TrashManager::restoredName(const std::string& name, const unsigned int attempt) {
    const auto dot = name.rfind('.');
    const bool hasExt = dot != std::string::npos && dot != 0;
    const auto stem = hasExt ? name.substr(0, dot) : name;
    const auto ext = hasExt ? name.substr(dot) : std::string{};
    return stem + "_restored" + (attempt > 1 ? "_" + std::to_string(attempt) : std::string{}) + ext;
}

int64_t TrashManager::nextTimestamp() {
    std::scoped_lock lock(mutex_);
    lastIssued_ = std::max(nowMs_(), lastIssued_ + 1);
    return lastIssued_;
}

Result<TrashResult> TrashManager::moveToTrash(const std::vector<ResourcePath>& paths,
                                              const concurrency::CancelToken& cancel) {
    // parent -> files, keyed by the parent's full path so order is stable
    std::map<std::string, std::pair<ResourcePath, std::vector<ResourcePath>>> groups;
    for (const auto& p : paths) {
        if (p.isRoot()) return Error(ErrorKind::InvalidArgument, "Cannot trash a root: " + p.toString());
        auto& g = groups[p.parent().toString()];
        g.first = p.parent();
        g.second.push_back(p);
    }

    TrashResult result;
    for (const auto& [key, group] : groups) {
        if (cancel.isCancelled()) return Cancelled{};

        const auto& [parent, files] = group;
        auto client = registry_->find(parent);
        if (!client) return client.propagate<TrashResult>();
        auto& c = *client.value();

        // unique against other processes too, not just this one
        ResourcePath trash;
        while (true) {
            trash = parent.join(kTrashPrefix + std::to_string(nextTimestamp()));
            auto present = c.exists(trash);
            if (!present) return present.propagate<TrashResult>();
            if (!present.value()) break;
        }

        if (auto r = c.createFolder(trash); !r) {
            result.errors.push_back(r.isError() ? r.error() : Error(ErrorKind::Cancelled, "Cancelled"));
            continue;
        }

        size_t moved = 0;
        for (const auto& file : files) {
            if (cancel.isCancelled()) break;
            if (auto r = c.move(file, trash.join(file.filename()), false); !r) {
                log::Registry::undo()->warn("[TrashManager] Could not trash {}: {}", file.toString(), r.describe());
                if (r.isError()) result.errors.push_back(r.error());
                continue;
            }
            result.trashedOriginals.push_back(file.toString());
            ++moved;
        }

        if (moved == 0) {
            if (auto r = c.remove(trash); !r)
                log::Registry::undo()->warn("[TrashManager] Could not remove empty {}: {}", trash.toString(), r.describe());
            if (cancel.isCancelled()) return Cancelled{};
            continue;
        }

        result.trashFolders.push_back(trash.toString());

        FolderObserver observer;
        {
            std::scoped_lock lock(mutex_);
            observer = observer_;
        }
        if (observer) observer(parent);

        if (cancel.isCancelled()) break;
    }

    return result;
}
