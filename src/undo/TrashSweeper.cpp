#include "undo/TrashSweeper.hpp"
#include "undo/TrashManager.hpp"
#include "log/Registry.hpp"
#include "util/time.hpp"

using namespace mg::undo;
using namespace mg::types;
using namespace mg::log;
using mg::throttle::Priority;

TrashSweeper::TrashSweeper(std::shared_ptr<protocol::Registry> registry, std::shared_ptr<throttle::Throttle> throttle,
                           const std::chrono::milliseconds grace, const std::chrono::milliseconds interval,
                           const std::vector<std::string>& roots)
    : AsyncService("TrashSweeper"), registry_(std::move(registry)), throttle_(std::move(throttle)), grace_(grace),
      interval_(interval) {
    if (!registry_) throw std::invalid_argument("TrashSweeper requires a protocol registry");
    if (!throttle_) throw std::invalid_argument("TrashSweeper requires a throttle");
    if (interval_.count() <= 0) throw std::invalid_argument("Trash sweep interval must be positive");

    for (const auto& r : roots) {
        auto parsed = ResourcePath::parse(r);
        if (!parsed) throw std::invalid_argument("Invalid trash sweep root '" + r + "': " + parsed.describe());
        roots_.emplace(parsed.value().toString(), parsed.value());
    }
}

TrashSweeper::~TrashSweeper() {
    stop();
}

void TrashSweeper::watch(const ResourcePath& parent) {
    std::scoped_lock lock(mutex_);
    auto& dir = watched_[parent.toString()];
    dir.path = parent;
    dir.generation = ++nextGeneration_;
}

void TrashSweeper::forget(const std::string& key, const uint64_t generation) {
    std::scoped_lock lock(mutex_);
    const auto it = watched_.find(key);
    if (it != watched_.end() && it->second.generation == generation) watched_.erase(it);
}

std::vector<std::string> TrashSweeper::watched() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [k, _] : roots_) out.push_back(k);
    for (const auto& [k, _] : watched_)
        if (!roots_.contains(k)) out.push_back(k);
    return out;
}

size_t TrashSweeper::sweepOnce(const int64_t nowMs) {
    struct Target {
        ResourcePath dir;
        uint64_t generation{0};
    };

    std::map<std::string, Target> dirs;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [k, p] : roots_) dirs.emplace(k, Target{p});
        for (const auto& [k, w] : watched_) dirs.insert_or_assign(k, Target{w.path, w.generation});
    }

    size_t removed = 0;
    for (const auto& [key, target] : dirs) {
        const auto& dir = target.dir;
        auto client = registry_->find(dir);
        if (!client) {
            Registry::undo()->warn("[TrashSweeper] Skipping {}: {}", key, client.describe());
            continue;
        }
        auto& c = *client.value();

        auto entries = throttle_->withThrottle(dir.protocol, dir.resourceKey(), Priority::Normal, [&] {
            return c.listFiles(dir, concurrency::CancelToken::none());
        });
        if (!entries) {
            // parent vanished or is unreachable; try again next round unless it is gone for good
            if (entries.is(ErrorKind::NotFound)) forget(key, target.generation);
            Registry::undo()->debug("[TrashSweeper] Could not list {}: {}", key, entries.describe());
            continue;
        }

        size_t remaining = 0;
        for (const auto& entry : entries.value()) {
            if (!entry.isDirectory) continue;
            const auto ts = TrashManager::trashTimestamp(entry.name);
            if (!ts) continue;

            if (nowMs - *ts <= grace_.count()) {
                ++remaining;
                continue;
            }

            const auto trash = dir.join(entry.name);
            auto r = throttle_->withThrottle(trash.protocol, trash.resourceKey(), Priority::Normal,
                                             [&] { return c.remove(trash); });
            if (!r) {
                Registry::undo()->warn("[TrashSweeper] Could not remove {}: {}", trash.toString(), r.describe());
                ++remaining;
                continue;
            }
            ++removed;
            Registry::undo()->debug("[TrashSweeper] Removed expired {}", trash.toString());
        }

        if (remaining == 0) forget(key, target.generation);
    }

    if (removed > 0) Registry::undo()->info("[TrashSweeper] Removed {} expired trash folder(s)", removed);
    return removed;
}

void TrashSweeper::runLoop() {
    while (!interruptFlag_.load()) {
        try {
            sweepOnce(util::nowMs());
        } catch (const std::exception& e) {
            Registry::undo()->warn("[TrashSweeper] Sweep failed: {}", e.what());
        }

        if (!lazySleep(interval_)) break;
    }
}
