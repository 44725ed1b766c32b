#pragma once

#include "services/AsyncService.hpp"
#include "protocol/Registry.hpp"
#include "throttle/Throttle.hpp"
#include "types/ResourcePath.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mg::undo {

// Removes `.trash_<ts>` folders older than the grace period, whether or not they were undone.
class TrashSweeper final : public services::AsyncService {
public:
    TrashSweeper(std::shared_ptr<protocol::Registry> registry, std::shared_ptr<throttle::Throttle> throttle,
                 std::chrono::milliseconds grace, std::chrono::milliseconds interval,
                 const std::vector<std::string>& roots = {});
    ~TrashSweeper() override;

    // Parent directory that received a trash folder.
    void watch(const types::ResourcePath& parent);

    [[nodiscard]] std::vector<std::string> watched() const;

    // Returns the number of trash folders removed.
    size_t sweepOnce(int64_t nowMs);

protected:
    void runLoop() override;

private:
    struct WatchedDir {
        types::ResourcePath path;
        uint64_t generation{0};   // bumped by every watch()
    };

    std::shared_ptr<protocol::Registry> registry_;
    std::shared_ptr<throttle::Throttle> throttle_;
    std::chrono::milliseconds grace_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    uint64_t nextGeneration_{0};
    std::map<std::string, types::ResourcePath> roots_;   // configured, kept forever
    std::map<std::string, WatchedDir> watched_;          // dropped once no trash is left

    // Drops `key` unless it was watched again after `generation` was read.
    void forget(const std::string& key, uint64_t generation);
};

}
