#pragma once

#include "concurrency/CancelToken.hpp"
#include "protocol/Registry.hpp"
#include "types/Result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mg::undo {

struct TrashResult {
    std::vector<std::string> trashFolders;
    std::vector<std::string> trashedOriginals;
    std::vector<types::Error> errors;
};

// Soft delete: files move into a `.trash_<epoch-ms>` folder created next to them.
class TrashManager {
public:
    static constexpr auto kTrashPrefix = ".trash_";

    using NowMsFn = std::function<int64_t()>;
    using FolderObserver = std::function<void(const types::ResourcePath& parent)>;

    explicit TrashManager(std::shared_ptr<protocol::Registry> registry, NowMsFn nowMs = {});

    types::Result<TrashResult> moveToTrash(const std::vector<types::ResourcePath>& paths,
                                           const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    // Called once per parent directory that received a trash folder.
    void setFolderObserver(FolderObserver observer);

    static bool isTrashFolderName(const std::string& name);
    static std::optional<int64_t> trashTimestamp(const std::string& name);

    // "a.jpg" -> "a_restored.jpg", "a_restored_2.jpg", ...
    static std::string restoredName(const std::string& name, unsigned int attempt);

private:
    std::shared_ptr<protocol::Registry> registry_;
    NowMsFn nowMs_;

    std::mutex mutex_;
    int64_t lastIssued_{0};
    FolderObserver observer_;

    int64_t nextTimestamp();
};

}
