#pragma once

#include "transfer/Operation.hpp"
#include "transfer/Strategy.hpp"
#include "protocol/Registry.hpp"
#include "throttle/Throttle.hpp"
#include "undo/TrashManager.hpp"
#include "undo/UndoRecord.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mg::transfer {

struct TransferReport {
    size_t succeeded{0};
    size_t failed{0};
    std::vector<std::string> originalPaths{};     // sources that succeeded, in order
    std::vector<std::string> resultingPaths{};    // where they ended up
    std::vector<types::Error> errors{};
    std::optional<undo::UndoRecord> undoRecord{};
};

struct OrchestratorOptions {
    size_t bufferSize = config::DEFAULT_BUFFER_SIZE;
    std::filesystem::path stagingDir = std::filesystem::temp_directory_path() / "mediagate-staging";
    throttle::Priority priority = throttle::Priority::Normal;
};

class Orchestrator {
public:
    Orchestrator(std::shared_ptr<protocol::Registry> registry, std::shared_ptr<throttle::Throttle> throttle,
                 std::shared_ptr<undo::TrashManager> trash, OrchestratorOptions options = {});

    // Tried in registration order; the same-protocol and streaming strategies are registered first.
    void addStrategy(std::unique_ptr<Strategy> strategy);

    [[nodiscard]] Strategy* strategyFor(const types::ResourcePath& src, const protocol::Client& srcClient,
                                        const types::ResourcePath& dst, const protocol::Client& dstClient) const;

    // When a Copy or Move is cancelled, `partial` (if given) receives what completed before the
    // cancellation, including its undo record.
    types::Result<TransferReport> execute(const Operation& op, ProgressChannel* progress,
                                          const concurrency::CancelToken& cancel, TransferReport* partial = nullptr);

    types::Result<TransferReport> copy(const std::vector<std::string>& sources, const std::string& destinationFolder,
                                       bool overwrite, ProgressChannel* progress,
                                       const concurrency::CancelToken& cancel, TransferReport* partial = nullptr);

    types::Result<TransferReport> move(const std::vector<std::string>& sources, const std::string& destinationFolder,
                                       bool overwrite, ProgressChannel* progress,
                                       const concurrency::CancelToken& cancel, TransferReport* partial = nullptr);

    types::Result<TransferReport> rename(const std::string& path, const std::string& newName,
                                         const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

    types::Result<TransferReport> remove(const std::vector<std::string>& paths, bool useTrash,
                                         const concurrency::CancelToken& cancel = concurrency::CancelToken::none());

private:
    enum class Mode { Copy, Move };

    std::shared_ptr<protocol::Registry> registry_;
    std::shared_ptr<throttle::Throttle> throttle_;
    std::shared_ptr<undo::TrashManager> trash_;
    OrchestratorOptions options_;
    std::vector<std::unique_ptr<Strategy>> strategies_;

    types::Result<TransferReport> transfer(Mode mode, const std::vector<std::string>& sources,
                                           const std::string& destinationFolder, bool overwrite,
                                           ProgressChannel* progress, const concurrency::CancelToken& cancel,
                                           TransferReport* partial);

    static types::Result<std::vector<types::ResourcePath>> parseAll(const std::vector<std::string>& paths);
    static void attachUndo(TransferReport& report, undo::UndoKind kind);
    static types::Result<TransferReport> finish(TransferReport report, std::optional<undo::UndoKind> undoKind);
};

}
