#include <gtest/gtest.h>
#include "transfer/Orchestrator.hpp"
#include "protocol/LocalClient.hpp"
#include "FakeClient.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <string>
#include <vector>

using namespace mg::transfer;
using namespace mg::types;
using mg::concurrency::CancelToken;
using mg::test::FakeClient;
namespace fs = std::filesystem;

class TransferTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeClient> nas = std::make_shared<FakeClient>(
        Protocol::SMB, mg::protocol::Capabilities{.nativeMove = true, .nativeCopy = true});
    std::shared_ptr<FakeClient> box = std::make_shared<FakeClient>(Protocol::SFTP);

    std::shared_ptr<mg::protocol::Registry> registry = std::make_shared<mg::protocol::Registry>();
    std::shared_ptr<mg::throttle::Throttle> throttle = std::make_shared<mg::throttle::Throttle>(mg::config::ThrottleConfig{});
    std::shared_ptr<mg::undo::TrashManager> trash;
    std::unique_ptr<Orchestrator> orchestrator;

    fs::path staging = fs::temp_directory_path() / "mediagate-transfer-test-staging";

    void SetUp() override {
        fs::remove_all(staging);
        registry->registerClient(nas);
        registry->registerClient(box);
        trash = std::make_shared<mg::undo::TrashManager>(registry, [] { return int64_t{5'000}; });
        orchestrator = std::make_unique<Orchestrator>(registry, throttle, trash,
                                                      OrchestratorOptions{.bufferSize = 8, .stagingDir = staging});

        nas->addFile("/photos/a.jpg", "aaaaaaaaaa");
        nas->addFile("/photos/b.jpg", "bbbbbbbbbbbbbbbbbbbb");
        nas->addFolder("/archive");
        box->addFolder("/incoming");
    }

    void TearDown() override { fs::remove_all(staging); }

    static bool stagingIsEmpty(const fs::path& dir) {
        return !fs::exists(dir) || fs::is_empty(dir);
    }
};

TEST_F(TransferTest, SameShareCopyUsesNativeCopy) {
    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg"}, "smb://nas/share/archive", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(res.value().succeeded, 1u);
    EXPECT_EQ(nas->calls("copy"), 1u);
    EXPECT_EQ(nas->calls("download"), 0u);
    EXPECT_TRUE(nas->hasFile("/photos/a.jpg"));
    EXPECT_EQ(nas->content("/archive/a.jpg"), "aaaaaaaaaa");

    ASSERT_TRUE(res.value().undoRecord.has_value());
    EXPECT_EQ(res.value().undoRecord->kind, mg::undo::UndoKind::Copy);
    EXPECT_EQ(res.value().undoRecord->resultingPaths,
              (std::vector<std::string>{"smb://nas/share/archive/a.jpg"}));
}

TEST_F(TransferTest, CrossProtocolCopyStreamsThroughStaging) {
    ProgressChannel progress;
    const auto res = orchestrator->copy({"smb://nas/share/photos/b.jpg"}, "sftp://box/incoming", false,
                                        &progress, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(box->content("/incoming/b.jpg"), "bbbbbbbbbbbbbbbbbbbb");
    EXPECT_EQ(nas->calls("download"), 1u);
    EXPECT_EQ(box->calls("upload"), 1u);
    EXPECT_TRUE(stagingIsEmpty(staging));

    const auto last = progress.latest();
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last->done);
    EXPECT_EQ(last->stage, Stage::Complete);
    EXPECT_EQ(last->bytesTransferred, 20u);
    EXPECT_EQ(last->path, "smb://nas/share/photos/b.jpg");
}

TEST_F(TransferTest, CrossProtocolFolderCopyRecurses) {
    nas->addFile("/photos/2024/x.jpg", "x");
    nas->addFile("/photos/2024/trip/y.jpg", "yy");

    const auto res = orchestrator->copy({"smb://nas/share/photos/2024"}, "sftp://box/incoming", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_TRUE(box->hasFolder("/incoming/2024"));
    EXPECT_TRUE(box->hasFolder("/incoming/2024/trip"));
    EXPECT_EQ(box->content("/incoming/2024/x.jpg"), "x");
    EXPECT_EQ(box->content("/incoming/2024/trip/y.jpg"), "yy");
}

TEST_F(TransferTest, UnsupportedPairFailsWholeRequestBeforeAnyWork) {
    auto writeOnly = std::make_shared<FakeClient>(Protocol::FTP, mg::protocol::Capabilities{.download = false});
    writeOnly->addFile("/drop/z.bin", "zz");
    registry->registerClient(writeOnly);

    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg", "ftp://dropbox.lan/drop/z.bin"},
                                        "sftp://box/incoming", false, nullptr, CancelToken::none());
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.error().kind, ErrorKind::UnsupportedCombination);
    EXPECT_FALSE(box->hasFile("/incoming/a.jpg"));
    EXPECT_EQ(nas->calls("download"), 0u);
}

TEST_F(TransferTest, CancelMidStreamLeavesNoPartialFile) {
    CancelToken cancel;
    nas->setChunkHook([&](const uint64_t written) {
        if (written >= 8) cancel.cancel();
    });

    const auto res = orchestrator->copy({"smb://nas/share/photos/b.jpg"}, "sftp://box/incoming", false,
                                        nullptr, cancel);
    EXPECT_TRUE(res.isCancelled());
    EXPECT_FALSE(box->hasFile("/incoming/b.jpg"));
    EXPECT_EQ(box->calls("upload"), 0u);
    EXPECT_TRUE(stagingIsEmpty(staging));
}

TEST_F(TransferTest, PreCancelledRequestDoesNothing) {
    CancelToken cancel;
    cancel.cancel();

    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg"}, "smb://nas/share/archive", false,
                                        nullptr, cancel);
    EXPECT_TRUE(res.isCancelled());
    EXPECT_FALSE(nas->hasFile("/archive/a.jpg"));
}

TEST_F(TransferTest, ExistingDestinationWithoutOverwriteIsAlreadyExists) {
    box->addFile("/incoming/a.jpg", "old");

    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg"}, "sftp://box/incoming", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.error().kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(box->content("/incoming/a.jpg"), "old");
}

TEST_F(TransferTest, OverwriteReplacesDestination) {
    box->addFile("/incoming/a.jpg", "old");

    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg"}, "sftp://box/incoming", true,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(box->content("/incoming/a.jpg"), "aaaaaaaaaa");
}

TEST_F(TransferTest, PartialFailureReportsBothOutcomes) {
    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg", "smb://nas/share/photos/missing.jpg"},
                                        "sftp://box/incoming", false, nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(res.value().succeeded, 1u);
    EXPECT_EQ(res.value().failed, 1u);
    ASSERT_EQ(res.value().errors.size(), 1u);
    EXPECT_EQ(res.value().errors[0].kind, ErrorKind::NotFound);
    EXPECT_EQ(res.value().originalPaths, (std::vector<std::string>{"smb://nas/share/photos/a.jpg"}));
}

TEST_F(TransferTest, SameShareMoveIsNative) {
    const auto res = orchestrator->move({"smb://nas/share/photos/a.jpg"}, "smb://nas/share/archive", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(nas->calls("move"), 1u);
    EXPECT_FALSE(nas->hasFile("/photos/a.jpg"));
    EXPECT_TRUE(nas->hasFile("/archive/a.jpg"));
    ASSERT_TRUE(res.value().undoRecord.has_value());
    EXPECT_EQ(res.value().undoRecord->kind, mg::undo::UndoKind::Move);
}

TEST_F(TransferTest, CrossProtocolMoveDeletesSourceAfterCopy) {
    const auto res = orchestrator->move({"smb://nas/share/photos/a.jpg"}, "sftp://box/incoming", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_FALSE(nas->hasFile("/photos/a.jpg"));
    EXPECT_EQ(box->content("/incoming/a.jpg"), "aaaaaaaaaa");
}

TEST_F(TransferTest, FailedCopyKeepsMoveSource) {
    box->injectFailure("upload", Error(ErrorKind::Transport, "connection reset"));

    const auto res = orchestrator->move({"smb://nas/share/photos/a.jpg"}, "sftp://box/incoming", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.error().kind, ErrorKind::Transport);
    EXPECT_TRUE(nas->hasFile("/photos/a.jpg"));
    EXPECT_EQ(nas->calls("remove"), 0u);
}

TEST_F(TransferTest, SourceRemovalFailureIsRecordedButCopyCounts) {
    nas->injectFailure("remove", Error(ErrorKind::Transport, "share is read-only"));

    const auto res = orchestrator->move({"smb://nas/share/photos/a.jpg"}, "sftp://box/incoming", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(res.value().succeeded, 1u);
    ASSERT_EQ(res.value().errors.size(), 1u);
    EXPECT_TRUE(nas->hasFile("/photos/a.jpg"));
    EXPECT_TRUE(box->hasFile("/incoming/a.jpg"));
}

TEST_F(TransferTest, FolderIntoItselfIsRejected) {
    nas->addFolder("/photos/sub");

    const auto res = orchestrator->move({"smb://nas/share/photos"}, "smb://nas/share/photos/sub", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(nas->hasFile("/photos/a.jpg"));
}

TEST_F(TransferTest, DeleteMovesIntoSiblingTrashFolder) {
    const auto res = orchestrator->remove({"smb://nas/share/photos/a.jpg", "smb://nas/share/photos/b.jpg"}, true);
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(res.value().succeeded, 2u);
    EXPECT_EQ(res.value().resultingPaths, (std::vector<std::string>{"smb://nas/share/photos/.trash_5000"}));
    EXPECT_TRUE(nas->hasFile("/photos/.trash_5000/a.jpg"));
    EXPECT_TRUE(nas->hasFile("/photos/.trash_5000/b.jpg"));
    EXPECT_FALSE(nas->hasFile("/photos/a.jpg"));

    ASSERT_TRUE(res.value().undoRecord.has_value());
    EXPECT_EQ(res.value().undoRecord->kind, mg::undo::UndoKind::Delete);
}

TEST_F(TransferTest, PermanentDeleteHasNoUndo) {
    const auto res = orchestrator->remove({"smb://nas/share/photos/a.jpg"}, false);
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_FALSE(nas->hasFile("/photos/a.jpg"));
    EXPECT_FALSE(res.value().undoRecord.has_value());
    EXPECT_EQ(nas->childrenOf("/photos"), (std::vector<std::string>{"b.jpg"}));
}

TEST_F(TransferTest, RenameRecordsPair) {
    const auto res = orchestrator->rename("smb://nas/share/photos/a.jpg", "beach.jpg");
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_TRUE(nas->hasFile("/photos/beach.jpg"));

    ASSERT_TRUE(res.value().undoRecord.has_value());
    ASSERT_EQ(res.value().undoRecord->renamePairs.size(), 1u);
    EXPECT_EQ(res.value().undoRecord->renamePairs[0].first, "smb://nas/share/photos/a.jpg");
    EXPECT_EQ(res.value().undoRecord->renamePairs[0].second, "smb://nas/share/photos/beach.jpg");
}

TEST_F(TransferTest, ExecuteDispatchesOperations) {
    const Operation op = Copy{.sources = {"smb://nas/share/photos/a.jpg"}, .destinationFolder = "sftp://box/incoming"};
    EXPECT_FALSE(describe(op).empty());

    const auto res = orchestrator->execute(op, nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_TRUE(box->hasFile("/incoming/a.jpg"));
}

TEST_F(TransferTest, CancelledBatchKeepsUndoForCompletedFiles) {
    CancelToken cancel;
    int chunks = 0;
    // a.jpg takes three 4-byte chunks; the fourth belongs to b.jpg
    nas->setChunkHook([&](uint64_t) {
        if (++chunks == 4) cancel.cancel();
    });

    TransferReport partial;
    const auto res = orchestrator->copy({"smb://nas/share/photos/a.jpg", "smb://nas/share/photos/b.jpg"},
                                        "sftp://box/incoming", false, nullptr, cancel, &partial);
    EXPECT_TRUE(res.isCancelled());
    EXPECT_EQ(box->content("/incoming/a.jpg"), "aaaaaaaaaa");
    EXPECT_FALSE(box->hasFile("/incoming/b.jpg"));

    EXPECT_EQ(partial.succeeded, 1u);
    ASSERT_TRUE(partial.undoRecord.has_value());
    EXPECT_EQ(partial.undoRecord->kind, mg::undo::UndoKind::Copy);
    EXPECT_EQ(partial.undoRecord->resultingPaths, (std::vector<std::string>{"sftp://box/incoming/a.jpg"}));
}

TEST_F(TransferTest, CancelledBeforeAnyFileLeavesNoUndo) {
    CancelToken cancel;
    cancel.cancel();

    TransferReport partial;
    const auto res = orchestrator->move({"smb://nas/share/photos/a.jpg"}, "sftp://box/incoming", false,
                                        nullptr, cancel, &partial);
    EXPECT_TRUE(res.isCancelled());
    EXPECT_EQ(partial.succeeded, 0u);
    EXPECT_FALSE(partial.undoRecord.has_value());
}

TEST_F(TransferTest, UnavailableNativeMoveFallsBackToCopyAndDelete) {
    nas->injectFailure("move", Error(ErrorKind::UnsupportedCombination, "crosses filesystems"));

    const auto res = orchestrator->move({"smb://nas/share/photos/a.jpg"}, "smb://nas/share/archive", false,
                                        nullptr, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(res.value().succeeded, 1u);
    EXPECT_EQ(nas->calls("copy"), 1u);
    EXPECT_FALSE(nas->hasFile("/photos/a.jpg"));
    EXPECT_EQ(nas->content("/archive/a.jpg"), "aaaaaaaaaa");
}

class LocalTransferTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / "mediagate-local-transfer-test";
    fs::path staging = root / "staging";

    std::shared_ptr<mg::protocol::Registry> registry = std::make_shared<mg::protocol::Registry>();
    std::shared_ptr<mg::throttle::Throttle> throttle = std::make_shared<mg::throttle::Throttle>(mg::config::ThrottleConfig{});
    std::unique_ptr<Orchestrator> orchestrator;

    static constexpr size_t kSize = 4 * 1024 * 1024;

    void SetUp() override {
        fs::remove_all(root);
        fs::create_directories(root / "src");
        fs::create_directories(root / "dst");
        {
            std::ofstream out(root / "src" / "big.bin", std::ios::binary);
            const std::string block(64 * 1024, 'x');
            for (size_t i = 0; i < kSize / block.size(); ++i) out << block;
        }

        registry->registerClient(std::make_shared<mg::protocol::LocalClient>(4));
        auto trash = std::make_shared<mg::undo::TrashManager>(registry);
        orchestrator = std::make_unique<Orchestrator>(registry, throttle, trash,
                                                      OrchestratorOptions{.bufferSize = 4, .stagingDir = staging});
    }

    void TearDown() override { fs::remove_all(root); }

    [[nodiscard]] std::string local(const std::string& rel) const { return (root / rel).string(); }
};

TEST_F(LocalTransferTest, CopyReportsBytesAndCompletes) {
    {
        std::ofstream out(root / "src" / "small.bin", std::ios::binary);
        out << std::string(1000, 's');
    }

    ProgressChannel progress;
    const auto res = orchestrator->copy({local("src/small.bin")}, local("dst"), false, &progress, CancelToken::none());
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(fs::file_size(root / "dst" / "small.bin"), 1000u);
    EXPECT_TRUE(fs::exists(root / "src" / "small.bin"));

    const auto last = progress.latest();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->stage, Stage::Complete);
    EXPECT_EQ(last->bytesTransferred, 1000u);
}

TEST_F(LocalTransferTest, CancelDuringCopyLeavesNoFinishedLookingFile) {
    CancelToken cancel;
    ProgressChannel progress;
    std::atomic<bool> sawBytes{false};

    std::thread canceller([&] {
        for (;;) {
            const auto last = progress.latest();
            if (last && last->bytesTransferred > 0) {
                sawBytes = last->totalBytes == static_cast<int64_t>(kSize);
                cancel.cancel();
                return;
            }
            std::this_thread::yield();
        }
    });

    const auto res = orchestrator->copy({local("src/big.bin")}, local("dst"), false, &progress, cancel);
    canceller.join();

    EXPECT_TRUE(res.isCancelled()) << res.describe();
    EXPECT_TRUE(sawBytes.load());
    EXPECT_FALSE(fs::exists(root / "dst" / "big.bin"));
    EXPECT_FALSE(fs::exists(root / "dst" / "big.bin.mgpart"));
    EXPECT_TRUE(!fs::exists(staging) || fs::is_empty(staging));
}
