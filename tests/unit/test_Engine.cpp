#include <gtest/gtest.h>
#include "engine/Engine.hpp"
#include "cloud/OAuthSession.hpp"
#include "cloud/RestCloudClient.hpp"
#include "cloud/TokenStore.hpp"
#include "util/time.hpp"
#include "FakeClient.hpp"
#include "FakeCloudClient.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace mg::engine;
using namespace mg::types;
using namespace std::chrono_literals;
using mg::test::FakeClient;
using mg::test::FakeCloudClient;
namespace fs = std::filesystem;

class EngineTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / "mediagate-engine-test";
    std::shared_ptr<FakeClient> nas = std::make_shared<FakeClient>(
        Protocol::SMB, mg::protocol::Capabilities{.nativeMove = true, .nativeCopy = true});
    std::unique_ptr<Engine> engine;

    void SetUp() override {
        fs::remove_all(root);

        mg::config::Config cfg;
        cfg.workers.threads = 12;
        cfg.throttle.smb = 4;
        cfg.cache.directory = root / "cache";
        cfg.transfer.staging_directory = root / "staging";
        cfg.credentials.store_path.clear();

        engine = std::make_unique<Engine>(cfg, EngineOptions{.registerDefaultClients = false, .startSweeper = false});
        engine->registerClient(nas);

        nas->addFile("/photos/a.jpg", "jpeg-bytes");
        nas->addFile("/photos/b.jpg", "more-bytes");
    }

    void TearDown() override {
        engine->shutdown();
        fs::remove_all(root);
    }
};

TEST_F(EngineTest, ConcurrentListingsRespectProtocolCeiling) {
    nas->setListDelay(30ms);

    std::vector<std::future<Result<std::vector<FileInfo>>>> pending;
    for (int i = 0; i < 10; ++i) pending.push_back(engine->list("smb://nas/share/photos"));

    for (auto& f : pending) {
        const auto res = f.get();
        ASSERT_TRUE(res.ok()) << res.describe();
        EXPECT_EQ(res.value().size(), 2u);
    }
    EXPECT_LE(nas->maxInFlight(), 4);
    EXPECT_EQ(nas->calls("list"), 10u);
}

TEST_F(EngineTest, ReadIsServedFromCacheWhileUnchanged) {
    const auto first = engine->read("smb://nas/share/photos/a.jpg").get();
    ASSERT_TRUE(first.ok()) << first.describe();
    EXPECT_EQ(std::string(first.value().begin(), first.value().end()), "jpeg-bytes");

    const auto second = engine->read("smb://nas/share/photos/a.jpg").get();
    ASSERT_TRUE(second.ok()) << second.describe();
    EXPECT_EQ(second.value(), first.value());
    EXPECT_EQ(nas->calls("download"), 1u);
    EXPECT_EQ(engine->cacheStats().hits, 1u);

    // a newer modified time misses the old entry
    nas->addFile("/photos/a.jpg", "edited", 5'000);
    const auto third = engine->read("smb://nas/share/photos/a.jpg").get();
    ASSERT_TRUE(third.ok()) << third.describe();
    EXPECT_EQ(std::string(third.value().begin(), third.value().end()), "edited");
    EXPECT_EQ(nas->calls("download"), 2u);
}

TEST_F(EngineTest, ReadingAFolderIsInvalid) {
    const auto res = engine->read("smb://nas/share/photos").get();
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(EngineTest, ErrorsComeBackAsResults) {
    const auto bad = engine->list("gopher://nowhere").get();
    ASSERT_TRUE(bad.isError());
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidArgument);

    const auto unregistered = engine->list("ftp://host/pub").get();
    ASSERT_TRUE(unregistered.isError());
    EXPECT_EQ(unregistered.error().kind, ErrorKind::Configuration);

    const auto missing = engine->metadata("smb://nas/share/nope.jpg").get();
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(EngineTest, WriteAndCreateFolder) {
    ASSERT_TRUE(engine->createFolder("smb://nas/share/docs").get().ok());
    const auto written = engine->write("smb://nas/share/docs/n.txt", {'h', 'i'}, false).get();
    ASSERT_TRUE(written.ok()) << written.describe();
    EXPECT_EQ(written.value(), 2u);
    EXPECT_EQ(nas->content("/docs/n.txt"), "hi");

    const auto again = engine->write("smb://nas/share/docs/n.txt", {'x'}, false).get();
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().kind, ErrorKind::AlreadyExists);
}

TEST_F(EngineTest, DeleteThenUndoRestores) {
    EXPECT_FALSE(engine->isUndoAvailable());

    const auto removed = engine->remove({"smb://nas/share/photos/a.jpg", "smb://nas/share/photos/b.jpg"}).get();
    ASSERT_TRUE(removed.ok()) << removed.describe();
    EXPECT_FALSE(nas->hasFile("/photos/a.jpg"));
    EXPECT_TRUE(engine->isUndoAvailable());

    const auto undone = engine->undo().get();
    ASSERT_TRUE(undone.ok()) << undone.describe();
    EXPECT_EQ(undone.value().restored, 2u);
    EXPECT_TRUE(nas->hasFile("/photos/a.jpg"));
    EXPECT_TRUE(nas->hasFile("/photos/b.jpg"));
    EXPECT_FALSE(engine->isUndoAvailable());
}

TEST_F(EngineTest, DeletedFilesAreDroppedFromCache) {
    ASSERT_TRUE(engine->read("smb://nas/share/photos/a.jpg").get().ok());
    ASSERT_TRUE(engine->remove({"smb://nas/share/photos/a.jpg"}, false).get().ok());

    nas->addFile("/photos/a.jpg", "recreated");
    const auto res = engine->read("smb://nas/share/photos/a.jpg").get();
    ASSERT_TRUE(res.ok()) << res.describe();
    EXPECT_EQ(std::string(res.value().begin(), res.value().end()), "recreated");
}

TEST_F(EngineTest, TrashedParentIsWatchedBySweeper) {
    ASSERT_TRUE(engine->remove({"smb://nas/share/photos/a.jpg"}).get().ok());
    EXPECT_EQ(engine->trashSweeper().watched(), (std::vector<std::string>{"smb://nas/share/photos"}));
}

TEST_F(EngineTest, SignedOutCloudProviderRequiresSignIn) {
    auto drive = std::make_shared<FakeCloudClient>("drive", false);
    drive->storage().addFile("/docs/x.txt", "x");
    engine->registerCloudClient(drive);

    const auto listed = engine->list("cloud://drive/docs").get();
    ASSERT_TRUE(listed.isError());
    EXPECT_EQ(listed.error().kind, ErrorKind::NotAuthenticated);
    EXPECT_EQ(drive->requests(), 0);

    const auto copied = engine->copy({"smb://nas/share/photos/a.jpg"}, "cloud://drive/docs", false).get();
    ASSERT_TRUE(copied.isError());
    EXPECT_EQ(copied.error().kind, ErrorKind::NotAuthenticated);
    EXPECT_FALSE(drive->storage().hasFile("/docs/a.jpg"));
}

TEST_F(EngineTest, ExpiredCloudTokenIsRenewedSilently) {
    auto drive = std::make_shared<FakeCloudClient>("drive");
    drive->storage().addFile("/docs/x.txt", "x");
    drive->expireToken();
    engine->registerCloudClient(drive);

    const auto listed = engine->list("cloud://drive/docs").get();
    ASSERT_TRUE(listed.ok()) << listed.describe();
    EXPECT_EQ(listed.value().size(), 1u);
    EXPECT_EQ(drive->authenticateCalls(), 1);
}

TEST_F(EngineTest, CopyToCloudStreamsAndCanBeUndone) {
    auto drive = std::make_shared<FakeCloudClient>("drive");
    drive->storage().addFolder("/docs");
    engine->registerCloudClient(drive);

    const auto copied = engine->copy({"smb://nas/share/photos/a.jpg"}, "cloud://drive/docs", false).get();
    ASSERT_TRUE(copied.ok()) << copied.describe();
    EXPECT_EQ(drive->storage().content("/docs/a.jpg"), "jpeg-bytes");

    const auto undone = engine->undo().get();
    ASSERT_TRUE(undone.ok()) << undone.describe();
    EXPECT_FALSE(drive->storage().hasFile("/docs/a.jpg"));
}

TEST_F(EngineTest, ExpiredTokenDuringCopyIsRenewedOnce) {
    auto drive = std::make_shared<FakeCloudClient>("drive");
    drive->storage().addFolder("/docs");
    drive->expireToken();
    engine->registerCloudClient(drive);

    const auto copied = engine->copy({"smb://nas/share/photos/a.jpg"}, "cloud://drive/docs", false).get();
    ASSERT_TRUE(copied.ok()) << copied.describe();
    EXPECT_EQ(copied.value().succeeded, 1u);
    EXPECT_EQ(drive->storage().content("/docs/a.jpg"), "jpeg-bytes");
    EXPECT_EQ(drive->authenticateCalls(), 1);
}

TEST_F(EngineTest, RejectedCloudRequestIsSentTwiceAndRefreshedOnce) {
    mg::config::CloudProviderConfig provider{
        .name = "drive",
        .client_id = "app",
        .client_secret = "",
        .token_endpoint = "https://auth.example.test/oauth2/token",
        .api_base = "https://api.example.test/2",
        .content_base = "https://content.example.test/2",
        .token_store = {}
    };

    std::atomic<int> refreshes{0};
    auto session = std::make_shared<mg::cloud::OAuthSession>(
        provider, std::make_shared<mg::cloud::TokenStore>(), [&](const std::string&, const std::string&) {
            ++refreshes;
            return mg::cloud::OAuthSession::TokenResponse{200, R"({"access_token":"fresh","expires_in":3600})", ""};
        });
    session->setTokens({.accessToken = "good", .refreshToken = "r1", .expiresAt = mg::util::nowMs() + 3'600'000});

    std::atomic<int> sent{0};
    engine->registerCloudClient(std::make_shared<mg::cloud::RestCloudClient>(
        provider, session, [&](const mg::cloud::HttpRequest&) {
            ++sent;
            mg::cloud::HttpResult res;
            res.status = 401;
            return res;
        }));

    const auto listed = engine->list("cloud://drive/docs").get();
    ASSERT_TRUE(listed.isError());
    EXPECT_EQ(listed.error().kind, ErrorKind::AuthExpired);
    EXPECT_EQ(sent.load(), 2);
    EXPECT_EQ(refreshes.load(), 1);
}

TEST_F(EngineTest, CancelledCopyKeepsUndoForFinishedFiles) {
    nas->addFolder("/archive");
    mg::concurrency::CancelToken cancel;
    nas->setOpHook([&](const std::string& op) {
        if (op == "copy") cancel.cancel();
    });

    const auto copied = engine->copy({"smb://nas/share/photos/a.jpg", "smb://nas/share/photos/b.jpg"},
                                     "smb://nas/share/archive", false, nullptr, cancel).get();
    nas->setOpHook({});
    ASSERT_TRUE(copied.isCancelled());
    EXPECT_TRUE(nas->hasFile("/archive/a.jpg"));
    EXPECT_FALSE(nas->hasFile("/archive/b.jpg"));
    ASSERT_TRUE(engine->isUndoAvailable());

    const auto undone = engine->undo().get();
    ASSERT_TRUE(undone.ok()) << undone.describe();
    EXPECT_EQ(undone.value().restored, 1u);
    EXPECT_FALSE(nas->hasFile("/archive/a.jpg"));
    EXPECT_TRUE(nas->hasFile("/photos/a.jpg"));
}
