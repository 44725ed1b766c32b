#include <gtest/gtest.h>
#include "credentials/Resolver.hpp"
#include "credentials/Store.hpp"
#include "crypto/encrypt.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace mg::credentials;
using namespace mg::types;

class CredentialsTest : public ::testing::Test {
protected:
    std::shared_ptr<Store> store = std::make_shared<Store>();
    Resolver resolver{store};

    static NetworkCredentials smb(const std::string& server, const std::string& share, const std::string& user) {
        return {.type = Protocol::SMB, .server = server, .username = user, .password = "pw", .share = share};
    }
};

TEST_F(CredentialsTest, RejectsNonNetworkPaths) {
    EXPECT_TRUE(resolver.resolve("/photos/a.jpg").is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(resolver.resolve("cloud://dropbox/a").is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(resolver.resolve("http://nas/share").is(ErrorKind::InvalidArgument));
}

TEST_F(CredentialsTest, MissingCredentialsAreConfigurationErrors) {
    const auto r = resolver.resolve("smb://nas/photos");
    ASSERT_TRUE(r.is(ErrorKind::Configuration));
    EXPECT_FALSE(r.error().isTransient());
}

TEST_F(CredentialsTest, ExactShareWinsOverHost) {
    store->upsert(smb("nas", "music", "music-user"));
    store->upsert({.type = Protocol::SMB, .server = "nas", .port = 1445, .username = "other", .share = "photos"});

    auto r = resolver.resolve("smb://nas/photos/2024");
    ASSERT_TRUE(r.ok()) << r.describe();
    EXPECT_EQ(r.value().username, "other");

    r = resolver.resolve("smb://nas/videos");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().username, "music-user");
}

TEST_F(CredentialsTest, HostLookupPrefersSameProtocol) {
    store->upsert(smb("box", "data", "smb-user"));
    store->upsert({.type = Protocol::SFTP, .server = "box", .username = "sftp-user", .privateKey = "/keys/id_ed25519"});

    auto r = resolver.resolve("sftp://box/home");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().username, "sftp-user");
    EXPECT_EQ(r.value().port, 22);
    EXPECT_EQ(r.value().privateKey, "/keys/id_ed25519");
}

TEST_F(CredentialsTest, UpsertReplacesSameEndpointAndBumpsGeneration) {
    const auto gen0 = store->generation();
    const auto id = store->upsert(smb("nas", "photos", "alice"));
    const auto id2 = store->upsert(smb("nas", "photos", "bob"));

    EXPECT_EQ(id, id2);
    ASSERT_EQ(store->all().size(), 1u);
    EXPECT_EQ(store->byId(id)->username, "bob");
    EXPECT_GT(store->generation(), gen0 + 1);

    EXPECT_TRUE(store->remove(Protocol::SMB, "nas", 445));
    EXPECT_FALSE(store->remove(Protocol::SMB, "nas", 445));
    EXPECT_TRUE(store->all().empty());
}

TEST_F(CredentialsTest, PersistsEncrypted) {
    const auto dir = fs::temp_directory_path() / "mediagate-creds-test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const auto key = mg::crypto::loadOrCreateKey(dir / "store.key");

    {
        Store s(dir / "store.bin", key);
        s.upsert(smb("nas", "photos", "alice"));
    }

    const auto raw = mg::crypto::read_file(dir / "store.bin");
    const std::string asText(raw.begin(), raw.end());
    EXPECT_EQ(asText.find("alice"), std::string::npos);

    Store reloaded(dir / "store.bin", key);
    reloaded.load();
    ASSERT_EQ(reloaded.all().size(), 1u);
    EXPECT_EQ(reloaded.all().front().username, "alice");

    Store wrongKey(dir / "store.bin", mg::crypto::generateKey());
    EXPECT_THROW(wrongKey.load(), std::runtime_error);

    fs::remove_all(dir);
}
