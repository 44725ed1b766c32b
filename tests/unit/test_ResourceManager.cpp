#include <gtest/gtest.h>
#include "engine/ResourceManager.hpp"
#include "throttle/Throttle.hpp"
#include "cache/ContentCache.hpp"
#include "credentials/Store.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>

using namespace mg::engine;
using namespace mg::types;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class ResourceManagerTest : public ::testing::Test {
protected:
    fs::path cacheDir = fs::temp_directory_path() / "mediagate-resources-test-cache";

    std::shared_ptr<mg::throttle::Throttle> throttle = std::make_shared<mg::throttle::Throttle>(mg::config::ThrottleConfig{});
    std::shared_ptr<mg::cache::ContentCache> cache;
    std::shared_ptr<mg::credentials::Store> store = std::make_shared<mg::credentials::Store>();
    std::unique_ptr<ResourceManager> resources;

    const std::string nasKey = "smb://nas:445/media";

    void SetUp() override {
        fs::remove_all(cacheDir);
        cache = std::make_shared<mg::cache::ContentCache>(cacheDir, 1'000'000, 3600s);
        resources = std::make_unique<ResourceManager>(throttle, cache, store);
    }

    void TearDown() override { fs::remove_all(cacheDir); }

    static Resource nas(const std::string& id = "nas") {
        return {.id = id, .name = "NAS", .root = "smb://nas/media"};
    }
};

TEST_F(ResourceManagerTest, AddNormalisesRootAndProtocol) {
    Resource r{.name = "Box", .root = "sftp://box:22/home/me/../me/"};
    const auto id = resources->add(r);
    EXPECT_FALSE(id.empty());

    const auto stored = resources->find(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->protocol, Protocol::SFTP);
    EXPECT_EQ(stored->root, "sftp://box/home/me");
    EXPECT_EQ(stored->name, "Box");
}

TEST_F(ResourceManagerTest, RejectsDuplicatesAndBadRoots) {
    resources->add(nas());
    EXPECT_THROW(resources->add(nas()), std::invalid_argument);
    EXPECT_THROW(resources->add({.id = "bad", .root = "gopher://x"}), std::invalid_argument);
    EXPECT_EQ(resources->all().size(), 1u);
}

TEST_F(ResourceManagerTest, FindByPathPicksLongestRoot) {
    resources->add(nas());
    resources->add({.id = "nas-photos", .name = "Photos", .root = "smb://nas/media/photos"});

    const auto hit = resources->findByPath(ResourcePath::parse("smb://nas/media/photos/2024/a.jpg").value());
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->id, "nas-photos");

    const auto other = resources->findByPath(ResourcePath::parse("smb://nas/media/photosets/x").value());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->id, "nas");

    EXPECT_FALSE(resources->findByPath(ResourcePath::parse("smb://other/media").value()).has_value());
}

TEST_F(ResourceManagerTest, SpeedTestOverridesConcurrencyForEndpointOnly) {
    resources->add(nas());
    EXPECT_EQ(throttle->ceilingFor(Protocol::SMB, nasKey), 2u);

    resources->applySpeedTest("nas", {.concurrency = 6, .bufferSize = 1 << 20});
    EXPECT_EQ(throttle->ceilingFor(Protocol::SMB, nasKey), 6u);
    EXPECT_EQ(throttle->recommendedBufferSize(nasKey), size_t{1 << 20});
    EXPECT_EQ(throttle->ceilingFor(Protocol::SMB, "smb://other:445/media"), 2u);

    EXPECT_THROW(resources->applySpeedTest("nas", {.concurrency = 0}), std::invalid_argument);
    EXPECT_THROW(resources->applySpeedTest("nope", {.concurrency = 2}), std::out_of_range);
}

TEST_F(ResourceManagerTest, RemoveDropsOverridesAndCache) {
    resources->add(nas());
    resources->applySpeedTest("nas", {.concurrency = 6});
    ASSERT_TRUE(cache->put("smb://nas/media/a.jpg", 1, std::vector<uint8_t>{1, 2, 3}).ok());
    ASSERT_TRUE(cache->put("smb://other/media/a.jpg", 1, std::vector<uint8_t>{4}).ok());

    EXPECT_TRUE(resources->remove("nas"));
    EXPECT_FALSE(resources->remove("nas"));
    EXPECT_EQ(throttle->ceilingFor(Protocol::SMB, nasKey), 2u);
    EXPECT_FALSE(cache->get("smb://nas/media/a.jpg", 1).has_value());
    EXPECT_TRUE(cache->get("smb://other/media/a.jpg", 1).has_value());
}

TEST_F(ResourceManagerTest, UpdateToNewEndpointClearsOldOverride) {
    resources->add(nas());
    resources->applySpeedTest("nas", {.concurrency = 6});

    auto moved = *resources->find("nas");
    moved.root = "smb://nas2/media";
    moved.recommendedConcurrency.reset();
    resources->update(moved);

    EXPECT_EQ(throttle->ceilingFor(Protocol::SMB, nasKey), 2u);
    EXPECT_EQ(resources->find("nas")->root, "smb://nas2/media");
    EXPECT_THROW(resources->update(nas("missing")), std::out_of_range);
}

TEST_F(ResourceManagerTest, CredentialChangeMarksNetworkResources) {
    resources->add(nas());
    resources->add({.id = "local", .name = "Home", .root = "/home/me"});
    EXPECT_EQ(resources->refreshCredentialState(), 0u);

    store->upsert({.type = Protocol::SMB, .server = "nas", .port = 445, .username = "me", .password = "pw"});
    EXPECT_EQ(resources->refreshCredentialState(), 1u);
    EXPECT_TRUE(resources->find("nas")->needsReauth);
    EXPECT_FALSE(resources->find("local")->needsReauth);
    EXPECT_EQ(resources->refreshCredentialState(), 0u);

    resources->markAuthenticated("nas");
    EXPECT_FALSE(resources->find("nas")->needsReauth);
}
