#include <gtest/gtest.h>
#include "cache/ContentCache.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace mg::cache;
using namespace mg::types;
using namespace std::chrono_literals;

class ContentCacheTest : public ::testing::Test {
protected:
    fs::path dir = fs::temp_directory_path() / "mediagate-cache-test";
    ContentCache::Clock::time_point now = ContentCache::Clock::now();

    void SetUp() override {
        fs::remove_all(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::unique_ptr<ContentCache> make(const uint64_t maxBytes = 1000, const std::chrono::seconds ttl = 24h) {
        return std::make_unique<ContentCache>(dir, maxBytes, ttl, 0.8, [this] { return now; });
    }

    static std::vector<uint8_t> bytes(const size_t n, const uint8_t fill = 'x') {
        return std::vector<uint8_t>(n, fill);
    }
};

TEST_F(ContentCacheTest, PutThenGetReturnsSameBytes) {
    const auto cache = make();
    const std::vector<uint8_t> data{'h', 'e', 'l', 'l', 'o'};

    const auto put = cache->put("smb://nas/photos/a.jpg", 1234, data);
    ASSERT_TRUE(put.ok()) << put.describe();
    EXPECT_EQ(put.value().key, ContentCache::keyFor("smb://nas/photos/a.jpg", 1234));
    EXPECT_EQ(put.value().size, data.size());

    const auto got = cache->get("smb://nas/photos/a.jpg", 1234);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, data);

    // a different modified time is a different entry
    EXPECT_FALSE(cache->get("smb://nas/photos/a.jpg", 1235).has_value());
}

TEST_F(ContentCacheTest, KeyIsSha256OfPathAndTime) {
    const auto key = ContentCache::keyFor("/a", 1);
    EXPECT_EQ(key.size(), 64u);
    EXPECT_EQ(key, ContentCache::keyFor("/a", 1));
    EXPECT_NE(key, ContentCache::keyFor("/a", 2));
}

TEST_F(ContentCacheTest, StreamPutLeavesNoStagingFiles) {
    const auto cache = make();
    std::istringstream in("streamed content");
    ASSERT_TRUE(cache->put("/docs/a.txt", 5, in).ok());

    for (const auto& e : fs::directory_iterator(dir))
        EXPECT_EQ(e.path().filename().string().find(".tmp-"), std::string::npos);

    const auto file = cache->getFile("/docs/a.txt", 5);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(fs::file_size(*file), 16u);
}

TEST_F(ContentCacheTest, OversizedEntryRejected) {
    const auto cache = make(100);
    EXPECT_TRUE(cache->put("/big", 1, bytes(101)).is(ErrorKind::InvalidArgument));

    std::istringstream in(std::string(101, 'x'));
    EXPECT_TRUE(cache->put("/big", 1, in).is(ErrorKind::InvalidArgument));
    EXPECT_EQ(cache->stats().count, 0u);
}

TEST_F(ContentCacheTest, EvictsLeastRecentlyTouchedDownToTarget) {
    const auto cache = make(1000);

    ASSERT_TRUE(cache->put("/a", 1, bytes(300)).ok());
    now += 1s;
    ASSERT_TRUE(cache->put("/b", 1, bytes(300)).ok());
    now += 1s;
    ASSERT_TRUE(cache->put("/c", 1, bytes(300)).ok());
    now += 1s;
    ASSERT_TRUE(cache->get("/a", 1).has_value());   // a is now the most recently touched of the three
    now += 1s;
    ASSERT_TRUE(cache->put("/d", 1, bytes(300)).ok());

    const auto stats = cache->stats();
    EXPECT_LE(stats.total_bytes, 800u);
    EXPECT_EQ(stats.evictions, 2u);

    EXPECT_TRUE(cache->get("/a", 1).has_value());
    EXPECT_TRUE(cache->get("/d", 1).has_value());
    EXPECT_FALSE(cache->get("/b", 1).has_value());
    EXPECT_FALSE(cache->get("/c", 1).has_value());
}

TEST_F(ContentCacheTest, ExpiredEntryIsMissAndDeleted) {
    const auto cache = make(1000, 24h);
    ASSERT_TRUE(cache->put("/old", 7, bytes(10)).ok());

    now += 23h;
    EXPECT_TRUE(cache->get("/old", 7).has_value());

    now += 2h;
    EXPECT_FALSE(cache->get("/old", 7).has_value());
    EXPECT_FALSE(fs::exists(dir / ContentCache::keyFor("/old", 7)));
}

TEST_F(ContentCacheTest, InvalidateAndPrefix) {
    const auto cache = make(10'000);
    ASSERT_TRUE(cache->put("smb://nas/photos/a.jpg", 1, bytes(10)).ok());
    ASSERT_TRUE(cache->put("smb://nas/photos/b.jpg", 1, bytes(10)).ok());
    ASSERT_TRUE(cache->put("smb://nas/music/c.mp3", 1, bytes(10)).ok());

    EXPECT_TRUE(cache->invalidate("smb://nas/photos/a.jpg", 1));
    EXPECT_FALSE(cache->invalidate("smb://nas/photos/a.jpg", 1));

    EXPECT_EQ(cache->invalidatePrefix("smb://nas/photos"), 1u);
    EXPECT_FALSE(cache->get("smb://nas/photos/b.jpg", 1).has_value());
    EXPECT_TRUE(cache->get("smb://nas/music/c.mp3", 1).has_value());
}

TEST_F(ContentCacheTest, PrefixStopsAtPathSegments) {
    const auto cache = make(10'000);
    ASSERT_TRUE(cache->put("/photos/a.jpg", 1, bytes(10)).ok());
    ASSERT_TRUE(cache->put("/photos/a.jpg.bak", 1, bytes(10)).ok());
    ASSERT_TRUE(cache->put("smb://nas/share/x.jpg", 1, bytes(10)).ok());
    ASSERT_TRUE(cache->put("smb://nas/share2/y.jpg", 1, bytes(10)).ok());

    EXPECT_EQ(cache->invalidatePrefix("/photos/a.jpg"), 1u);
    EXPECT_TRUE(cache->get("/photos/a.jpg.bak", 1).has_value());

    EXPECT_EQ(cache->invalidatePrefix("smb://nas/share"), 1u);
    EXPECT_TRUE(cache->get("smb://nas/share2/y.jpg", 1).has_value());
}

TEST_F(ContentCacheTest, ConcurrentPutGetAndEvictionStayConsistent) {
    constexpr uint64_t ceiling = 2'000;
    constexpr size_t entrySize = 50;
    const auto cache = make(ceiling);

    std::vector<std::thread> workers;
    std::atomic<int> corrupt{0};
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            const auto fill = static_cast<uint8_t>('a' + t);
            for (int i = 0; i < 200; ++i) {
                const auto path = "/t" + std::to_string(t) + "/f" + std::to_string(i % 20);
                if (!cache->put(path, 1, bytes(entrySize, fill)).ok()) ++corrupt;
                if (const auto got = cache->get(path, 1); got && *got != bytes(entrySize, fill)) ++corrupt;
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(corrupt.load(), 0);
    EXPECT_LE(cache->stats().total_bytes, ceiling);

    for (const auto& e : fs::directory_iterator(dir)) {
        EXPECT_EQ(e.path().filename().string().find(".tmp-"), std::string::npos) << e.path();
        std::ifstream in(e.path(), std::ios::binary);
        const std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        ASSERT_EQ(content.size(), entrySize) << e.path();
        EXPECT_EQ(content, std::string(entrySize, content.front())) << e.path();
    }
}

TEST_F(ContentCacheTest, ClearAllAndStats) {
    const auto cache = make(10'000);
    ASSERT_TRUE(cache->put("/a", 1, bytes(10)).ok());
    ASSERT_TRUE(cache->put("/b", 1, bytes(20)).ok());
    EXPECT_TRUE(cache->get("/a", 1).has_value());
    EXPECT_FALSE(cache->get("/missing", 1).has_value());

    auto stats = cache->stats();
    EXPECT_EQ(stats.count, 2u);
    EXPECT_EQ(stats.total_bytes, 30u);
    EXPECT_EQ(stats.max_bytes, 10'000u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.5);

    cache->clearAll();
    stats = cache->stats();
    EXPECT_EQ(stats.count, 0u);
    EXPECT_EQ(stats.total_bytes, 0u);
}

TEST_F(ContentCacheTest, StrayStagingFilesIgnoredAndCleanedOnStart) {
    fs::create_directories(dir);
    { std::ofstream(dir / "abc.tmp-leftover") << "partial"; }

    const auto cache = make();
    EXPECT_FALSE(fs::exists(dir / "abc.tmp-leftover"));
    EXPECT_EQ(cache->stats().count, 0u);
}
