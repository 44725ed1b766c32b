#include <gtest/gtest.h>
#include "protocol/LocalClient.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace mg::protocol;
using namespace mg::types;
using mg::concurrency::CancelToken;

class LocalClientTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / "mediagate-local-test";
    LocalClient client{8};

    void SetUp() override {
        fs::remove_all(root);
        fs::create_directories(root / "photos");
        write(root / "photos" / "a.jpg", "aaaa");
        write(root / "photos" / "b.jpg", "bbbbbbbb");
    }

    void TearDown() override { fs::remove_all(root); }

    static void write(const fs::path& p, const std::string& content) {
        std::ofstream(p, std::ios::binary) << content;
    }

    static std::string read(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    [[nodiscard]] ResourcePath at(const std::string& rel) const {
        return ResourcePath::parse((root / rel).string()).value();
    }
};

TEST_F(LocalClientTest, ListAndMetadata) {
    write(root / "photos" / "c.jpg.mgpart", "partial");

    const auto listed = client.listFiles(at("photos"), CancelToken::none());
    ASSERT_TRUE(listed.ok()) << listed.describe();
    EXPECT_EQ(listed.value().size(), 2u);

    const auto meta = client.getMetadata(at("photos/b.jpg"));
    ASSERT_TRUE(meta.ok());
    EXPECT_EQ(meta.value().name, "b.jpg");
    EXPECT_EQ(meta.value().size, 8u);
    EXPECT_FALSE(meta.value().isDirectory);
    EXPECT_GT(meta.value().modified, 0);

    EXPECT_TRUE(client.getMetadata(at("photos/zzz.jpg")).is(ErrorKind::NotFound));
    EXPECT_TRUE(client.listFiles(at("nowhere"), CancelToken::none()).is(ErrorKind::NotFound));
}

TEST_F(LocalClientTest, DownloadReportsProgress) {
    std::ostringstream out;
    uint64_t last = 0;
    const auto r = client.download(at("photos/b.jpg"), out, [&](const uint64_t done, int64_t) { last = done; },
                                   CancelToken::none());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), 8u);
    EXPECT_EQ(out.str(), "bbbbbbbb");
    EXPECT_EQ(last, 8u);
}

TEST_F(LocalClientTest, UploadIsAtomicAndRespectsOverwrite) {
    std::istringstream in("new content");
    auto r = client.upload(in, 11, at("photos/new.txt"), false, {}, CancelToken::none());
    ASSERT_TRUE(r.ok()) << r.describe();
    EXPECT_EQ(read(root / "photos" / "new.txt"), "new content");
    EXPECT_FALSE(fs::exists(root / "photos" / "new.txt.mgpart"));

    std::istringstream again("x");
    EXPECT_TRUE(client.upload(again, 1, at("photos/new.txt"), false, {}, CancelToken::none()).is(ErrorKind::AlreadyExists));

    std::istringstream replace("y");
    ASSERT_TRUE(client.upload(replace, 1, at("photos/new.txt"), true, {}, CancelToken::none()).ok());
    EXPECT_EQ(read(root / "photos" / "new.txt"), "y");
}

TEST_F(LocalClientTest, CancelledUploadLeavesNothing) {
    CancelToken token;
    token.cancel();
    std::istringstream in(std::string(100, 'z'));

    const auto r = client.upload(in, 100, at("photos/cancelled.bin"), false, {}, token);
    EXPECT_TRUE(r.isCancelled());
    EXPECT_FALSE(fs::exists(root / "photos" / "cancelled.bin"));
    EXPECT_FALSE(fs::exists(root / "photos" / "cancelled.bin.mgpart"));
}

TEST_F(LocalClientTest, ShortUploadIsRejected) {
    std::istringstream in("abc");
    EXPECT_TRUE(client.upload(in, 10, at("photos/short.bin"), false, {}, CancelToken::none()).is(ErrorKind::Transport));
    EXPECT_FALSE(fs::exists(root / "photos" / "short.bin"));
}

TEST_F(LocalClientTest, RenameMoveCopyRemove) {
    const auto renamed = client.rename(at("photos/a.jpg"), "renamed.jpg");
    ASSERT_TRUE(renamed.ok());
    EXPECT_EQ(renamed.value().filename(), "renamed.jpg");
    EXPECT_TRUE(client.rename(at("photos/renamed.jpg"), "b.jpg").is(ErrorKind::AlreadyExists));

    ASSERT_TRUE(client.createFolder(at("archive/2024")).ok());
    ASSERT_TRUE(client.move(at("photos/renamed.jpg"), at("archive/2024/renamed.jpg"), false).ok());
    EXPECT_FALSE(fs::exists(root / "photos" / "renamed.jpg"));
    EXPECT_EQ(read(root / "archive" / "2024" / "renamed.jpg"), "aaaa");

    ASSERT_TRUE(client.copy(at("photos"), at("archive/photos"), false).ok());
    EXPECT_EQ(read(root / "archive" / "photos" / "b.jpg"), "bbbbbbbb");
    EXPECT_TRUE(client.copy(at("photos"), at("archive/photos"), false).is(ErrorKind::AlreadyExists));

    ASSERT_TRUE(client.remove(at("archive")).ok());
    EXPECT_FALSE(fs::exists(root / "archive"));
    EXPECT_TRUE(client.remove(at("archive")).is(ErrorKind::NotFound));

    EXPECT_TRUE(client.exists(at("photos/b.jpg")).value());
    EXPECT_FALSE(client.exists(at("photos/a.jpg")).value());
}

TEST_F(LocalClientTest, CopyStreamsThroughStagedFiles) {
    EXPECT_FALSE(client.capabilities().nativeCopy);
    write(root / "photos" / "c.jpg.mgpart", "partial");

    ASSERT_TRUE(client.copy(at("photos"), at("backup"), false).ok());
    EXPECT_EQ(read(root / "backup" / "a.jpg"), "aaaa");
    EXPECT_EQ(read(root / "backup" / "b.jpg"), "bbbbbbbb");
    EXPECT_FALSE(fs::exists(root / "backup" / "c.jpg.mgpart"));

    for (const auto& e : fs::recursive_directory_iterator(root / "backup"))
        EXPECT_NE(e.path().extension(), ".mgpart") << e.path();
}
