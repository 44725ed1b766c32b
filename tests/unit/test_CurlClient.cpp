#include <gtest/gtest.h>
#include "protocol/CurlClient.hpp"

using namespace mg::protocol;
using namespace mg::types;

class CurlListingTest : public ::testing::Test {
protected:
    ResourcePath dir = ResourcePath::parse("ftp://files.example/pub").value();
    static constexpr int64_t kJan10_2024 = 1704844800LL * 1000;
};

TEST_F(CurlListingTest, FileWithYear) {
    const auto info = CurlClient::parseListLine("-rw-r--r--    1 ftp      ftp         12345 Jan 15  2023 report.pdf",
                                                dir, kJan10_2024);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "report.pdf");
    EXPECT_EQ(info->path, "ftp://files.example/pub/report.pdf");
    EXPECT_EQ(info->size, 12345u);
    EXPECT_FALSE(info->isDirectory);
    EXPECT_EQ(info->modified, 1673740800LL * 1000);
}

TEST_F(CurlListingTest, RecentEntryRollsBackAYear) {
    const auto info = CurlClient::parseListLine("drwxr-xr-x 2 user group 4096 Dec 20 09:05 holiday photos\r",
                                                dir, kJan10_2024);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "holiday photos");
    EXPECT_TRUE(info->isDirectory);
    EXPECT_EQ(info->size, 0u);
    EXPECT_EQ(info->modified, 1703063100LL * 1000);
}

TEST_F(CurlListingTest, SymlinkKeepsLinkName) {
    const auto info = CurlClient::parseListLine("lrwxrwxrwx 1 root root 7 Jan 15 2023 latest -> v2.1.0", dir, kJan10_2024);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "latest");
}

TEST_F(CurlListingTest, IgnoresNoise) {
    EXPECT_FALSE(CurlClient::parseListLine("total 24", dir, kJan10_2024).has_value());
    EXPECT_FALSE(CurlClient::parseListLine("drwxr-xr-x 2 u g 4096 Jan 1 2024 .", dir, kJan10_2024).has_value());
    EXPECT_FALSE(CurlClient::parseListLine("drwxr-xr-x 2 u g 4096 Jan 1 2024 ..", dir, kJan10_2024).has_value());
    EXPECT_FALSE(CurlClient::parseListLine("-rw-r--r-- 1 u g notanumber Jan 1 2024 x", dir, kJan10_2024).has_value());
    EXPECT_FALSE(CurlClient::parseListLine("", dir, kJan10_2024).has_value());
}
