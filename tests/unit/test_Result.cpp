#include <gtest/gtest.h>
#include "types/Result.hpp"

using namespace mg::types;

TEST(ResultTest, SuccessCarriesValue) {
    Result<int> r = 42;
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.isError());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.describe(), "Success");
}

TEST(ResultTest, ErrorAndCancelledAreDistinct) {
    Result<int> err = Error(ErrorKind::NotFound, "missing");
    Result<int> cancelled = Cancelled{};

    EXPECT_TRUE(err.is(ErrorKind::NotFound));
    EXPECT_FALSE(err.isCancelled());
    EXPECT_THROW((void)err.value(), std::logic_error);

    EXPECT_TRUE(cancelled.isCancelled());
    EXPECT_FALSE(cancelled.isError());
    EXPECT_THROW((void)cancelled.error(), std::logic_error);
}

TEST(ResultTest, PropagateKeepsKind) {
    Result<int> err = Error(ErrorKind::AuthExpired, "expired");
    const auto asString = err.propagate<std::string>();
    EXPECT_TRUE(asString.is(ErrorKind::AuthExpired));
    EXPECT_TRUE(asString.isAuthError());

    Result<int> cancelled = Cancelled{};
    EXPECT_TRUE(cancelled.propagate<Unit>().isCancelled());
}

TEST(ResultTest, MapTransformsOnlySuccess) {
    Result<int> r = 2;
    EXPECT_EQ(r.map([](const int v) { return v * 3; }).value(), 6);

    Result<int> err = Error(ErrorKind::Transport, "down");
    EXPECT_TRUE(err.map([](const int v) { return v * 3; }).is(ErrorKind::Transport));
}

TEST(ErrorTest, Classification) {
    EXPECT_TRUE(Error(ErrorKind::AuthExpired, "").isAuthError());
    EXPECT_TRUE(Error(ErrorKind::NotAuthenticated, "").isAuthError());
    EXPECT_FALSE(Error(ErrorKind::Configuration, "").isTransient());
    EXPECT_TRUE(Error(ErrorKind::Transport, "").isTransient());
    EXPECT_TRUE(Error(ErrorKind::ThrottledTimeout, "").isTransient());
    EXPECT_EQ(Error(ErrorKind::NotFound, "gone", "404").describe(), "NotFound: gone (404)");
}

TEST(ErrorTest, LegacyMessages) {
    EXPECT_EQ(classifyLegacyMessage("Not authenticated"), ErrorKind::AuthExpired);
    EXPECT_EQ(classifyLegacyMessage("HTTP 401"), ErrorKind::AuthExpired);
    EXPECT_EQ(classifyLegacyMessage("Token expired, sign in again"), ErrorKind::AuthExpired);
    EXPECT_EQ(classifyLegacyMessage("connection reset"), ErrorKind::Transport);
    EXPECT_EQ(classifyLegacyMessage("connection reset", ErrorKind::InvalidArgument), ErrorKind::InvalidArgument);
}
