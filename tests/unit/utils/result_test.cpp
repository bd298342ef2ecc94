#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "switchyard/utils/result.hpp"

using switchyard::Result;

TEST(ResultTest, HoldsValue) {
    Result<int> result(42);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.has_error());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, HoldsError) {
    Result<int> result(std::string("bad input"));
    ASSERT_TRUE(result.has_error());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error(), "bad input");
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.has_value());

    std::unique_ptr<int> taken = std::move(result).value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 7);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed(std::string("nope"));

    EXPECT_TRUE(ok.has_value());
    EXPECT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error(), "nope");
}
