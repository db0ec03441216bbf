#include "sigflow/Result.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace sigflow;

TEST(ResultTest, HoldsValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
    EXPECT_EQ(r.value_or(7), 42);
}

TEST(ResultTest, HoldsError) {
    Result<std::vector<int>> r = Error{"missing price", "line 4.price"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "missing price");
    EXPECT_EQ(r.error().describe(), "line 4.price: missing price");
    EXPECT_TRUE(r.value_or({}).empty());
}

TEST(ResultTest, DescribeWithoutPath) {
    Error e{"boom", ""};
    EXPECT_EQ(e.describe(), "boom");
}

TEST(ResultTest, ArrowAccess) {
    Result<std::string> r = std::string("5m");
    EXPECT_EQ(r->size(), 2u);
}
