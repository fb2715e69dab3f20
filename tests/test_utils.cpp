#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, ParseIndex) {
    EXPECT_EQ(parse_index("0"), 0u);
    EXPECT_EQ(parse_index("4294967295"), 4294967295u);
    EXPECT_FALSE(parse_index("4294967296").has_value());
    EXPECT_FALSE(parse_index("").has_value());
    EXPECT_FALSE(parse_index("-1").has_value());
    EXPECT_FALSE(parse_index("12a").has_value());
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("-7"), -7);
    EXPECT_EQ(safe_stoi("nope", 3), 3);
}

TEST(Utils, SplitArgs) {
    EXPECT_EQ(split_args("  load 1   run.bin "), (std::vector<std::string>{"load", "1", "run.bin"}));
    EXPECT_TRUE(split_args("   ").empty());
}

TEST(Utils, Trim) {
    std::string s = " \t seek 5 \n";
    trim(s);
    EXPECT_EQ(s, "seek 5");
}
