#include <gtest/gtest.h>
#include "../mdtemplate/arguments.hpp"

TEST(test_arguments, inline_single) {
    std::vector<std::string> rejects;
    auto args = Args::ParseInline("lang=rust", &rejects);
    EXPECT_EQ(args, (Args::Map_{{"lang", "rust"}}));
    EXPECT_TRUE(rejects.empty());
}

TEST(test_arguments, inline_value_with_equals) {
    auto args = Args::ParseInline("lang=rust math=2+2=4", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"lang", "rust"}, {"math", "2+2=4"}}));

    args = Args::ParseInline("expr=2+2=4", nullptr);
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args["expr"], "2+2=4");

    args = Args::ParseInline("a==b", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"a", "=b"}}));
}

TEST(test_arguments, inline_value_with_spaces) {
    auto args = Args::ParseInline("lang=rust authors=Goudham & Hazel", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"lang", "rust"}, {"authors", "Goudham & Hazel"}}));
}

TEST(test_arguments, inline_whitespace_before_next_pair) {
    // only the single character that introduces the next pair is dropped
    auto args = Args::ParseInline("a=1   b=2", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"a", "1  "}, {"b", "2"}}));
    args = Args::ParseInline("a=1\tb=2", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"a", "1"}, {"b", "2"}}));
}

TEST(test_arguments, inline_empty_value) {
    auto args = Args::ParseInline("a= b=2", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"a", ""}, {"b", "2"}}));
}

TEST(test_arguments, inline_duplicate_keeps_last) {
    auto args = Args::ParseInline("a=1 a=2", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"a", "2"}}));
}

TEST(test_arguments, inline_orphans_are_rejected) {
    std::vector<std::string> rejects;
    auto args = Args::ParseInline("stray =x a=1 tail", &rejects);
    EXPECT_EQ(args, (Args::Map_{{"a", "1 tail"}}));
    EXPECT_EQ(rejects, (std::vector<std::string>{"stray", "=x"}));

    rejects.clear();
    args = Args::ParseInline("justtext", &rejects);
    EXPECT_TRUE(args.empty());
    EXPECT_EQ(rejects, (std::vector<std::string>{"justtext"}));
}

TEST(test_arguments, inline_empty_input) {
    std::vector<std::string> rejects;
    EXPECT_TRUE(Args::ParseInline("", &rejects).empty());
    EXPECT_TRUE(Args::ParseInline("   ", &rejects).empty());
    EXPECT_TRUE(rejects.empty());
}

TEST(test_arguments, lines) {
    std::vector<std::string> rejects;
    auto args = Args::ParseLines("lang=rust\n            authors=Goudham & Hazel\n\n            year=2022\n        ",
                                 &rejects);
    EXPECT_EQ(args, (Args::Map_{{"lang", "rust"}, {"authors", "Goudham & Hazel"}, {"year", "2022"}}));
    EXPECT_TRUE(rejects.empty());
}

TEST(test_arguments, lines_split_at_first_equals) {
    auto args = Args::ParseLines("  name = value\r\nmath=2+2=4\r\n", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"name", " value"}, {"math", "2+2=4"}}));
}

TEST(test_arguments, lines_malformed_are_skipped) {
    std::vector<std::string> rejects;
    auto args = Args::ParseLines("a=1\n  no pair here  \n=orphan\nb=2", &rejects);
    EXPECT_EQ(args, (Args::Map_{{"a", "1"}, {"b", "2"}}));
    EXPECT_EQ(rejects, (std::vector<std::string>{"no pair here", "=orphan"}));
}

TEST(test_arguments, lines_duplicate_keeps_last) {
    auto args = Args::ParseLines("a=1\na=2", nullptr);
    EXPECT_EQ(args, (Args::Map_{{"a", "2"}}));
}

TEST(test_arguments, layouts_agree) {
    EXPECT_EQ(Args::Parse("lang=rust year=2022", false, nullptr), Args::Parse("lang=rust\nyear=2022\n", true, nullptr));
}
