#include <gtest/gtest.h>
#include <core/utils.hpp>

using Words = std::vector<std::string>;

TEST(Utils, SplitPlainWords) {
    auto w = split_command_line("  lxc   list  --format csv ");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(*w, (Words{"lxc", "list", "--format", "csv"}));
}

TEST(Utils, SplitQuotes) {
    auto w = split_command_line(R"(exec 'a b' "c \"d\" $e" f\ g)");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(*w, (Words{"exec", "a b", "c \"d\" $e", "f g"}));
}

TEST(Utils, SplitEmptyQuotedWord) {
    auto w = split_command_line("echo '' x");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(*w, (Words{"echo", "", "x"}));
}

TEST(Utils, SplitRejectsUnterminated) {
    EXPECT_FALSE(split_command_line("echo 'oops").has_value());
    EXPECT_FALSE(split_command_line("echo \"oops").has_value());
    EXPECT_FALSE(split_command_line("echo oops\\").has_value());
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("ubuntu:22.04"), "ubuntu:22.04");
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(Utils, ShellQuoteSurvivesSplit) {
    for (std::string word : {"plain", "two words", "it's", "$HOME", "a\"b", ""}) {
        auto w = split_command_line("cmd " + shell_quote(word));
        ASSERT_TRUE(w.has_value()) << word;
        ASSERT_EQ(w->size(), 2u) << word;
        EXPECT_EQ((*w)[1], word);
    }
}

TEST(Utils, TruncateText) {
    EXPECT_EQ(truncate_text("short", 10), "short");
    EXPECT_EQ(truncate_text("abcdefghij", 8), "abcde...");
    EXPECT_EQ(truncate_text("abcdef", 2), "ab");
}

TEST(Utils, ValidNames) {
    EXPECT_TRUE(is_valid_name("warden-vps-alice-1"));
    EXPECT_TRUE(is_valid_name("pool_2.fast"));
    EXPECT_FALSE(is_valid_name(""));
    EXPECT_FALSE(is_valid_name("-rf"));
    EXPECT_FALSE(is_valid_name("a b"));
    EXPECT_FALSE(is_valid_name("a;rm"));
    EXPECT_FALSE(is_valid_name(std::string(64, 'a')));
}

TEST(Utils, ParseInt) {
    EXPECT_EQ(parse_int("42").value_or(-1), 42);
    EXPECT_EQ(parse_int("-3").value_or(0), -3);
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_int("12abc").has_value());
    EXPECT_FALSE(parse_int("99999999999").has_value());
    EXPECT_EQ(safe_stoi("nope", 7), 7);
}

TEST(Utils, Trim) {
    std::string s = " \t start 1 \n";
    trim(s);
    EXPECT_EQ(s, "start 1");
    std::string blank = "   ";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}
