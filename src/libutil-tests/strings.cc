#include <gtest/gtest.h>

#include "chunkcache/util/strings.hh"

#include <map>

namespace chunkcache {

TEST(concatStringsSep, joinsWithSeparator)
{
    EXPECT_EQ(concatStringsSep(",", Strings{}), "");
    EXPECT_EQ(concatStringsSep(",", Strings{"wiki"}), "wiki");
    EXPECT_EQ(concatStringsSep(",", Strings{"", ""}), ",");

    std::vector<std::string> trace{"CHECK_LOCAL", "CHECK_CACHE", "READY"};
    EXPECT_EQ(concatStringsSep(" -> ", trace), "CHECK_LOCAL -> CHECK_CACHE -> READY");
}

TEST(concatMapStringsSep, appliesFunction)
{
    std::map<std::string, int> chunks{{"wiki", 3}, {"maps", 12}};

    EXPECT_EQ(
        concatMapStringsSep(
            " ", chunks, [](const std::pair<const std::string, int> & e) { return e.first + "=" + std::to_string(e.second); }),
        "maps=12 wiki=3");
}

TEST(tokenizeString, dropsEmptyTokens)
{
    EXPECT_EQ(tokenizeString<Strings>(""), Strings{});
    EXPECT_EQ(tokenizeString<Strings>(" \t "), Strings{});
    EXPECT_EQ(tokenizeString<Strings>("  validator\t--strict \n"), (Strings{"validator", "--strict"}));
}

TEST(tokenizeString, customSeparators)
{
    auto tokens = tokenizeString<std::vector<std::string>>("a.db\n\nb.db\n", "\n");
    EXPECT_EQ(tokens, (std::vector<std::string>{"a.db", "b.db"}));
}

TEST(chomp, stripsTrailingWhitespaceOnly)
{
    EXPECT_EQ(chomp(""), "");
    EXPECT_EQ(chomp(" \n"), "");
    EXPECT_EQ(chomp(" store = x \n"), " store = x");
}

TEST(replaceStrings, replacesEveryOccurrence)
{
    EXPECT_EQ(replaceStrings("", "x", "y"), "");
    EXPECT_EQ(replaceStrings("abc", "", "y"), "abc");
    EXPECT_EQ(replaceStrings("odd \"name\"", "\"", "\"\""), "odd \"\"name\"\"");
    // The replacement is not rescanned.
    EXPECT_EQ(replaceStrings("aa", "a", "aa"), "aaaa");
}

TEST(escapeShellArgAlways, quotesEverything)
{
    EXPECT_EQ(escapeShellArgAlways(""), "''");
    EXPECT_EQ(escapeShellArgAlways("wiki.db"), "'wiki.db'");
    EXPECT_EQ(escapeShellArgAlways("it's"), "'it'\\''s'");
}

} // namespace chunkcache
