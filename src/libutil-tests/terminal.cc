#include "chunkcache/util/ansicolor.hh"
#include "chunkcache/util/terminal.hh"

#include <gtest/gtest.h>

namespace chunkcache {

TEST(filterANSIEscapes, emptyString)
{
    ASSERT_EQ(filterANSIEscapes(""), "");
}

TEST(filterANSIEscapes, doesntChangePrintableChars)
{
    auto s = "restored 'wiki' (3 chunks, 25.0 MiB)";

    ASSERT_EQ(filterANSIEscapes(s), s);
}

TEST(filterANSIEscapes, keepsColorsUnlessFilteringAll)
{
    auto s = ANSI_RED "error:" ANSI_NORMAL " chunk set of 'wiki' is incomplete";

    ASSERT_EQ(filterANSIEscapes(s), s);
    ASSERT_EQ(filterANSIEscapes(s, true), "error: chunk set of 'wiki' is incomplete");
}

TEST(filterANSIEscapes, truncatesToWidth)
{
    auto s = "\u001b[30m A \u001b[31m B \u001b[32m C \u001b[33m D \u001b[0m";

    ASSERT_EQ(filterANSIEscapes(s, true, 2), " A");
    ASSERT_EQ(filterANSIEscapes(s, true, 5), " A  B");
    ASSERT_EQ(filterANSIEscapes(s, true, 8), " A  B  C");
}

TEST(filterANSIEscapes, expandsTabs)
{
    ASSERT_EQ(filterANSIEscapes("wiki\t3/3\t25.0 MiB", true), "wiki    3/3     25.0 MiB");
}

TEST(filterANSIEscapes, dropsCarriageReturns)
{
    ASSERT_EQ(filterANSIEscapes("rebuilding\r\n", true), "rebuilding\n");
}

TEST(filterANSIEscapes, utf8CountsCodePoints)
{
    ASSERT_EQ(filterANSIEscapes("fóóbär", true, 6), "fóóbär");
    ASSERT_EQ(filterANSIEscapes("fóóbär", true, 3), "fóó");
}

} // namespace chunkcache
