#include "chunkcache/util/util.hh"

#include <gtest/gtest.h>

namespace chunkcache {

TEST(hasPrefix, basic)
{
    EXPECT_TRUE(hasPrefix("extra-rebuild-command", "extra-"));
    EXPECT_TRUE(hasPrefix("anything", ""));
    EXPECT_FALSE(hasPrefix("", "extra-"));
    EXPECT_FALSE(hasPrefix("ext", "extra-"));
}

TEST(string2Int, rejectsWhatIsNotAnInteger)
{
    EXPECT_EQ(string2Int<int>("0"), 0);
    EXPECT_EQ(string2Int<int>("-100"), -100);
    EXPECT_EQ(string2Int<int>(""), std::nullopt);
    EXPECT_EQ(string2Int<int>("12abc"), std::nullopt);
    EXPECT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
    EXPECT_EQ(string2Int<unsigned int>("99999999999"), std::nullopt);
}

TEST(string2IntWithUnitPrefix, binaryUnits)
{
    EXPECT_EQ(string2IntWithUnitPrefix<uint64_t>("17"), 17);
    EXPECT_EQ(string2IntWithUnitPrefix<uint64_t>("2K"), 2048);
    EXPECT_EQ(string2IntWithUnitPrefix<uint64_t>("10M"), 10 * 1024 * 1024);
    EXPECT_EQ(string2IntWithUnitPrefix<uint64_t>("1g"), 1ULL << 30);
    EXPECT_EQ(string2IntWithUnitPrefix<uint64_t>("3T"), 3ULL << 40);
}

TEST(string2IntWithUnitPrefix, invalid)
{
    EXPECT_THROW(string2IntWithUnitPrefix<uint64_t>("10X"), UsageError);
    EXPECT_THROW(string2IntWithUnitPrefix<uint64_t>("M"), UsageError);
    EXPECT_THROW(string2IntWithUnitPrefix<uint64_t>("ten"), UsageError);
}

TEST(renderSize, kibibytesUpToOneMebibyte)
{
    EXPECT_EQ(renderSize(0, true), "   0.0 KiB");
    EXPECT_EQ(renderSize(100), "0.1 KiB");
    EXPECT_EQ(renderSize(972), "0.9 KiB");
    EXPECT_EQ(renderSize(973), "1.0 KiB");
    EXPECT_EQ(renderSize(1024 * 1024, true), "1024.0 KiB");
    EXPECT_EQ(renderSize(25 * 1024 * 1024), "25.0 MiB");
    EXPECT_EQ(renderSize(3LL << 40), "3.0 TiB");
}

TEST(stripIndentation, removesCommonIndent)
{
    EXPECT_EQ(stripIndentation("\n    Chunk size.\n\n      Details.\n    "), "\nChunk size.\n\n  Details.\n\n");
    EXPECT_EQ(stripIndentation("flat"), "flat\n");
}

TEST(stringsToCharPtrs, nullTerminated)
{
    Strings args{"rebuild", "wiki"};
    auto argv = stringsToCharPtrs(args);
    ASSERT_EQ(argv.size(), 3);
    EXPECT_STREQ(argv[0], "rebuild");
    EXPECT_STREQ(argv[1], "wiki");
    EXPECT_EQ(argv[2], nullptr);
}

} // namespace chunkcache
