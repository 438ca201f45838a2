#include "chunkcache/util/compression.hh"

#include <gtest/gtest.h>

namespace chunkcache {

namespace {

/* Something that looks like a slice of a built artifact. */
std::string sampleChunk()
{
    std::string s;
    for (int i = 0; i < 10000; ++i)
        s += std::to_string(i * 7919 % 104729) + (i % 13 ? "," : "\n");
    return s;
}

} // namespace

TEST(compress, unknownMethodIsRejected)
{
    ASSERT_THROW(compress("zstd-9000", "chunk"), UnknownCompressionMethod);
    ASSERT_THROW(decompress("zstd-9000", "chunk"), UnknownCompressionMethod);
    ASSERT_THROW(checkCompressionMethod("xz"), UnknownCompressionMethod);
    ASSERT_NO_THROW(checkCompressionMethod("br"));
    ASSERT_NO_THROW(checkCompressionMethod("none"));
}

TEST(compress, noneIsIdentity)
{
    auto chunk = sampleChunk();
    ASSERT_EQ(compress("none", chunk), chunk);
    ASSERT_EQ(decompress("none", chunk), chunk);
    ASSERT_EQ(decompress("", chunk), chunk);
}

TEST(compress, brotliShrinksRepetitiveChunks)
{
    std::string zeros(1 << 20, '\0');
    auto packed = compress("br", zeros);

    ASSERT_LT(packed.size(), zeros.size() / 100);
    ASSERT_EQ(decompress("br", packed), zeros);
}

TEST(compress, brotliQualityMustBeInRange)
{
    ASSERT_NO_THROW(compress("br", "chunk", 0));
    ASSERT_NO_THROW(compress("br", "chunk", 11));
    ASSERT_NO_THROW(compress("br", "chunk", -1));
    ASSERT_THROW(compress("br", "chunk", 12), CompressionError);
}

TEST(decompress, emptyChunk)
{
    ASSERT_EQ(decompress("br", compress("br", "")), "");
}

TEST(decompress, corruptChunksAreErrors)
{
    auto packed = compress("br", sampleChunk());

    ASSERT_THROW(decompress("br", "definitely not a brotli stream"), CompressionError);
    ASSERT_THROW(decompress("br", packed.substr(0, packed.size() / 2)), CompressionError);
    ASSERT_THROW(decompress("br", packed + "tail"), CompressionError);
    ASSERT_THROW(decompress("br", ""), CompressionError);
}

TEST(makeCompressionSink, streamsThroughDecompressionSink)
{
    auto chunk = sampleChunk();

    StringSink out;
    auto unpack = makeDecompressionSink("br", out);
    auto pack = makeCompressionSink("br", *unpack, 5);

    for (size_t pos = 0; pos < chunk.size(); pos += 4093)
        (*pack)(std::string_view(chunk).substr(pos, 4093));
    pack->finish();
    unpack->finish();

    ASSERT_EQ(out.s, chunk);
}

TEST(makeCompressionSink, noneForwardsUnchanged)
{
    StringSink out;
    auto sink = makeCompressionSink("none", out);
    (*sink)("first piece, ");
    (*sink)("second piece");
    sink->finish();

    ASSERT_EQ(out.s, "first piece, second piece");
}

} // namespace chunkcache
