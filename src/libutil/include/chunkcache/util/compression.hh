#pragma once
///@file

#include "chunkcache/util/ref.hh"
#include "chunkcache/util/types.hh"
#include "chunkcache/util/serialise.hh"

#include <string>

namespace chunkcache {

struct CompressionSink : BufferedSink, FinishSink
{
    using BufferedSink::operator();
    using BufferedSink::writeUnbuffered;
    using FinishSink::finish;
};

/**
 * Decompress a complete compressed buffer.
 *
 * @throws CompressionError if `in` is malformed, truncated or followed
 * by trailing data.
 */
std::string decompress(const std::string & method, std::string_view in);

std::unique_ptr<FinishSink> makeDecompressionSink(const std::string & method, Sink & nextSink);

/**
 * Compress `in` as one self-contained unit.
 *
 * @param level Codec-specific level; -1 selects the library default.
 */
std::string compress(const std::string & method, std::string_view in, int level = -1);

ref<CompressionSink> makeCompressionSink(const std::string & method, Sink & nextSink, int level = -1);

/**
 * Throw `UnknownCompressionMethod` unless `method` names a codec this
 * build supports.
 */
void checkCompressionMethod(const std::string & method);

MakeError(UnknownCompressionMethod, Error);

MakeError(CompressionError, Error);

} // namespace chunkcache
