#include "chunkcache/util/compression.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/logging.hh"

#include <array>

#include <brotli/decode.h>
#include <brotli/encode.h>

namespace chunkcache {

static constexpr int defaultLevel = -1;

struct NoneSink : CompressionSink
{
    Sink & nextSink;

    NoneSink(Sink & nextSink, int level = defaultLevel)
        : nextSink(nextSink)
    {
        if (level != defaultLevel)
            warn("compression method 'none' ignores the requested level %d", level);
    }

    void writeUnbuffered(std::string_view data) override
    {
        nextSink(data);
    }

    void finish() override
    {
        flush();
    }
};

typedef std::array<uint8_t, 64 * 1024> OutBuffer;

struct BrotliEncoderSink : CompressionSink
{
    Sink & nextSink;
    std::unique_ptr<BrotliEncoderState, decltype(&BrotliEncoderDestroyInstance)> state{
        nullptr, &BrotliEncoderDestroyInstance};
    OutBuffer out;

    BrotliEncoderSink(Sink & nextSink, int level)
        : nextSink(nextSink)
    {
        if (level != defaultLevel && (level < BROTLI_MIN_QUALITY || level > BROTLI_MAX_QUALITY))
            throw CompressionError(
                "brotli compression level must be between %d and %d, got %d",
                BROTLI_MIN_QUALITY,
                BROTLI_MAX_QUALITY,
                level);
        state.reset(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr));
        if (!state)
            throw CompressionError("unable to initialise brotli encoder");
        if (level != defaultLevel)
            BrotliEncoderSetParameter(state.get(), BROTLI_PARAM_QUALITY, level);
    }

    void feed(std::string_view data, BrotliEncoderOperation op)
    {
        auto nextIn = (const uint8_t *) data.data();
        size_t availIn = data.size();

        do {
            checkInterrupt();
            auto nextOut = out.data();
            size_t availOut = out.size();
            if (!BrotliEncoderCompressStream(state.get(), op, &availIn, &nextIn, &availOut, &nextOut, nullptr))
                throw CompressionError("error while compressing brotli data");
            if (availOut < out.size())
                nextSink({(const char *) out.data(), out.size() - availOut});
        } while (availIn || BrotliEncoderHasMoreOutput(state.get())
                 || (op == BROTLI_OPERATION_FINISH && !BrotliEncoderIsFinished(state.get())));
    }

    void writeUnbuffered(std::string_view data) override
    {
        feed(data, BROTLI_OPERATION_PROCESS);
    }

    void finish() override
    {
        flush();
        feed({}, BROTLI_OPERATION_FINISH);
    }
};

/**
 * Strict: the input must be exactly one complete brotli stream.
 */
struct BrotliDecoderSink : CompressionSink
{
    Sink & nextSink;
    std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state{
        BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance};
    OutBuffer out;
    bool done = false;

    BrotliDecoderSink(Sink & nextSink)
        : nextSink(nextSink)
    {
        if (!state)
            throw CompressionError("unable to initialize brotli decoder");
    }

    void writeUnbuffered(std::string_view data) override
    {
        if (done && !data.empty())
            throw CompressionError("trailing data after the end of the brotli stream");

        auto nextIn = (const uint8_t *) data.data();
        size_t availIn = data.size();

        while (!done) {
            checkInterrupt();
            auto nextOut = out.data();
            size_t availOut = out.size();
            auto res = BrotliDecoderDecompressStream(state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);
            if (res == BROTLI_DECODER_RESULT_ERROR)
                throw CompressionError(
                    "error while decompressing brotli data: %s",
                    BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
            if (availOut < out.size())
                nextSink({(const char *) out.data(), out.size() - availOut});
            if (res == BROTLI_DECODER_RESULT_SUCCESS)
                done = true;
            else if (res == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT)
                return;
        }

        if (availIn)
            throw CompressionError("trailing data after the end of the brotli stream");
    }

    void finish() override
    {
        flush();
        if (!done)
            throw CompressionError("brotli stream is truncated");
    }
};

void checkCompressionMethod(const std::string & method)
{
    if (method != "none" && method != "br")
        throw UnknownCompressionMethod("unknown compression method '%s'", method);
}

std::unique_ptr<FinishSink> makeDecompressionSink(const std::string & method, Sink & nextSink)
{
    /* Chunks written before compression was configured have no method. */
    if (method.empty())
        return std::make_unique<NoneSink>(nextSink);
    checkCompressionMethod(method);
    if (method == "br")
        return std::make_unique<BrotliDecoderSink>(nextSink);
    return std::make_unique<NoneSink>(nextSink);
}

ref<CompressionSink> makeCompressionSink(const std::string & method, Sink & nextSink, int level)
{
    checkCompressionMethod(method);
    if (method == "br")
        return make_ref<BrotliEncoderSink>(nextSink, level);
    return make_ref<NoneSink>(nextSink, level);
}

std::string compress(const std::string & method, std::string_view in, int level)
{
    StringSink res;
    auto sink = makeCompressionSink(method, res, level);
    (*sink)(in);
    sink->finish();
    return std::move(res.s);
}

std::string decompress(const std::string & method, std::string_view in)
{
    StringSink res;
    auto sink = makeDecompressionSink(method, res);
    (*sink)(in);
    sink->finish();
    return std::move(res.s);
}

} // namespace chunkcache
