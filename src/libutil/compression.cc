#include "charx/util/compression.hh"

#include <brotli/decode.h>
#include <brotli/encode.h>

namespace charx {

namespace {

struct NoneSink : FinishSink
{
    Sink & nextSink;

    NoneSink(Sink & nextSink)
        : nextSink(nextSink)
    {
    }

    void operator()(std::string_view data) override
    {
        nextSink(data);
    }

    void finish() override {}
};

/* Shared driver for the brotli encoder and decoder: feed `data`
   through `step` until it is consumed, forwarding output as the fixed
   buffer fills. */
struct BrotliSink : FinishSink
{
    Sink & nextSink;
    bool done = false;
    uint8_t outbuf[32 * 1024];

    BrotliSink(Sink & nextSink)
        : nextSink(nextSink)
    {
    }

    virtual bool step(size_t & availIn, const uint8_t *& nextIn, size_t & availOut, uint8_t *& nextOut, bool last) = 0;

    virtual bool isFinished() = 0;

    void pump(std::string_view data, bool last)
    {
        auto nextIn = (const uint8_t *) data.data();
        size_t availIn = data.size();

        while (!done) {
            uint8_t * nextOut = outbuf;
            size_t availOut = sizeof(outbuf);
            bool progress = step(availIn, nextIn, availOut, nextOut, last);
            if (availOut < sizeof(outbuf))
                nextSink({(const char *) outbuf, sizeof(outbuf) - availOut});
            done = isFinished();
            if (!progress || (!availIn && !last && availOut))
                break;
        }
    }

    void operator()(std::string_view data) override
    {
        if (done && !data.empty())
            throw CompressionError("data after the end of the brotli stream");
        pump(data, false);
    }
};

struct BrotliCompressionSink : BrotliSink
{
    BrotliEncoderState * state;

    BrotliCompressionSink(Sink & nextSink)
        : BrotliSink(nextSink)
        , state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr))
    {
        if (!state)
            throw CompressionError("unable to initialise brotli encoder");
    }

    ~BrotliCompressionSink()
    {
        BrotliEncoderDestroyInstance(state);
    }

    bool step(size_t & availIn, const uint8_t *& nextIn, size_t & availOut, uint8_t *& nextOut, bool last) override
    {
        if (!BrotliEncoderCompressStream(
                state,
                last ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS,
                &availIn,
                &nextIn,
                &availOut,
                &nextOut,
                nullptr))
            throw CompressionError("brotli compression failed");
        return true;
    }

    bool isFinished() override
    {
        return BrotliEncoderIsFinished(state);
    }

    void finish() override
    {
        pump({}, true);
    }
};

struct BrotliDecompressionSink : BrotliSink
{
    BrotliDecoderState * state;

    BrotliDecompressionSink(Sink & nextSink)
        : BrotliSink(nextSink)
        , state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr))
    {
        if (!state)
            throw CompressionError("unable to initialise brotli decoder");
    }

    ~BrotliDecompressionSink()
    {
        BrotliDecoderDestroyInstance(state);
    }

    bool step(size_t & availIn, const uint8_t *& nextIn, size_t & availOut, uint8_t *& nextOut, bool last) override
    {
        auto res = BrotliDecoderDecompressStream(state, &availIn, &nextIn, &availOut, &nextOut, nullptr);
        if (res == BROTLI_DECODER_RESULT_ERROR)
            throw CompressionError(
                "corrupt brotli stream: %s", BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state)));
        if (res == BROTLI_DECODER_RESULT_SUCCESS && availIn)
            throw CompressionError("data after the end of the brotli stream");
        return res == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    }

    bool isFinished() override
    {
        return BrotliDecoderIsFinished(state);
    }

    void finish() override
    {
        if (!done)
            throw CompressionError("brotli stream is truncated");
    }
};

} // namespace

std::unique_ptr<FinishSink> makeCompressionSink(const std::string & method, Sink & nextSink)
{
    if (method == "none" || method == "")
        return std::make_unique<NoneSink>(nextSink);
    if (method == "br")
        return std::make_unique<BrotliCompressionSink>(nextSink);
    throw UnknownCompressionMethod("unknown compression method '%s'", method);
}

std::unique_ptr<FinishSink> makeDecompressionSink(const std::string & method, Sink & nextSink)
{
    if (method == "none" || method == "")
        return std::make_unique<NoneSink>(nextSink);
    if (method == "br")
        return std::make_unique<BrotliDecompressionSink>(nextSink);
    throw UnknownCompressionMethod("unknown compression method '%s'", method);
}

std::string compress(const std::string & method, std::string_view in)
{
    StringSink out;
    auto sink = makeCompressionSink(method, out);
    (*sink)(in);
    sink->finish();
    return std::move(out.s);
}

std::string decompress(const std::string & method, std::string_view in)
{
    StringSink out;
    auto sink = makeDecompressionSink(method, out);
    (*sink)(in);
    sink->finish();
    return std::move(out.s);
}

} // namespace charx
