#include "charx/util/serialise.hh"

#include <gtest/gtest.h>

#include <vector>

namespace charx {

/* ----------------------------------------------------------------------------
 * framing
 * --------------------------------------------------------------------------*/

TEST(serialise, le32IsLittleEndian)
{
    StringSink sink;
    writeLE32(sink, 0x01020304);
    ASSERT_EQ(sink.s, std::string("\x04\x03\x02\x01", 4));
    ASSERT_EQ(decodeLE32(sink.s), 0x01020304u);
}

TEST(serialise, decodeLE32TreatsBytesAsUnsigned)
{
    ASSERT_EQ(decodeLE32(std::string_view("\xff\x00\x00\x80", 4)), 0x800000ffu);
}

TEST(serialise, frameIsLengthThenBytes)
{
    StringSink sink;
    writeFramed(sink, std::string_view("a\0c", 3));
    writeFramed(sink, "");
    ASSERT_EQ(sink.s, std::string("\x03\0\0\0a\0c\0\0\0\0", 11));

    StringSource source(sink.s);
    ASSERT_EQ(readFramed(source), std::string("a\0c", 3));
    ASSERT_EQ(readFramed(source), "");
    ASSERT_EQ(source.drain(), "");
}

TEST(serialise, readFramedRejectsFramesOverTheLimit)
{
    StringSink sink;
    writeFramed(sink, "abcdefgh");
    StringSource source(sink.s);
    ASSERT_THROW(readFramed(source, 4), SerialisationError);
}

TEST(serialise, truncatedFrameThrowsEndOfFile)
{
    StringSource header(std::string_view("\x01\x02\x03", 3));
    ASSERT_THROW(readLE32(header), EndOfFile);

    StringSource body(std::string_view("\x05\0\0\0ab", 6));
    ASSERT_THROW(readFramed(body), EndOfFile);
}

/* ----------------------------------------------------------------------------
 * BufferedSink
 * --------------------------------------------------------------------------*/

struct CountingSink : BufferedSink
{
    std::vector<std::string> writes;

    CountingSink()
        : BufferedSink(8)
    {
    }

protected:
    void writeUnbuffered(std::string_view data) override
    {
        writes.emplace_back(data);
    }
};

TEST(BufferedSink, coalescesSmallWrites)
{
    CountingSink sink;
    sink("ab");
    sink("cd");
    ASSERT_TRUE(sink.writes.empty());
    sink("efghij");
    sink.flush();
    ASSERT_EQ(sink.writes, (std::vector<std::string>{"abcd", "efghij"}));
}

TEST(BufferedSink, discardDropsPendingBytes)
{
    CountingSink sink;
    sink("abc");
    sink.discard();
    sink.flush();
    ASSERT_TRUE(sink.writes.empty());
}

/* ----------------------------------------------------------------------------
 * sourceToSink
 * --------------------------------------------------------------------------*/

TEST(sourceToSink, pushedChunksArriveInOrder)
{
    std::string seen;
    auto sink = sourceToSink([&](Source & source) { seen = source.drain(); });

    (*sink)("hello ");
    (*sink)("");
    (*sink)("world");
    sink->finish();

    ASSERT_EQ(seen, "hello world");
}

TEST(sourceToSink, readerSeesFramesSplitAcrossChunks)
{
    StringSink encoded;
    writeLE32(encoded, 42);
    writeFramed(encoded, "payload");

    uint32_t n = 0;
    std::string s;
    auto sink = sourceToSink([&](Source & source) {
        n = readLE32(source);
        s = readFramed(source);
        source.drain();
    });

    for (auto c : encoded.s)
        (*sink)(std::string_view(&c, 1));
    sink->finish();

    ASSERT_EQ(n, 42u);
    ASSERT_EQ(s, "payload");
}

TEST(sourceToSink, exceptionsPropagateToThePusher)
{
    auto sink = sourceToSink([&](Source & source) {
        readFramed(source);
        throw Error("bad record");
    });

    StringSink encoded;
    writeFramed(encoded, "x");
    ASSERT_THROW((*sink)(encoded.s), Error);
}

TEST(sourceToSink, finishSignalsEndOfFile)
{
    bool gotEof = false;
    auto sink = sourceToSink([&](Source & source) {
        try {
            readLE32(source);
        } catch (EndOfFile &) {
            gotEof = true;
        }
    });

    (*sink)("abc");
    sink->finish();
    ASSERT_TRUE(gotEof);
}

TEST(sourceToSink, readerRunsEvenWithoutInput)
{
    bool ran = false;
    auto sink = sourceToSink([&](Source & source) {
        ran = true;
        ASSERT_EQ(source.drain(), "");
    });
    sink->finish();
    ASSERT_TRUE(ran);
}

TEST(sourceToSink, pushingAfterTheReaderReturnedThrows)
{
    auto sink = sourceToSink([&](Source & source) { readLE32(source); });
    (*sink)("abcd");
    ASSERT_THROW((*sink)("more"), SerialisationError);
}

} // namespace charx
