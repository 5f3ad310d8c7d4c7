#include "charx/util/compression.hh"

#include <gtest/gtest.h>

namespace charx {

/* ----------------------------------------------------------------------------
 * compress / decompress
 * --------------------------------------------------------------------------*/

TEST(compress, compressWithUnknownMethod)
{
    ASSERT_THROW(compress("invalid-method", "something-to-compress"), UnknownCompressionMethod);
}

TEST(compress, noneMethodDoesNothingToTheInput)
{
    auto o = compress("none", "this-is-a-test");

    ASSERT_EQ(o, "this-is-a-test");
}

TEST(decompress, decompressNoneCompressed)
{
    auto method = "none";
    auto str = "slfja;sljfklsa;jfklsjfkl;sdjfkl;sadjfkl;sdjf;lsdfjsadlf";
    auto o = decompress(method, str);

    ASSERT_EQ(o, str);
}

TEST(decompress, decompressWithUnknownMethod)
{
    ASSERT_THROW(decompress("xz", "something"), UnknownCompressionMethod);

    StringSink strSink;
    ASSERT_THROW(makeDecompressionSink("gzip", strSink), UnknownCompressionMethod);
}

TEST(decompress, decompressTrailingGarbageAfterBrThrows)
{
    auto compressed = compress("br", "payload") + "trailing";
    ASSERT_THROW(decompress("br", compressed), CompressionError);
}

TEST(decompress, decompressEmptyMethodPassesThrough)
{
    auto str = "slfja;sljfklsa;jfklsjfkl;sdjfkl;sadjfkl;sdjf;lsdfjsadlf";
    ASSERT_EQ(decompress("", str), str);
}

TEST(decompress, decompressBrCompressed)
{
    auto method = "br";
    auto str = "slfja;sljfklsa;jfklsjfkl;sdjfkl;sadjfkl;sdjf;lsdfjsadlf";
    auto o = decompress(method, compress(method, str));

    ASSERT_EQ(o, str);
}

TEST(decompress, decompressLargeBrCompressed)
{
    std::string str;
    for (int i = 0; i < 100000; i++)
        str += std::to_string(i) + ",";
    auto compressed = compress("br", str);

    ASSERT_LT(compressed.size(), str.size());
    ASSERT_EQ(decompress("br", compressed), str);
}

TEST(decompress, decompressTruncatedBrThrows)
{
    std::string str(4096, 'x');
    for (size_t i = 0; i < str.size(); i += 7)
        str[i] = 'a' + (i % 26);
    auto compressed = compress("br", str);
    compressed.resize(compressed.size() / 2);

    ASSERT_THROW(decompress("br", compressed), CompressionError);
}

/* ----------------------------------------------------------------------------
 * compression sinks
 * --------------------------------------------------------------------------*/

TEST(makeCompressionSink, noneSinkDoesNothingToInput)
{
    StringSink strSink;
    auto inputString = "slfja;sljfklsa;jfklsjfkl;sdjfkl;sadjfkl;sdjf;lsdfjsadlf";
    auto sink = makeCompressionSink("none", strSink);
    (*sink)(inputString);
    sink->finish();

    ASSERT_EQ(strSink.s, inputString);
}

TEST(makeCompressionSink, brSinkAcceptsManySmallWrites)
{
    std::string input;
    for (int i = 0; i < 5000; i++)
        input += std::to_string(i * 7919 % 104729) + ";";

    StringSink strSink;
    auto sink = makeCompressionSink("br", strSink);
    for (size_t i = 0; i < input.size(); i += 13)
        (*sink)(std::string_view(input).substr(i, 13));
    sink->finish();

    ASSERT_EQ(decompress("br", strSink.s), input);
}

TEST(makeCompressionSink, compressAndDecompress)
{
    StringSink strSink;
    auto inputString = "slfja;sljfklsa;jfklsjfkl;sdjfkl;sadjfkl;sdjf;lsdfjsadlf";
    auto decompressionSink = makeDecompressionSink("br", strSink);
    auto sink = makeCompressionSink("br", *decompressionSink);

    (*sink)(inputString);
    sink->finish();
    decompressionSink->finish();

    ASSERT_EQ(strSink.s, inputString);
}

} // namespace charx
