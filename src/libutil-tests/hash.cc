#include "charx/util/hash.hh"

#include <gtest/gtest.h>

namespace charx {

/* ----------------------------------------------------------------------------
 * sha256Base16
 * --------------------------------------------------------------------------*/

TEST(sha256Base16, knownDigests)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    ASSERT_EQ(sha256Base16("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_EQ(sha256Base16(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(sha256Base16, hashesEmbeddedNulBytes)
{
    ASSERT_NE(sha256Base16(std::string_view("a\0b", 3)), sha256Base16("a"));
}

/* ----------------------------------------------------------------------------
 * HashSink
 * --------------------------------------------------------------------------*/

TEST(HashSink, countsBytesAndMatchesHashString)
{
    HashSink sink;
    sink("ab");
    sink("c");
    auto [hash, bytes] = sink.finish();
    ASSERT_EQ(bytes, 3u);
    ASSERT_EQ(hash, hashString("abc"));
}

TEST(HashSink, hashesWhatASourceDrainsIntoIt)
{
    std::string data(100000, 'x');
    StringSource source(data);
    HashSink sink;
    source.drainInto(sink);
    ASSERT_EQ(sink.finish().first.toBase16(), sha256Base16(data));
}

TEST(HashSink, rejectsWritesAfterFinish)
{
    HashSink sink;
    sink.finish();
    ASSERT_THROW(sink("late"), BadHash);
    ASSERT_THROW(sink.finish(), BadHash);
}

} // namespace charx
