#include "charx/bundle/state-codec.hh"

#include <gtest/gtest.h>

namespace charx {

static const StateObject state = {{"characters", {1, 2, 3}}, {"settings", {{"theme", "dark"}}}};

TEST(stateCodec, roundTripWithBrotli)
{
    auto encoded = encodeState(state, "br");
    ASSERT_TRUE(isEncodedState(encoded));
    ASSERT_EQ(decodeState(encoded), state);
}

TEST(stateCodec, roundTripUncompressed)
{
    auto encoded = encodeState(state, "none");
    ASSERT_NE(encoded.find(R"("theme":"dark")"), std::string::npos);
    ASSERT_EQ(decodeState(encoded), state);
}

TEST(stateCodec, defaultMethodComesFromSettings)
{
    ASSERT_EQ(decodeState(encodeState(state)), state);
}

TEST(stateCodec, emptyObject)
{
    ASSERT_EQ(decodeState(encodeState(StateObject::object(), "br")), StateObject::object());
}

TEST(stateCodec, badMagic)
{
    ASSERT_FALSE(isEncodedState("{\"plain\":\"json\"}"));
    ASSERT_THROW(decodeState("{\"plain\":\"json\"}"), StateDecodeError);
    ASSERT_THROW(decodeState(""), StateDecodeError);
}

TEST(stateCodec, truncatedHeader)
{
    auto encoded = encodeState(state, "br");
    ASSERT_THROW(decodeState(encoded.substr(0, 12)), StateDecodeError);
}

TEST(stateCodec, truncatedPayload)
{
    auto encoded = encodeState(state, "br");
    ASSERT_THROW(decodeState(encoded.substr(0, encoded.size() - 4)), StateDecodeError);

    auto plain = encodeState(state, "none");
    ASSERT_THROW(decodeState(plain.substr(0, plain.size() - 4)), StateDecodeError);
}

TEST(stateCodec, unsupportedVersion)
{
    auto encoded = encodeState(state, "none");
    encoded[8] = 2;
    ASSERT_THROW(decodeState(encoded), StateDecodeError);
}

} // namespace charx
