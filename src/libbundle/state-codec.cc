#include "charx/bundle/state-codec.hh"
#include "charx/bundle/bundle-settings.hh"
#include "charx/util/compression.hh"
#include "charx/util/serialise.hh"

namespace charx {

static constexpr std::string_view stateMagic = "CHARXSAV";

static constexpr uint32_t stateVersion = 1;

std::string encodeState(const StateObject & state, const std::string & compression)
{
    StringSink sink;
    sink(stateMagic);
    writeLE32(sink, stateVersion);
    writeFramed(sink, compression);
    sink(compress(compression, state.dump()));
    return std::move(sink.s);
}

std::string encodeState(const StateObject & state)
{
    return encodeState(state, bundleSettings.stateCompression);
}

bool isEncodedState(std::string_view data)
{
    return data.starts_with(stateMagic);
}

StateObject decodeState(std::string_view data)
{
    if (!isEncodedState(data))
        throw StateDecodeError("state has an unknown format");

    try {
        StringSource source(data.substr(stateMagic.size()));

        auto version = readLE32(source);
        if (version != stateVersion)
            throw StateDecodeError("state has unsupported format version %d", version);

        auto method = readFramed(source, 64);
        auto payload = decompress(method, data.substr(stateMagic.size() + source.pos));

        return nlohmann::json::parse(payload);
    } catch (StateDecodeError &) {
        throw;
    } catch (Error & e) {
        StateDecodeError err(e.info());
        err.addTrace("while decoding state");
        throw err;
    } catch (nlohmann::json::exception & e) {
        throw StateDecodeError("state payload is not valid JSON: %s", e.what());
    }
}

} // namespace charx
