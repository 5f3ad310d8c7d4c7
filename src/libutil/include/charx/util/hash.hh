#pragma once
///@file

#include "charx/util/serialise.hh"

#include <array>
#include <memory>

namespace charx {

MakeError(BadHash, Error);

/**
 * A SHA-256 digest. Asset ids and hub urls use its lowercase base-16
 * form.
 */
struct Hash
{
    static constexpr size_t size = 32;

    std::array<uint8_t, size> bytes{};

    std::string toBase16() const;

    bool operator==(const Hash &) const = default;
};

Hash hashString(std::string_view s);

/**
 * `hashString(s).toBase16()`.
 */
std::string sha256Base16(std::string_view s);

/**
 * Hashes everything written to it and counts the bytes, so that
 * content too large to hold in memory can be hashed from a `Source`.
 */
class HashSink : public Sink
{
    struct Ctx;
    std::unique_ptr<Ctx> ctx;
    uint64_t bytes = 0;
    bool finished = false;

public:
    HashSink();
    ~HashSink();

    void operator()(std::string_view data) override;

    /**
     * The digest and byte count of everything written so far. The sink
     * accepts no data afterwards.
     */
    std::pair<Hash, uint64_t> finish();
};

} // namespace charx
