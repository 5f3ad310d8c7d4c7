#include "charx/util/hash.hh"

#include <openssl/evp.h>

namespace charx {

std::string Hash::toBase16() const
{
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(size * 2);
    for (auto b : bytes) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0f]);
    }
    return s;
}

struct HashSink::Ctx
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
};

HashSink::HashSink()
    : ctx(std::make_unique<Ctx>())
{
    if (!ctx->md || !EVP_DigestInit_ex(ctx->md.get(), EVP_sha256(), nullptr))
        throw BadHash("cannot initialise SHA-256");
}

HashSink::~HashSink() = default;

void HashSink::operator()(std::string_view data)
{
    if (finished)
        throw BadHash("writing to a finished hash");
    if (!EVP_DigestUpdate(ctx->md.get(), data.data(), data.size()))
        throw BadHash("SHA-256 update failed");
    bytes += data.size();
}

std::pair<Hash, uint64_t> HashSink::finish()
{
    if (finished)
        throw BadHash("hash was already finished");
    finished = true;
    Hash hash;
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx->md.get(), hash.bytes.data(), &len) || len != Hash::size)
        throw BadHash("SHA-256 finalisation failed");
    return {hash, bytes};
}

Hash hashString(std::string_view s)
{
    HashSink sink;
    sink(s);
    return sink.finish().first;
}

std::string sha256Base16(std::string_view s)
{
    return hashString(s).toBase16();
}

} // namespace charx
