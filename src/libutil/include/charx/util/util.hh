#pragma once
///@file

#include "charx/util/types.hh"
#include "charx/util/error.hh"
#include "charx/util/logging.hh"

#include <charconv>
#include <limits>
#include <optional>

namespace charx {

std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Parse a whole string as a decimal integer. A leading `-` is rejected
 * for unsigned types.
 */
template<class N>
std::optional<N> string2Int(std::string_view s)
{
    if (s.starts_with('-') && !std::numeric_limits<N>::is_signed)
        return std::nullopt;
    N n;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return n;
}

/**
 * Like `string2Int()`, but accepts a binary unit suffix `K`, `M`, `G`
 * or `T`, e.g. `64M` for 64 MiB.
 *
 * @throws UsageError on anything else, including overflow.
 */
template<class N>
N string2IntWithUnitPrefix(std::string_view s)
{
    static constexpr std::string_view units = "KMGT";
    unsigned shift = 0;
    if (!s.empty()) {
        auto u = units.find(std::toupper((unsigned char) s.back()));
        if (u != units.npos) {
            shift = 10 * (u + 1);
            s.remove_suffix(1);
        }
    }
    auto n = string2Int<N>(s);
    if (!n)
        throw UsageError("'%s' is not an integer", s);
    if (shift && *n > (std::numeric_limits<N>::max() >> shift))
        throw UsageError("'%s' is out of range", s);
    return shift ? *n << shift : *n;
}

/**
 * E.g. `11.6 GiB` for 12433615056.
 */
std::string renderSize(uint64_t value);

bool hasPrefix(std::string_view s, std::string_view prefix);

bool hasSuffix(std::string_view s, std::string_view suffix);

std::string toLower(std::string s);

/**
 * Log the exception being handled as ignored. For use in the catch
 * block of a destructor; never throws.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

} // namespace charx
