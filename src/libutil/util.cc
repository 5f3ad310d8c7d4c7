#include "charx/util/util.hh"

#include <cctype>

namespace charx {

std::string trim(std::string_view s, std::string_view whitespace)
{
    auto i = s.find_first_not_of(whitespace);
    if (i == s.npos)
        return "";
    auto j = s.find_last_not_of(whitespace);
    return std::string(s.substr(i, j + 1 - i));
}

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.starts_with(prefix);
}

bool hasSuffix(std::string_view s, std::string_view suffix)
{
    return s.ends_with(suffix);
}

std::string toLower(std::string s)
{
    for (auto & c : s)
        c = std::tolower((unsigned char) c);
    return s;
}

std::string renderSize(uint64_t value)
{
    if (value < 1024)
        return fmt("%d B", value);
    static constexpr std::string_view prefixes = "KMGTPE";
    double res = value;
    size_t power = 0;
    while (res >= 1024 && power < prefixes.size()) {
        res /= 1024;
        power++;
    }
    return fmt("%.1f %ciB", res, prefixes[power - 1]);
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        try {
            throw;
        } catch (Error & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.message());
        } catch (std::exception & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
        }
    } catch (std::exception &) {
        /* Logging itself failed; nothing left to report to. */
    }
}

} // namespace charx
