#pragma once
/**
 * @file
 *
 * `boost::format` wrappers. A format string with no arguments is
 * returned verbatim, so messages containing `%` can be passed through
 * safely.
 */

#include <boost/format.hpp>
#include <string>

#include "charx/util/ansicolor.hh"

namespace charx {

/**
 * A format whose argument count need not match its placeholders.
 */
inline boost::format makeFormat(const std::string & fs)
{
    boost::format f(fs);
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
    return f;
}

inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

inline std::string fmt(const std::string & s)
{
    return s;
}

template<typename... Args>
std::string fmt(const std::string & fs, const Args &... args)
{
    auto f = makeFormat(fs);
    (f % ... % args);
    return f.str();
}

/**
 * Opts an argument of `HintFmt` out of highlighting.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s)
        : value(s)
    {
    }

    const T & value;
};

namespace detail {

template<class T>
struct Highlighted
{
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Highlighted<T> & h)
{
    return out << ANSI_WARNING << h.value << ANSI_NORMAL;
}

template<class T>
Highlighted<T> highlight(const T & value)
{
    return {value};
}

template<class T>
const T & highlight(const Uncolored<T> & u)
{
    return u.value;
}

} // namespace detail

/**
 * An error or log message. Interpolated arguments are highlighted
 * unless wrapped in `Uncolored`; the text is formatted once, on
 * construction.
 */
class HintFmt
{
    std::string text;

public:
    HintFmt(std::string literal)
        : text(std::move(literal))
    {
    }

    template<typename... Args>
        requires(sizeof...(Args) > 0)
    HintFmt(const std::string & format, const Args &... args)
        : text(fmt(format, detail::highlight(args)...))
    {
    }

    const std::string & str() const
    {
        return text;
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace charx
