#pragma once
/**
 * @file
 *
 * Every charx exception derives from `BaseError` and carries an
 * `ErrorInfo`. Rendering to text happens in the logger, not at the
 * throw site.
 */

#include "charx/util/fmt.hh"

#include <cerrno>
#include <cstring>
#include <list>
#include <optional>
#include <source_location>

namespace charx {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

struct ErrorInfo
{
    Verbosity level = lvlError;
    HintFmt msg;

    /**
     * Context, outermost first.
     */
    std::list<std::string> traces;

    unsigned int status = 1;

    static std::optional<std::string> programName;
};

/**
 * Render `einfo` with its level prefix. Without `showTrace` only the
 * three outermost traces are printed.
 */
std::string showErrorInfo(const ErrorInfo & einfo, bool showTrace);

/**
 * Catch `Error`, not this.
 */
class BaseError : public std::exception
{
protected:
    ErrorInfo err;

    mutable std::optional<std::string> what_;

public:
    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...)}
    {
    }

    BaseError(const ErrorInfo & e)
        : err(e)
    {
    }

    /**
     * The message without the level prefix or traces.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    /**
     * The message as the logger would print it.
     */
    const std::string & msg() const;

    const char * what() const noexcept override
    {
        return msg().c_str();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    void withExitStatus(unsigned int status)
    {
        err.status = status;
    }

    template<typename... Args>
    void addTrace(const std::string & fs, const Args &... args)
    {
        err.traces.push_front(HintFmt(fs, args...).str());
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * A failed system call. The message gets `strerror(errNo)` appended.
 */
class SysError : public Error
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const std::string & fs, const Args &... args)
        : Error(ErrorInfo{.msg = HintFmt("%1%: %2%", Uncolored(fmt(fs, args...)), std::strerror(errNo))})
        , errNo(errNo)
    {
    }

    /**
     * Uses the ambient `errno`, so nothing may clobber it between the
     * failing call and this constructor.
     */
    template<typename... Args>
    SysError(const std::string & fs, const Args &... args)
        : SysError(errno, fs, args...)
    {
    }
};

/**
 * Report an impossible condition and terminate.
 */
[[gnu::noinline, gnu::cold, noreturn]] void
unreachable(std::source_location loc = std::source_location::current());

} // namespace charx
