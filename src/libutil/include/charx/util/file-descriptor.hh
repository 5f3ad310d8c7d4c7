#pragma once
///@file

#include "charx/util/types.hh"
#include "charx/util/error.hh"

#include <unistd.h>

namespace charx {

typedef int Descriptor;

const Descriptor INVALID_DESCRIPTOR = -1;

MakeError(EndOfFile, Error);

inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

/**
 * Read `fd` to end-of-file.
 */
std::string readFile(Descriptor fd);

/**
 * Write all of `s`, retrying short writes.
 */
void writeFull(Descriptor fd, std::string_view s);

void writeLine(Descriptor fd, std::string s);

/**
 * Owns a file descriptor and closes it on destruction.
 */
class AutoCloseFD
{
    Descriptor fd;

public:
    AutoCloseFD(Descriptor fd = INVALID_DESCRIPTOR)
        : fd(fd)
    {
    }

    AutoCloseFD(const AutoCloseFD &) = delete;

    AutoCloseFD(AutoCloseFD && that) noexcept
        : fd(that.release())
    {
    }

    AutoCloseFD & operator=(AutoCloseFD && that);

    ~AutoCloseFD();

    Descriptor get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != INVALID_DESCRIPTOR;
    }

    Descriptor release()
    {
        auto old = fd;
        fd = INVALID_DESCRIPTOR;
        return old;
    }

    /**
     * @throws SysError if close(2) fails, e.g. on a delayed write
     * error.
     */
    void close();

    void fsync() const;
};

} // namespace charx
