#include "charx/util/file-descriptor.hh"
#include "charx/util/serialise.hh"
#include "charx/util/util.hh"

#include <cerrno>

namespace charx {

std::string readFile(Descriptor fd)
{
    return FdSource(fd).drain();
}

void writeFull(Descriptor fd, std::string_view s)
{
    while (!s.empty()) {
        auto n = ::write(fd, s.data(), s.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file descriptor %d", fd);
        }
        s.remove_prefix(n);
    }
}

void writeLine(Descriptor fd, std::string s)
{
    s += '\n';
    writeFull(fd, s);
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    if (this != &that) {
        close();
        fd = that.release();
    }
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (SysError &) {
        ignoreExceptionInDestructor();
    }
}

void AutoCloseFD::close()
{
    if (fd == INVALID_DESCRIPTOR)
        return;
    auto old = release();
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void AutoCloseFD::fsync() const
{
    if (fd != INVALID_DESCRIPTOR && ::fsync(fd) == -1)
        throw SysError("syncing file descriptor %d", fd);
}

} // namespace charx
