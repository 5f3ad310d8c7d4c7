#include "charx/bundle/entry-sink.hh"
#include "charx/util/file-system.hh"
#include "charx/util/util.hh"

#include <fcntl.h>
#include <unistd.h>

namespace charx {

void EntrySink::operator()(std::string_view data)
{
    if (closed)
        throw EntrySinkClosed("cannot write to a closed entry sink");
    write(data);
    written += data.size();
}

void EntrySink::finish()
{
    if (closed)
        return;
    close();
    closed = true;
}

static AutoCloseFD createTempFile(const Path & tmpPath)
{
    AutoCloseFD fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (!fd)
        throw SysError("creating file '%1%'", tmpPath);
    return fd;
}

FileEntrySink::FileEntrySink(const Path & path)
    : path(path)
    , tmpPath(makeTempPath(dirOf(path), "." + std::string(baseNameOf(path))))
    , fd(createTempFile(tmpPath))
    , sink(fd.get())
{
}

FileEntrySink::~FileEntrySink()
{
    if (isClosed())
        return;
    /* Drop whatever is still buffered; the partial file goes away. */
    sink.discard();
    try {
        deletePath(tmpPath);
    } catch (Error &) {
        ignoreExceptionInDestructor();
    }
}

void FileEntrySink::write(std::string_view data)
{
    sink(data);
}

void FileEntrySink::close()
{
    sink.flush();
    fd.fsync();
    fd.close();
    renameFile(tmpPath, path);
    syncParent(path);
}

void StreamEntrySink::close()
{
    if (auto buffered = dynamic_cast<BufferedSink *>(&next))
        buffered->flush();
}

} // namespace charx
