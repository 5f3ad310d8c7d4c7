#pragma once
/**
 * @file
 *
 * Destinations for containers produced by the archive and backup
 * writers.
 */

#include "charx/util/serialise.hh"
#include "charx/util/file-descriptor.hh"

namespace charx {

MakeError(EntrySinkClosed, Error);

/**
 * An incremental byte consumer with explicit close. Chunks are
 * appended in the order they are written; after `finish()` any
 * further write throws `EntrySinkClosed`. `finish()` is idempotent.
 */
struct EntrySink : FinishSink
{
    void operator()(std::string_view data) override;

    void finish() override;

    bool isClosed() const
    {
        return closed;
    }

    uint64_t bytesWritten() const
    {
        return written;
    }

protected:

    virtual void write(std::string_view data) = 0;

    virtual void close() = 0;

private:

    bool closed = false;
    uint64_t written = 0;
};

/**
 * Writes to a temporary file next to `path` and moves it into place
 * on `finish()`. A sink that is destroyed without being finished
 * removes the temporary, so an interrupted export never leaves a
 * truncated container under the final name.
 */
class FileEntrySink : public EntrySink
{
    Path path, tmpPath;
    AutoCloseFD fd;
    FdSink sink;

public:

    explicit FileEntrySink(const Path & path);

    ~FileEntrySink();

    const Path & getPath() const
    {
        return path;
    }

protected:

    void write(std::string_view data) override;

    void close() override;
};

/**
 * Collects everything into memory.
 */
struct BufferEntrySink : EntrySink
{
    std::string s;

protected:

    void write(std::string_view data) override
    {
        s.append(data);
    }

    void close() override {}
};

/**
 * Forwards every chunk to another sink, e.g. an `FdSink` on standard
 * output. Closing flushes it if it is buffered.
 */
class StreamEntrySink : public EntrySink
{
    Sink & next;

public:

    explicit StreamEntrySink(Sink & next)
        : next(next)
    {
    }

protected:

    void write(std::string_view data) override
    {
        next(data);
    }

    void close() override;
};

} // namespace charx
