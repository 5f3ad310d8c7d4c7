#pragma once
/**
 * @file
 *
 * Byte sinks and sources, and the little-endian framing shared by the
 * encoded state and the chunked backup records.
 */

#include <functional>
#include <limits>
#include <memory>

#include "charx/util/types.hh"
#include "charx/util/file-descriptor.hh"

namespace charx {

/**
 * Abstract destination of binary data.
 */
struct Sink
{
    virtual ~Sink() {}

    virtual void operator()(std::string_view data) = 0;
};

/**
 * A sink that must be explicitly closed. After `finish()` returns no
 * further data may be written to it.
 */
struct FinishSink : virtual Sink
{
    virtual void finish() = 0;
};

/**
 * Collects small writes and passes them on in blocks of at least
 * `bufSize` bytes. Not thread-safe.
 */
struct BufferedSink : virtual Sink
{
    explicit BufferedSink(size_t bufSize = 32 * 1024)
        : bufSize(bufSize)
    {
    }

    void operator()(std::string_view data) override;

    void flush();

    /**
     * Forget buffered bytes that have not been written yet.
     */
    void discard()
    {
        pending.clear();
    }

protected:

    virtual void writeUnbuffered(std::string_view data) = 0;

private:
    size_t bufSize;
    std::string pending;
};

/**
 * Abstract source of binary data.
 */
struct Source
{
    virtual ~Source() {}

    /**
     * Fill `data` with exactly `len` bytes.
     *
     * @throws EndOfFile if the source runs dry first.
     */
    void operator()(char * data, size_t len);

    /**
     * Store between 1 and `len` bytes in `data` and return how many.
     *
     * @throws EndOfFile once the source is exhausted.
     */
    virtual size_t read(char * data, size_t len) = 0;

    void drainInto(Sink & sink);

    std::string drain();
};

/**
 * Writes to a file descriptor it does not own.
 */
struct FdSink : BufferedSink
{
    Descriptor fd;

    explicit FdSink(Descriptor fd = INVALID_DESCRIPTOR)
        : fd(fd)
    {
    }

    FdSink(FdSink &&) = default;
    FdSink(const FdSink &) = delete;
    FdSink & operator=(const FdSink &) = delete;

    ~FdSink();

protected:
    void writeUnbuffered(std::string_view data) override;
};

/**
 * Reads from a file descriptor it does not own. `read()` returns
 * whatever a single read(2) yields, so callers choose the chunk size.
 */
struct FdSource : Source
{
    Descriptor fd;

    explicit FdSource(Descriptor fd = INVALID_DESCRIPTOR)
        : fd(fd)
    {
    }

    size_t read(char * data, size_t len) override;
};

struct StringSink : Sink
{
    std::string s;

    void operator()(std::string_view data) override
    {
        s.append(data);
    }
};

/**
 * Reads from a string view. The viewed string must outlive the source.
 */
struct StringSource : Source
{
    std::string_view s;
    size_t pos = 0;

    StringSource(std::string &&) = delete;

    StringSource(std::string_view s)
        : s(s)
    {
    }

    StringSource(const std::string & str)
        : s(str)
    {
    }

    size_t read(char * data, size_t len) override;
};

/**
 * Turn a function that pulls from a `Source` into a sink that can be
 * pushed into. The function runs as a coroutine on the pushing thread;
 * `finish()` gives it end-of-file and runs it to completion. Its
 * exceptions propagate out of the push or `finish()` that resumed it.
 */
std::unique_ptr<FinishSink> sourceToSink(std::function<void(Source &)> fun);

MakeError(SerialisationError, Error);

void writeLE32(Sink & sink, uint32_t n);

/**
 * Decode a little-endian 32-bit number from the first four bytes of
 * `bytes`, which must hold at least that many.
 */
uint32_t decodeLE32(std::string_view bytes);

uint32_t readLE32(Source & source);

/**
 * Write `data` preceded by its length as a little-endian 32-bit
 * number.
 *
 * @throws SerialisationError if `data` is 4 GiB or larger.
 */
void writeFramed(Sink & sink, std::string_view data);

/**
 * Inverse of `writeFramed()`.
 *
 * @throws SerialisationError if the length exceeds `max`.
 * @throws EndOfFile if the source ends inside the frame.
 */
std::string readFramed(Source & source, size_t max = std::numeric_limits<uint32_t>::max());

} // namespace charx
