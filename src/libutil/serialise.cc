#include "charx/util/serialise.hh"
#include "charx/util/util.hh"

#include <array>
#include <cerrno>
#include <optional>

#include <boost/coroutine2/coroutine.hpp>

#include <unistd.h>

namespace charx {

void BufferedSink::operator()(std::string_view data)
{
    if (pending.size() + data.size() < bufSize) {
        pending.append(data);
        return;
    }
    flush();
    if (data.size() >= bufSize)
        writeUnbuffered(data);
    else
        pending.assign(data);
}

void BufferedSink::flush()
{
    if (pending.empty())
        return;
    std::string out;
    out.swap(pending);
    writeUnbuffered(out);
}

FdSink::~FdSink()
{
    try {
        flush();
    } catch (Error &) {
        ignoreExceptionInDestructor();
    }
}

void FdSink::writeUnbuffered(std::string_view data)
{
    writeFull(fd, data);
}

void Source::operator()(char * data, size_t len)
{
    while (len) {
        size_t n = read(data, len);
        data += n;
        len -= n;
    }
}

void Source::drainInto(Sink & sink)
{
    std::array<char, 8192> buf;
    while (true) {
        size_t n;
        try {
            n = read(buf.data(), buf.size());
        } catch (EndOfFile &) {
            return;
        }
        sink({buf.data(), n});
    }
}

std::string Source::drain()
{
    StringSink s;
    drainInto(s);
    return std::move(s.s);
}

size_t FdSource::read(char * data, size_t len)
{
    ssize_t n;
    do {
        n = ::read(fd, data, len);
    } while (n == -1 && errno == EINTR);
    if (n == -1)
        throw SysError("reading from file descriptor %d", fd);
    if (n == 0)
        throw EndOfFile("unexpected end-of-file on file descriptor %d", fd);
    return n;
}

size_t StringSource::read(char * data, size_t len)
{
    if (pos == s.size())
        throw EndOfFile("end of string reached");
    size_t n = s.copy(data, len, pos);
    pos += n;
    return n;
}

namespace {

typedef boost::coroutines2::coroutine<bool> Coro;

/* Hands the pushed bytes to the coroutine. Once the current buffer is
   used up the coroutine suspends until the next push; a push of `true`
   means no more data follows. */
struct YieldingSource : Source
{
    Coro::pull_type & yield;
    std::string_view & cur;

    YieldingSource(Coro::pull_type & yield, std::string_view & cur)
        : yield(yield)
        , cur(cur)
    {
    }

    size_t read(char * data, size_t len) override
    {
        while (cur.empty()) {
            if (yield.get())
                throw EndOfFile("no more input");
            yield();
        }
        size_t n = cur.copy(data, len);
        cur.remove_prefix(n);
        return n;
    }
};

struct SourceToSink : FinishSink
{
    std::function<void(Source &)> fun;
    std::optional<Coro::push_type> coro;
    std::string_view cur;

    SourceToSink(std::function<void(Source &)> fun)
        : fun(std::move(fun))
    {
    }

    void start()
    {
        coro.emplace([this](Coro::pull_type & yield) {
            YieldingSource source(yield, cur);
            fun(source);
        });
    }

    void operator()(std::string_view in) override
    {
        if (in.empty())
            return;
        if (!coro)
            start();
        else if (!*coro)
            throw SerialisationError("reader finished before all input was consumed");
        cur = in;
        (*coro)(false);
    }

    void finish() override
    {
        if (!coro)
            start();
        if (*coro) {
            cur = {};
            (*coro)(true);
        }
    }
};

} // namespace

std::unique_ptr<FinishSink> sourceToSink(std::function<void(Source &)> fun)
{
    return std::make_unique<SourceToSink>(std::move(fun));
}

void writeLE32(Sink & sink, uint32_t n)
{
    char buf[4];
    for (int i = 0; i < 4; ++i)
        buf[i] = (char) (n >> (8 * i));
    sink({buf, sizeof(buf)});
}

uint32_t decodeLE32(std::string_view bytes)
{
    uint32_t n = 0;
    for (int i = 3; i >= 0; --i)
        n = (n << 8) | (unsigned char) bytes[i];
    return n;
}

uint32_t readLE32(Source & source)
{
    char buf[4];
    source(buf, sizeof(buf));
    return decodeLE32({buf, sizeof(buf)});
}

void writeFramed(Sink & sink, std::string_view data)
{
    if (data.size() > std::numeric_limits<uint32_t>::max())
        throw SerialisationError("frame of %s does not fit a 32-bit length", renderSize(data.size()));
    writeLE32(sink, data.size());
    sink(data);
}

std::string readFramed(Source & source, size_t max)
{
    auto len = readLE32(source);
    if (len > max)
        throw SerialisationError("frame length %d exceeds the limit of %d", len, max);
    std::string res(len, 0);
    source(res.data(), len);
    return res;
}

} // namespace charx
