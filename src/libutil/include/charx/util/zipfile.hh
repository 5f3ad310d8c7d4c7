#pragma once
/**
 * @file
 *
 * Thin RAII bindings for reading and writing zip containers with
 * libarchive. Only regular file entries are supported.
 */

#include "charx/util/serialise.hh"

#include <exception>
#include <vector>

#include <archive.h>

namespace charx {

/**
 * Throw `EndOfFile` for `ARCHIVE_EOF` and `Error` (with `reason`
 * formatted around libarchive's message) for any other failure.
 */
void checkLibArchive(archive * archive, int err, const std::string & reason);

/**
 * Reads a zip container front to back from a `Source`, without seeking.
 * An exception thrown by the source is rethrown from the reader call
 * that triggered it.
 */
class ZipReader
{
    struct archive * archive;
    Source & source;
    std::vector<char> buffer;
    std::exception_ptr sourceError;

    static ssize_t callbackRead(struct archive *, void * self, const void ** buffer);

    void check(int err, const std::string & reason);

public:

    explicit ZipReader(Source & source);

    ZipReader(const ZipReader &) = delete;
    ZipReader & operator=(const ZipReader &) = delete;

    ~ZipReader();

    /**
     * Advance to the next entry header. Returns false at the end of the
     * container; libarchive warnings are logged and skipped.
     */
    bool nextEntry(struct archive_entry ** entry);

    /**
     * Read up to `len` bytes of the current entry. Returns 0 at the end
     * of the entry.
     */
    size_t readData(char * data, size_t len);

    void skipData();
};

/**
 * Writes a zip container to a `Sink`, one complete entry at a time.
 * Every byte libarchive produces is passed on to the sink before the
 * call that produced it returns.
 *
 * An exception thrown by the sink is rethrown from the writer call
 * that triggered it; afterwards the writer must not be used again.
 */
class ZipWriter
{
    struct archive * archive;
    Sink & sink;
    std::exception_ptr sinkError;
    bool closed = false;

    static ssize_t callbackWrite(struct archive *, void * self, const void * buffer, size_t length);

    void check(int err, const std::string & reason = "failed to write archive (%s)");

public:

    explicit ZipWriter(Sink & sink);

    ZipWriter(const ZipWriter &) = delete;
    ZipWriter & operator=(const ZipWriter &) = delete;

    ~ZipWriter();

    /**
     * Append an entry. A `level` of 0 stores the data uncompressed;
     * 1 to 9 deflate it at that level.
     */
    void addEntry(const std::string & name, std::string_view data, int level = 0);

    /**
     * Write the central directory.
     */
    void close();
};

} // namespace charx
