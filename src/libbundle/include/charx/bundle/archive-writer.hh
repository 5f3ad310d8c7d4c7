#pragma once
///@file

#include "charx/bundle/entry-sink.hh"
#include "charx/util/types.hh"

#include <memory>

namespace charx {

class ZipWriter;

MakeError(ArchiveWriterError, Error);

/**
 * Make `name` safe to extract on any common file system: characters
 * that are invalid on Windows and control characters become `_`,
 * trailing dots and spaces are removed, reserved device names (`CON`,
 * `LPT1.txt`, ...) get a `_` prefix, and a name that ends up empty,
 * `.` or `..` becomes `file`. Sanitising a sanitised name is a no-op.
 */
std::string sanitizeEntryName(std::string_view name);

/**
 * Hands out unique entry names. A name that is already taken gets a
 * numeric suffix before its extension: `a.png`, `a_1.png`, `a_2.png`.
 */
class EntryNameAllocator
{
    StringSet taken;

public:

    /**
     * Sanitise `name` and reserve a unique variant of it.
     */
    std::string allocate(std::string_view name);

    bool isTaken(std::string_view name) const
    {
        return taken.count(name);
    }
};

/**
 * Streams a zip container to an `EntrySink`, one complete entry at a
 * time. Entries are appended in call order and every byte produced so
 * far is handed to the sink before `write()` returns.
 *
 * If writing fails the writer is broken: further calls throw
 * `ArchiveWriterError` and the sink is left unfinished.
 */
class ArchiveWriter
{
    EntrySink & sink;
    std::unique_ptr<ZipWriter> zip;
    EntryNameAllocator names;
    bool broken = false;
    bool ended = false;

    void checkUsable();

public:

    explicit ArchiveWriter(EntrySink & sink);

    ArchiveWriter(const ArchiveWriter &) = delete;

    ~ArchiveWriter();

    /**
     * Prepare the sink. Calling `write()` first does this implicitly.
     */
    void init();

    /**
     * Add an entry, storing it uncompressed for `level` 0 and
     * deflating it otherwise.
     *
     * @return The name the entry was stored under after sanitising and
     * de-duplication.
     */
    std::string write(std::string_view name, std::string_view data, int level = 0);

    /**
     * Write the container trailer and close the sink.
     */
    void end();

    bool isBroken() const
    {
        return broken;
    }
};

} // namespace charx
