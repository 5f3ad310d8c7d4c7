#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <string>

#include "charx/util/zipfile.hh"
#include "charx/util/util.hh"
#include "charx/util/finally.hh"
#include "charx/util/logging.hh"

namespace charx {

void checkLibArchive(archive * archive, int err, const std::string & reason)
{
    if (err == ARCHIVE_EOF)
        throw EndOfFile("reached end of archive");
    else if (err != ARCHIVE_OK) {
        auto msg = archive_error_string(archive);
        throw Error(reason, msg ? msg : "unknown libarchive error");
    }
}

ssize_t ZipReader::callbackRead(struct archive * archive, void * _self, const void ** buffer)
{
    auto self = (ZipReader *) _self;
    *buffer = self->buffer.data();
    try {
        return self->source.read(self->buffer.data(), self->buffer.size());
    } catch (EndOfFile &) {
        return 0;
    } catch (std::exception &) {
        self->sourceError = std::current_exception();
        archive_set_error(archive, EIO, "read from source failed");
        return -1;
    }
}

void ZipReader::check(int err, const std::string & reason)
{
    if (sourceError)
        std::rethrow_exception(sourceError);
    checkLibArchive(archive, err, reason);
}

ZipReader::ZipReader(Source & source)
    : archive{archive_read_new()}
    , source(source)
    , buffer(64 * 1024)
{
    if (!archive)
        throw Error("failed to initialize libarchive");
    archive_read_support_filter_none(archive);
    archive_read_support_format_zip_streamable(archive);
    check(
        archive_read_open(archive, this, nullptr, ZipReader::callbackRead, nullptr),
        "failed to open archive (%s)");
}

ZipReader::~ZipReader()
{
    archive_read_free(archive);
}

bool ZipReader::nextEntry(struct archive_entry ** entry)
{
    auto r = archive_read_next_header(archive, entry);
    if (r == ARCHIVE_EOF && !sourceError)
        return false;
    if (r == ARCHIVE_WARN && !sourceError)
        warn("%s", archive_error_string(archive));
    else
        check(r, "failed to read archive entry header (%s)");
    return true;
}

size_t ZipReader::readData(char * data, size_t len)
{
    auto n = archive_read_data(archive, data, len);
    if (n < 0)
        check((int) n, "failed to read archive entry data (%s)");
    else if (sourceError)
        std::rethrow_exception(sourceError);
    return n;
}

void ZipReader::skipData()
{
    check(archive_read_data_skip(archive), "failed to skip archive entry (%s)");
}

//////////////////////////////////////////////////////////////////////

ssize_t ZipWriter::callbackWrite(struct archive * archive, void * _self, const void * buffer, size_t length)
{
    auto self = (ZipWriter *) _self;
    try {
        self->sink({(const char *) buffer, length});
    } catch (std::exception &) {
        self->sinkError = std::current_exception();
        archive_set_error(archive, EIO, "write to sink failed");
        return -1;
    }
    return length;
}

void ZipWriter::check(int err, const std::string & reason)
{
    if (sinkError)
        std::rethrow_exception(sinkError);
    if (err == ARCHIVE_WARN)
        debug("libarchive: %s", archive_error_string(archive));
    else
        checkLibArchive(archive, err, reason);
}

ZipWriter::ZipWriter(Sink & sink)
    : archive{archive_write_new()}
    , sink(sink)
{
    if (!archive)
        throw Error("failed to initialize libarchive");
    check(archive_write_set_format_zip(archive), "couldn't select zip format (%s)");
    // disable internal buffering
    check(archive_write_set_bytes_per_block(archive, 0));
    // disable output padding
    check(archive_write_set_bytes_in_last_block(archive, 1));
    check(archive_write_open(archive, this, nullptr, ZipWriter::callbackWrite, nullptr), "failed to open archive (%s)");
}

ZipWriter::~ZipWriter()
{
    /* An unclosed writer leaves an incomplete container behind; the
       sink is not touched again. */
    if (archive)
        archive_write_free(archive);
}

void ZipWriter::addEntry(const std::string & name, std::string_view data, int level)
{
    if (closed)
        throw Error("cannot add entry '%s' to a closed archive", name);

    if (level == 0)
        check(archive_write_set_format_option(archive, "zip", "compression", "store"));
    else {
        check(archive_write_set_format_option(archive, "zip", "compression", "deflate"));
        check(archive_write_set_format_option(
            archive, "zip", "compression-level", std::to_string(std::clamp(level, 1, 9)).c_str()));
    }

    auto ae = archive_entry_new();
    Finally freeEntry([&]() { archive_entry_free(ae); });
    archive_entry_set_pathname(ae, name.c_str());
    archive_entry_set_filetype(ae, AE_IFREG);
    archive_entry_set_perm(ae, 0644);
    archive_entry_set_size(ae, data.size());

    try {
        check(archive_write_header(archive, ae), "failed to write entry header (%s)");

        while (!data.empty()) {
            ssize_t n = archive_write_data(archive, data.data(), data.size());
            if (n <= 0)
                check(n < 0 ? (int) n : ARCHIVE_FATAL, "failed to write entry data (%s)");
            data.remove_prefix(n);
        }

        check(archive_write_finish_entry(archive), "failed to finish entry (%s)");
    } catch (Error & e) {
        e.addTrace("while writing archive entry '%s'", name);
        throw;
    }
}

void ZipWriter::close()
{
    if (closed)
        return;
    closed = true;
    check(archive_write_close(archive), "failed to finish archive (%s)");
}

} // namespace charx
