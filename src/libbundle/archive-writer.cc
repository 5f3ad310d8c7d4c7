#include "charx/bundle/archive-writer.hh"
#include "charx/util/zipfile.hh"
#include "charx/util/logging.hh"
#include "charx/util/util.hh"

namespace charx {

static bool isReservedDeviceName(std::string_view name)
{
    auto stem = toLower(std::string(name.substr(0, name.find('.'))));
    if (stem == "con" || stem == "prn" || stem == "aux" || stem == "nul")
        return true;
    return stem.size() == 4 && (hasPrefix(stem, "com") || hasPrefix(stem, "lpt")) && stem[3] >= '1' && stem[3] <= '9';
}

std::string sanitizeEntryName(std::string_view name)
{
    std::string res;
    res.reserve(name.size());
    for (char c : name) {
        if ((unsigned char) c < 0x20 || std::string_view("<>:\"\\|?*").find(c) != std::string_view::npos)
            res += '_';
        else
            res += c;
    }

    while (!res.empty() && (res.back() == '.' || res.back() == ' '))
        res.pop_back();

    if (isReservedDeviceName(res))
        res = "_" + res;

    if (res.empty() || res == "." || res == "..")
        res = "file";

    return res;
}

std::string EntryNameAllocator::allocate(std::string_view name)
{
    auto sanitized = sanitizeEntryName(name);

    /* The extension is the part after the last dot of the last path
       component; a name without one is all stem. */
    auto slash = sanitized.rfind('/');
    auto dot = sanitized.rfind('.');
    if (dot != sanitized.npos && slash != sanitized.npos && dot < slash)
        dot = sanitized.npos;
    auto stem = sanitized.substr(0, dot);
    auto ext = dot == sanitized.npos ? "" : sanitized.substr(dot);

    auto unique = sanitized;
    for (unsigned int counter = 1; taken.count(unique); ++counter)
        unique = fmt("%s_%d%s", stem, counter, ext);

    taken.insert(unique);
    return unique;
}

ArchiveWriter::ArchiveWriter(EntrySink & sink)
    : sink(sink)
{
}

ArchiveWriter::~ArchiveWriter()
{
    if (zip && !ended && !broken)
        debug("archive writer destroyed before end(); %d bytes written", sink.bytesWritten());
}

void ArchiveWriter::checkUsable()
{
    if (broken)
        throw ArchiveWriterError("archive writer cannot be used after a failed write");
    if (ended)
        throw ArchiveWriterError("archive writer has already been closed");
}

void ArchiveWriter::init()
{
    checkUsable();
    if (zip)
        return;
    try {
        zip = std::make_unique<ZipWriter>(sink);
    } catch (Error &) {
        broken = true;
        throw;
    }
}

std::string ArchiveWriter::write(std::string_view name, std::string_view data, int level)
{
    init();
    auto entryName = names.allocate(name);
    try {
        zip->addEntry(entryName, data, level);
    } catch (Error &) {
        broken = true;
        throw;
    }
    vomit("added '%s' (%s) to archive", entryName, renderSize(data.size()));
    return entryName;
}

void ArchiveWriter::end()
{
    init();
    try {
        zip->close();
        sink.finish();
    } catch (Error &) {
        broken = true;
        throw;
    }
    ended = true;
}

} // namespace charx
