#include "charx/bundle/archive-reader.hh"
#include "charx/util/zipfile.hh"
#include "charx/util/util.hh"

#include <archive.h>
#include <archive_entry.h>

namespace charx {

ArchiveReader::ArchiveReader(AssetStore & store, Options options)
    : store(store)
    , options(std::move(options))
{
}

void ArchiveReader::parse(std::string_view data)
{
    StringSource source(data);
    parse(source);
}

void ArchiveReader::parse(Descriptor fd)
{
    FdSource source(fd);
    parse(source);
}

/* Read the data of the current entry, buffering at most `limit` bytes.
   Returns std::nullopt if the entry turned out to be larger. */
static std::optional<std::string> readEntryData(ZipReader & archive, struct archive_entry * entry, uint64_t limit)
{
    if (archive_entry_size_is_set(entry) && (uint64_t) archive_entry_size(entry) > limit) {
        archive.skipData();
        return std::nullopt;
    }

    std::string data;
    bool tooLarge = false;
    std::vector<char> buf(64 * 1024);

    while (true) {
        auto n = archive.readData(buf.data(), buf.size());
        if (n == 0)
            break;
        if (tooLarge)
            continue;
        if (data.size() + n > limit) {
            tooLarge = true;
            std::string().swap(data);
            continue;
        }
        data.append(buf.data(), n);
    }

    if (tooLarge)
        return std::nullopt;
    return data;
}

void ArchiveReader::handleEntry(const std::string & name, std::string && data)
{
    if (name == options.metadataEntry)
        card = std::move(data);
    else if (name == options.secondaryEntry)
        module = std::move(data);
    else if (name == "manifest.json")
        manifest = std::move(data);
    else if (hasSuffix(name, ".json"))
        debug("ignoring metadata entry '%s'", name);
    else {
        pipeline->waitForCapacity();
        pipeline->enqueue(name, std::move(data));
    }
}

void ArchiveReader::decodeEntries(Source & source)
{
    {
        ZipReader archive(source);
        struct archive_entry * entry;

        while (archive.nextEntry(&entry)) {
            auto pathname = archive_entry_pathname(entry);
            if (!pathname)
                throw StructuralError("archive entry has no name");
            std::string name(pathname);

            if (archive_entry_filetype(entry) != AE_IFREG) {
                archive.skipData();
                continue;
            }

            auto data = readEntryData(archive, entry, options.maxAssetSize);
            if (!data) {
                warn("archive entry '%s' exceeds %s and is not imported", name, renderSize(options.maxAssetSize));
                excluded.push_back(name);
                continue;
            }

            handleEntry(name, std::move(*data));
        }
    }

    /* The streaming zip reader stops at the central directory; consume
       the rest of the input so decoding ends with it. */
    std::vector<char> buf(64 * 1024);
    try {
        while (true)
            source.read(buf.data(), buf.size());
    } catch (EndOfFile &) {
    }
}

void ArchiveReader::parse(Source & source)
{
    if (pipeline)
        throw Error("an archive reader can only parse once");

    pipeline = std::make_unique<AssetPipeline>(
        store,
        AssetPipeline::Options{
            .maxConcurrentSaves = options.maxConcurrentSaves,
            .maxQueuedSaves = options.maxQueuedSaves,
            .hashOnly = options.hashOnly,
            .onProgress = options.onProgress,
        });

    try {
        auto decoder = sourceToSink([&](Source & in) { decodeEntries(in); });

        std::vector<char> buf(std::max<size_t>(options.chunkSize, 1));
        while (true) {
            size_t n;
            try {
                n = source.read(buf.data(), buf.size());
            } catch (EndOfFile &) {
                break;
            }
            (*decoder)({buf.data(), n});
        }
        decoder->finish();

        if (options.requireManifest && !manifest)
            throw ManifestMissing("archive has no manifest.json; it was probably not written completely");
    } catch (Error & e) {
        auto exc = std::current_exception();
        if (!dynamic_cast<StructuralError *>(&e)) {
            StructuralError err(e.info());
            err.addTrace("while reading archive");
            exc = std::make_exception_ptr(err);
        }
        pipeline->finalize();
        std::promise<void> failed;
        failed.set_exception(exc);
        completion = failed.get_future().share();
        std::rethrow_exception(exc);
    }

    finish();
}

void ArchiveReader::finish()
{
    std::exception_ptr signalError;
    if (options.hashSignal && !options.hashOnly) {
        try {
            store.save(*options.hashSignal);
        } catch (Error & e) {
            e.addTrace("while recording the asset hub signal");
            signalError = std::current_exception();
        }
    }

    pipeline->finalize();
    completion = pipeline->awaitCompletion();

    if (signalError)
        std::rethrow_exception(signalError);
}

std::shared_future<void> ArchiveReader::done() const
{
    if (!completion)
        throw Error("parse() must be called before done()");
    return *completion;
}

std::map<std::string, AssetId> ArchiveReader::assets()
{
    return pipeline ? pipeline->assets() : std::map<std::string, AssetId>{};
}

std::optional<std::string> ArchiveReader::firstImage(Source & source)
{
    std::optional<std::string> res;

    auto decoder = sourceToSink([&](Source & in) {
        {
            ZipReader archive(in);
            struct archive_entry * entry;
            while (archive.nextEntry(&entry)) {
                auto pathname = archive_entry_pathname(entry);
                auto ext = pathname ? toLower(std::string(pathname)) : "";
                if (!res && archive_entry_filetype(entry) == AE_IFREG
                    && (hasSuffix(ext, ".jpg") || hasSuffix(ext, ".jpeg") || hasSuffix(ext, ".png"))) {
                    res = readEntryData(archive, entry, bundleSettings.maxAssetSize);
                    if (res)
                        break;
                } else
                    archive.skipData();
            }
        }
        std::vector<char> buf(64 * 1024);
        try {
            while (true)
                in.read(buf.data(), buf.size());
        } catch (EndOfFile &) {
        }
    });

    source.drainInto(*decoder);
    decoder->finish();

    return res;
}

} // namespace charx
