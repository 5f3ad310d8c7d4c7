#include "charx/bundle/chunked-backup.hh"
#include "charx/bundle/bundle-settings.hh"
#include "charx/bundle/errors.hh"
#include "charx/util/finally.hh"
#include "charx/util/logging.hh"
#include "charx/util/util.hh"

#include <optional>

namespace charx {

void ChunkedBackupWriter::writeRecord(std::string_view name, std::string_view data)
{
    try {
        writeFramed(sink, name);
        writeFramed(sink, data);
    } catch (SerialisationError & e) {
        e.addTrace("while writing backup record '%s'", name);
        throw;
    }
}

void ChunkedBackupParser::operator()(std::string_view data)
{
    buffer.append(data);

    size_t pos = 0;
    Finally consume([&]() { buffer.erase(0, pos); });

    /* Each record is two frames; emit it once both are complete. */
    auto frameEnd = [&](size_t at) -> std::optional<size_t> {
        if (buffer.size() - at < 4)
            return std::nullopt;
        uint64_t end = at + 4 + decodeLE32(std::string_view(buffer).substr(at));
        if (end > buffer.size())
            return std::nullopt;
        return end;
    };

    while (true) {
        auto nameEnd = frameEnd(pos);
        if (!nameEnd)
            break;
        auto dataEnd = frameEnd(*nameEnd);
        if (!dataEnd)
            break;

        BackupRecord record{
            buffer.substr(pos + 4, *nameEnd - pos - 4), buffer.substr(*nameEnd + 4, *dataEnd - *nameEnd - 4)};
        pos = *dataEnd;
        records++;
        onRecord(std::move(record));
    }
}

void ChunkedBackupParser::finish()
{
    if (!buffer.empty())
        throw StructuralError(
            "backup is truncated: %d bytes after record %d do not form a complete record", buffer.size(), records);
}

std::vector<BackupRecord> parseChunkedBackup(std::string_view data)
{
    std::vector<BackupRecord> res;
    ChunkedBackupParser parser([&](BackupRecord && record) { res.push_back(std::move(record)); });
    parser(data);
    parser.finish();
    return res;
}

static const std::vector<std::string_view> backupAssetExtensions = {
    ".png", ".webp", ".jpg", ".jpeg", ".gif", ".avif", ".mp3", ".wav", ".ogg", ".flac", ".webm", ".mp4", ".mkv"};

bool isBackupAsset(std::string_view key)
{
    for (auto ext : backupAssetExtensions)
        if (hasSuffix(key, ext))
            return true;
    return false;
}

static BackupResult writeBackup(
    EntrySink & sink, AssetStore & store, const StateObject & state, const Strings & keys, std::string_view what)
{
    Activity act(*logger, lvlTalkative, actWriteBackup, fmt("writing %s backup", what));

    BackupResult res;
    ChunkedBackupWriter writer(sink);

    size_t done = 0;
    for (auto & key : keys) {
        act.progress(done++, keys.size());
        std::string data;
        try {
            data = store.load(key);
        } catch (Error & e) {
            warn("skipping asset '%s': %s", key, e.message());
            res.missingAssets.push_back(key);
            continue;
        }
        writer.writeRecord(key, data);
        res.assetsWritten++;
    }

    auto stripped = state;
    if (stripped.is_object())
        stripped.erase("account");
    writer.writeRecord(backupStateRecord, encodeState(stripped));
    writer.close();

    if (!res.missingAssets.empty())
        warn("%s backup written, but %d assets were missing and skipped", what, res.missingAssets.size());

    return res;
}

BackupResult writeFullBackup(EntrySink & sink, AssetStore & store, const StateObject & state)
{
    Strings keys;
    for (auto & key : store.keys())
        if (isBackupAsset(key))
            keys.push_back(key);
    return writeBackup(sink, store, state, keys, "full");
}

BackupResult
writePartialBackup(EntrySink & sink, AssetStore & store, const StateObject & state, const StringSet & criticalKeys)
{
    Strings keys;
    for (auto & key : criticalKeys)
        if (hasSuffix(key, ".png"))
            keys.push_back(key);
    return writeBackup(sink, store, state, keys, "partial");
}

RestoreResult restoreBackup(Source & source, AssetStore & store, const StateCallback & onState, uint64_t expectedSize)
{
    Activity act(*logger, lvlTalkative, actRestoreBackup, fmt("restoring backup into %s", store.describe()));

    RestoreResult res;
    bool haveState = false;

    ChunkedBackupParser parser([&](BackupRecord && record) {
        if (record.name == backupStateRecord) {
            auto state = decodeState(record.data);
            if (onState)
                onState(record.data, state);
            res.state = std::move(state);
            res.encodedState = std::move(record.data);
            haveState = true;
            return;
        }

        try {
            store.put(record.name, record.data);
            res.assetsRestored++;
        } catch (Error & e) {
            warn("could not restore asset '%s': %s", record.name, e.message());
            res.failedAssets.push_back(record.name);
        }
    });

    std::vector<char> buf(std::max<uint64_t>(bundleSettings.feedChunkSize, 1));
    uint64_t bytesRead = 0;
    while (true) {
        size_t n;
        try {
            n = source.read(buf.data(), buf.size());
        } catch (EndOfFile &) {
            break;
        }
        bytesRead += n;
        parser({buf.data(), n});
        act.progress(bytesRead, expectedSize);
    }
    parser.finish();

    if (!haveState)
        throw StructuralError("backup has no '%s' record", backupStateRecord);

    return res;
}

} // namespace charx
