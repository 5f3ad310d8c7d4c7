#pragma once
/**
 * @file
 *
 * The chunked backup container: a flat sequence of records, each
 *
 *     u32 nameLength | name | u32 dataLength | data
 *
 * with little-endian lengths. The record named `database.risudat`
 * holds the encoded application state; every other record is an asset
 * keyed by its storage path.
 */

#include "charx/bundle/entry-sink.hh"
#include "charx/bundle/state-codec.hh"
#include "charx/store/asset-store.hh"

#include <functional>

namespace charx {

constexpr std::string_view backupStateRecord = "database.risudat";

struct BackupRecord
{
    std::string name;
    std::string data;

    bool operator==(const BackupRecord &) const = default;
};

class ChunkedBackupWriter
{
    EntrySink & sink;

public:

    explicit ChunkedBackupWriter(EntrySink & sink)
        : sink(sink)
    {
    }

    /**
     * @throws Error if the name or data does not fit a 32-bit length.
     */
    void writeRecord(std::string_view name, std::string_view data);

    void close()
    {
        sink.finish();
    }
};

/**
 * Incremental decoder. Input may be split at arbitrary byte offsets; a
 * record is emitted as soon as it is complete.
 */
class ChunkedBackupParser : public Sink
{
public:
    typedef std::function<void(BackupRecord && record)> RecordCallback;

    explicit ChunkedBackupParser(RecordCallback onRecord)
        : onRecord(std::move(onRecord))
    {
    }

    void operator()(std::string_view data) override;

    /**
     * Signal the end of input.
     *
     * @throws StructuralError if input ended inside a record.
     */
    void finish();

    /**
     * Bytes received but not yet emitted as part of a record.
     */
    size_t pending() const
    {
        return buffer.size();
    }

    uint64_t recordsEmitted() const
    {
        return records;
    }

private:
    RecordCallback onRecord;
    std::string buffer;
    uint64_t records = 0;
};

/**
 * Decode a complete backup held in memory.
 */
std::vector<BackupRecord> parseChunkedBackup(std::string_view data);

/**
 * Whether a store key names an asset that belongs in a full backup.
 */
bool isBackupAsset(std::string_view key);

struct BackupResult
{
    size_t assetsWritten = 0;
    /// Keys that could not be loaded from the store and were skipped.
    Strings missingAssets;
};

/**
 * Write every backup asset of `store` and then the state record, with
 * the `account` field of `state` removed. Finishes the sink.
 */
BackupResult writeFullBackup(EntrySink & sink, AssetStore & store, const StateObject & state);

/**
 * Like `writeFullBackup()`, but only for the `.png` assets named in
 * `criticalKeys`.
 */
BackupResult
writePartialBackup(EntrySink & sink, AssetStore & store, const StateObject & state, const StringSet & criticalKeys);

struct RestoreResult
{
    StateObject state;
    /// The state record exactly as it was stored.
    std::string encodedState;
    size_t assetsRestored = 0;
    /// Asset records that could not be stored.
    Strings failedAssets;
};

/**
 * Called with the state record once it has been decoded. The rest of
 * the input has not been read at that point and may still turn out to
 * be truncated, so nothing should be persisted from here.
 */
typedef std::function<void(const std::string & encodedState, const StateObject & state)> StateCallback;

/**
 * Restore a chunked backup read from `source`. Asset records are
 * stored with `AssetStore::put()`; a failure to store one is logged and
 * skipped. The state record is decoded and passed to `onState`.
 *
 * @param expectedSize Size of the input, for progress reporting; 0 if
 * unknown.
 *
 * @throws StateDecodeError if the state record cannot be decoded.
 * @throws StructuralError if the input is truncated or has no state
 * record.
 */
RestoreResult
restoreBackup(Source & source, AssetStore & store, const StateCallback & onState = {}, uint64_t expectedSize = 0);

} // namespace charx
