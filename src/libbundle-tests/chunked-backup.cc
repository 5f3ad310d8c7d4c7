#include "charx/bundle/chunked-backup.hh"
#include "charx/bundle/errors.hh"
#include "charx/store/tests/memory-asset-store.hh"

#include <gtest/gtest.h>

namespace charx {

using testing::MemoryAssetStore;

static std::string encodeRecords(const std::vector<BackupRecord> & records)
{
    BufferEntrySink sink;
    ChunkedBackupWriter writer(sink);
    for (auto & r : records)
        writer.writeRecord(r.name, r.data);
    writer.close();
    return sink.s;
}

static const std::vector<BackupRecord> sample = {{"a", "A"}, {"database", "{}"}};

/* ----------------------------------------------------------------------------
 * record format
 * --------------------------------------------------------------------------*/

TEST(ChunkedBackupWriter, recordLayout)
{
    auto bytes = encodeRecords({{"a", "A"}});
    ASSERT_EQ(bytes, std::string("\x01\0\0\0" "a" "\x01\0\0\0" "A", 10));
}

TEST(ChunkedBackupParser, wholeInput)
{
    ASSERT_EQ(parseChunkedBackup(encodeRecords(sample)), sample);
}

TEST(ChunkedBackupParser, emptyInputHasNoRecords)
{
    ASSERT_TRUE(parseChunkedBackup("").empty());
}

TEST(ChunkedBackupParser, emptyNameAndData)
{
    std::vector<BackupRecord> records{{"", ""}, {"x", ""}, {"", "y"}};
    ASSERT_EQ(parseChunkedBackup(encodeRecords(records)), records);
}

/* Splitting inside a length prefix, a name and a payload. */
TEST(ChunkedBackupParser, splitAtInterestingOffsets)
{
    auto bytes = encodeRecords(sample);
    ASSERT_EQ(bytes.size(), 28u);

    for (size_t offset : {1, 5, 9, 13}) {
        std::vector<BackupRecord> got;
        ChunkedBackupParser parser([&](BackupRecord && r) { got.push_back(std::move(r)); });
        parser(std::string_view(bytes).substr(0, offset));
        parser(std::string_view(bytes).substr(offset));
        parser.finish();
        ASSERT_EQ(got, sample) << "split at " << offset;
    }
}

TEST(ChunkedBackupParser, splitAtEveryOffset)
{
    auto bytes = encodeRecords({{"assets/a.png", std::string(300, 'p')}, {"b", "B"}, {"database.risudat", "s"}});
    auto expected = parseChunkedBackup(bytes);

    for (size_t offset = 0; offset <= bytes.size(); ++offset) {
        std::vector<BackupRecord> got;
        ChunkedBackupParser parser([&](BackupRecord && r) { got.push_back(std::move(r)); });
        parser(std::string_view(bytes).substr(0, offset));
        parser(std::string_view(bytes).substr(offset));
        parser.finish();
        ASSERT_EQ(got, expected) << "split at " << offset;
    }
}

TEST(ChunkedBackupParser, oneByteAtATime)
{
    auto bytes = encodeRecords(sample);
    std::vector<BackupRecord> got;
    ChunkedBackupParser parser([&](BackupRecord && r) { got.push_back(std::move(r)); });
    for (auto c : bytes)
        parser(std::string_view(&c, 1));
    parser.finish();
    ASSERT_EQ(got, sample);
    ASSERT_EQ(parser.recordsEmitted(), 2u);
    ASSERT_EQ(parser.pending(), 0u);
}

TEST(ChunkedBackupParser, recordsAreEmittedAsSoonAsComplete)
{
    auto bytes = encodeRecords(sample);
    std::vector<BackupRecord> got;
    ChunkedBackupParser parser([&](BackupRecord && r) { got.push_back(std::move(r)); });
    parser(std::string_view(bytes).substr(0, 11));
    ASSERT_EQ(got.size(), 1u);
    ASSERT_EQ(parser.pending(), 1u);
}

TEST(ChunkedBackupParser, truncatedInputIsStructuralError)
{
    auto bytes = encodeRecords(sample);
    for (size_t cut : {1, 3, 12, 27}) {
        ChunkedBackupParser parser([](BackupRecord &&) {});
        parser(std::string_view(bytes).substr(0, cut));
        ASSERT_THROW(parser.finish(), StructuralError) << "cut at " << cut;
    }
}

/* ----------------------------------------------------------------------------
 * isBackupAsset
 * --------------------------------------------------------------------------*/

TEST(isBackupAsset, mediaExtensions)
{
    ASSERT_TRUE(isBackupAsset("assets/x.png"));
    ASSERT_TRUE(isBackupAsset("assets/x.jpeg"));
    ASSERT_TRUE(isBackupAsset("assets/voice.ogg"));
    ASSERT_TRUE(isBackupAsset("assets/clip.mkv"));
    ASSERT_FALSE(isBackupAsset("assets/x.bin"));
    ASSERT_FALSE(isBackupAsset("database.bin"));
}

/* ----------------------------------------------------------------------------
 * full and partial backups
 * --------------------------------------------------------------------------*/

class BackupTest : public ::testing::Test
{
protected:
    MemoryAssetStore store;
    StateObject state = {{"characters", {{{"name", "Alice"}}}}, {"account", {{"token", "secret"}}}};

    void SetUp() override
    {
        store.put("assets/a.png", "A");
        store.put("assets/b.webp", "B");
        store.put("assets/c.mp3", "C");
        store.put("assets/d.bin", "D");
    }
};

TEST_F(BackupTest, fullBackupHasEveryMediaAssetAndStateLast)
{
    BufferEntrySink sink;
    auto res = writeFullBackup(sink, store, state);
    ASSERT_TRUE(sink.isClosed());
    ASSERT_EQ(res.assetsWritten, 3u);
    ASSERT_TRUE(res.missingAssets.empty());

    auto records = parseChunkedBackup(sink.s);
    ASSERT_EQ(records.size(), 4u);
    ASSERT_EQ(records[0], (BackupRecord{"assets/a.png", "A"}));
    ASSERT_EQ(records[1], (BackupRecord{"assets/b.webp", "B"}));
    ASSERT_EQ(records[2], (BackupRecord{"assets/c.mp3", "C"}));
    ASSERT_EQ(records[3].name, backupStateRecord);

    auto saved = decodeState(records[3].data);
    ASSERT_FALSE(saved.contains("account"));
    ASSERT_EQ(saved["characters"][0]["name"], "Alice");
}

TEST_F(BackupTest, partialBackupOnlyHasCriticalPngs)
{
    BufferEntrySink sink;
    auto res = writePartialBackup(sink, store, state, {"assets/a.png", "assets/b.webp", "assets/missing.png"});
    ASSERT_EQ(res.assetsWritten, 1u);
    ASSERT_EQ(res.missingAssets, Strings{"assets/missing.png"});

    auto records = parseChunkedBackup(sink.s);
    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[0].name, "assets/a.png");
    ASSERT_EQ(records[1].name, backupStateRecord);
}

TEST_F(BackupTest, restoreRoundTrip)
{
    BufferEntrySink sink;
    writeFullBackup(sink, store, state);

    MemoryAssetStore target;
    StringSource source(sink.s);
    std::string seenEncoded;
    auto res = restoreBackup(
        source, target, [&](const std::string & encoded, const StateObject &) { seenEncoded = encoded; });

    ASSERT_EQ(res.assetsRestored, 3u);
    ASSERT_TRUE(res.failedAssets.empty());
    ASSERT_EQ(target.load("assets/b.webp"), "B");
    ASSERT_FALSE(target.has("assets/d.bin"));
    ASSERT_EQ(res.state["characters"][0]["name"], "Alice");
    ASSERT_EQ(seenEncoded, res.encodedState);
}

TEST_F(BackupTest, restoreSkipsAssetsThatCannotBeStored)
{
    BufferEntrySink sink;
    {
        ChunkedBackupWriter writer(sink);
        writer.writeRecord("assets/ok.png", "ok");
        writer.writeRecord("../escape.png", "bad");
        writer.writeRecord(backupStateRecord, encodeState(StateObject::object()));
        writer.close();
    }

    struct PickyStore : MemoryAssetStore
    {
        void put(const std::string & key, std::string_view data) override
        {
            if (key.starts_with(".."))
                throw AssetStoreError("invalid asset key '%s'", key);
            MemoryAssetStore::put(key, data);
        }
    } target;

    StringSource source(sink.s);
    auto res = restoreBackup(source, target);
    ASSERT_EQ(res.assetsRestored, 1u);
    ASSERT_EQ(res.failedAssets, Strings{"../escape.png"});
}

TEST_F(BackupTest, restoreWithoutStateRecordFails)
{
    auto bytes = encodeRecords({{"assets/a.png", "A"}});
    StringSource source(bytes);
    ASSERT_THROW(restoreBackup(source, store), StructuralError);
}

TEST_F(BackupTest, restoreWithCorruptStateFails)
{
    auto bytes = encodeRecords({{std::string(backupStateRecord), "garbage"}});
    StringSource source(bytes);
    ASSERT_THROW(restoreBackup(source, store), StateDecodeError);
}

TEST_F(BackupTest, restoreOfTruncatedBackupFails)
{
    BufferEntrySink sink;
    writeFullBackup(sink, store, state);
    auto bytes = sink.s.substr(0, sink.s.size() - 1);
    StringSource source(bytes);
    ASSERT_THROW(restoreBackup(source, store), StructuralError);
}

} // namespace charx
