#include "charx/bundle/state-container.hh"
#include "charx/bundle/chunked-backup.hh"
#include "charx/bundle/tests/archives.hh"
#include "charx/store/tests/file-transfer.hh"
#include "charx/store/tests/memory-asset-store.hh"
#include "charx/util/file-system.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace charx {

using testing::MemoryAssetStore;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

static const StateObject sampleState = {{"username", "alice"}, {"characters", nlohmann::json::array()}};

class StateContainerTest : public ::testing::Test
{
protected:
    AutoDelete delTmpDir;
    Path tmpDir;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir.reset(tmpDir);
    }
};

/* ----------------------------------------------------------------------------
 * LegacySaveContainer
 * --------------------------------------------------------------------------*/

TEST(LegacySaveContainer, fromBytes)
{
    auto c = LegacySaveContainer::fromBytes(encodeState(sampleState), "upload");
    ASSERT_EQ(c.describe(), "upload");
    ASSERT_EQ(c.load(), sampleState);
}

TEST(LegacySaveContainer, garbage)
{
    auto c = LegacySaveContainer::fromBytes("not a save file", "upload");
    ASSERT_THROW(c.load(), Error);
}

TEST_F(StateContainerTest, legacySaveFromFile)
{
    auto path = tmpDir + "/database.bin";
    writeFile(path, encodeState(sampleState));

    LegacySaveContainer c(path);
    ASSERT_EQ(c.describe(), path);
    ASSERT_EQ(c.load(), sampleState);
}

TEST_F(StateContainerTest, legacySaveMissingFile)
{
    LegacySaveContainer c(tmpDir + "/nothing.bin");
    ASSERT_THROW(c.load(), SysError);
}

/* ----------------------------------------------------------------------------
 * ChunkedBackupContainer
 * --------------------------------------------------------------------------*/

TEST_F(StateContainerTest, chunkedBackupRestoresAssets)
{
    MemoryAssetStore source;
    source.put("assets/a.png", "png data");
    source.put("assets/b.mp3", "mp3 data");

    auto path = tmpDir + "/backup.bin";
    {
        FileEntrySink sink(path);
        writeFullBackup(sink, source, sampleState);
    }

    MemoryAssetStore target;
    ChunkedBackupContainer c(path, target);
    ASSERT_EQ(c.load(), sampleState);
    ASSERT_EQ(target.load("assets/a.png"), "png data");
    ASSERT_EQ(target.load("assets/b.mp3"), "mp3 data");
}

TEST_F(StateContainerTest, chunkedBackupMissingFile)
{
    MemoryAssetStore store;
    ChunkedBackupContainer c(tmpDir + "/nothing.bin", store);
    ASSERT_THROW(c.load(), SysError);
}

/* ----------------------------------------------------------------------------
 * ArchiveContainer
 * --------------------------------------------------------------------------*/

TEST_F(StateContainerTest, archiveParsesCard)
{
    auto path = tmpDir + "/card.charx";
    writeFile(path, testing::makeArchive({{"card.json", sampleState.dump()}, {"assets/icon.png", "icon"}}));

    MemoryAssetStore store;
    ArchiveContainer c(path, store);
    ASSERT_EQ(c.load(), sampleState);
    ASSERT_EQ(store.keys().size(), 1u);
}

TEST_F(StateContainerTest, archiveToleratesAssetFailures)
{
    auto path = tmpDir + "/card.charx";
    writeFile(path, testing::makeArchive({{"card.json", sampleState.dump()}, {"assets/icon.png", "icon"}}));

    MemoryAssetStore store;
    store.onSave = [](std::string_view, std::string_view) { throw Error("disk full"); };
    ArchiveContainer c(path, store);
    ASSERT_EQ(c.load(), sampleState);
    ASSERT_TRUE(store.keys().empty());
}

TEST_F(StateContainerTest, archiveWithoutCard)
{
    auto path = tmpDir + "/card.charx";
    writeFile(path, testing::makeArchive({{"assets/icon.png", "icon"}}));

    MemoryAssetStore store;
    ArchiveContainer c(path, store);
    ASSERT_THROW(c.load(), StructuralError);
}

TEST_F(StateContainerTest, archiveWithInvalidCard)
{
    auto path = tmpDir + "/card.charx";
    writeFile(path, testing::makeArchive({{"card.json", "{not json"}}));

    MemoryAssetStore store;
    ArchiveContainer c(path, store);
    ASSERT_THROW(c.load(), StructuralError);
}

/* ----------------------------------------------------------------------------
 * RemoteStateContainer
 * --------------------------------------------------------------------------*/

TEST(RemoteStateContainer, downloadsAndDecodes)
{
    auto ft = make_ref<testing::MockFileTransfer>();
    FileTransferResult ok;
    ok.status = 200;
    ok.data = encodeState(sampleState);
    EXPECT_CALL(*ft, transfer(Field(&FileTransferRequest::uri, "https://example.org/save"))).WillOnce(Return(ok));

    RemoteStateContainer c(ft, "https://example.org/save");
    ASSERT_EQ(c.describe(), "https://example.org/save");
    ASSERT_EQ(c.load(), sampleState);
}

TEST(RemoteStateContainer, transferErrorPropagates)
{
    auto ft = make_ref<testing::MockFileTransfer>();
    EXPECT_CALL(*ft, transfer(_))
        .WillOnce(Throw(FileTransferError(FileTransfer::NotFound, 404, "unable to download: not found")));

    RemoteStateContainer c(ft, "https://example.org/save");
    ASSERT_THROW(c.load(), FileTransferError);
}

} // namespace charx
