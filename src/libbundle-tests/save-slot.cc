#include "charx/bundle/save-slot.hh"
#include "charx/store/tests/memory-asset-store.hh"
#include "charx/util/file-system.hh"

#include <gtest/gtest.h>

namespace charx {

class SaveSlotTest : public ::testing::Test
{
protected:
    AutoDelete tmpDir{createTempDir()};
    SaveSlot slot{tmpDir.path() + "/database"};
};

TEST_F(SaveSlotTest, ensureInitializedWritesEmptyState)
{
    ASSERT_FALSE(slot.hasPrimary());
    slot.ensureInitialized();
    ASSERT_TRUE(slot.hasPrimary());
    ASSERT_EQ(slot.primaryContainer()->load(), StateObject::object());

    slot.save({{"x", 1}}, 5);
    slot.ensureInitialized();
    ASSERT_EQ(slot.primaryContainer()->load()["x"], 1);
}

TEST_F(SaveSlotTest, saveWritesPrimaryAndBackup)
{
    slot.save({{"n", 1}}, 5);
    ASSERT_EQ(slot.primaryContainer()->load()["n"], 1);
    ASSERT_EQ(slot.backups().size(), 1u);
    ASSERT_EQ(slot.backupContainers().front()->load()["n"], 1);
}

TEST_F(SaveSlotTest, backupsAreNewestFirst)
{
    for (int i = 0; i < 5; i++)
        slot.save({{"n", i}}, 10);

    auto containers = slot.backupContainers();
    ASSERT_EQ(containers.size(), 5u);
    for (int i = 0; i < 5; i++)
        ASSERT_EQ(containers[i]->load()["n"], 4 - i);
}

TEST_F(SaveSlotTest, backupIdsAreOrderedNumerically)
{
    writeFile(slot.backupPath("999"), encodeState({{"n", "old"}}));
    writeFile(slot.backupPath("1000"), encodeState({{"n", "new"}}));
    writeFile(slot.backupPath("junk"), "ignored");

    ASSERT_EQ(slot.backups(), (std::vector<std::string>{"1000", "999"}));
}

TEST_F(SaveSlotTest, pruneKeepsTheNewest)
{
    for (int i = 0; i < 25; i++)
        slot.save({{"n", i}}, 20);

    auto ids = slot.backups();
    ASSERT_EQ(ids.size(), 20u);
    ASSERT_EQ(slot.backupContainers().back()->load()["n"], 5);

    slot.prune(3);
    ASSERT_EQ(slot.backups(), (std::vector<std::string>{ids[0], ids[1], ids[2]}));
}

TEST_F(SaveSlotTest, restoreFromReplacesPrimaryAndRestarts)
{
    slot.save({{"n", "before"}}, 5);

    testing::MemoryAssetStore source;
    source.put("assets/a.png", "A");
    BufferEntrySink sink;
    writeFullBackup(sink, source, {{"n", "after"}});

    testing::MemoryAssetStore target;
    StringSource in(sink.s);
    bool restarted = false;
    auto res = slot.restoreFrom(in, target, [&]() { restarted = true; });

    ASSERT_TRUE(restarted);
    ASSERT_EQ(res.assetsRestored, 1u);
    ASSERT_EQ(target.load("assets/a.png"), "A");
    ASSERT_EQ(slot.primaryContainer()->load()["n"], "after");
}

TEST_F(SaveSlotTest, failedRestoreKeepsPrimaryAndDoesNotRestart)
{
    slot.save({{"n", "before"}}, 5);

    std::string bytes("\x05\0\0\0" "ab", 6);
    StringSource in(bytes);
    testing::MemoryAssetStore target;
    bool restarted = false;
    ASSERT_THROW(slot.restoreFrom(in, target, [&]() { restarted = true; }), StructuralError);
    ASSERT_FALSE(restarted);
    ASSERT_EQ(slot.primaryContainer()->load()["n"], "before");
}

TEST_F(SaveSlotTest, truncationAfterTheStateRecordKeepsPrimary)
{
    slot.save({{"n", "before"}}, 5);

    BufferEntrySink sink;
    {
        ChunkedBackupWriter writer(sink);
        writer.writeRecord(backupStateRecord, encodeState({{"n", "x"}}));
        writer.close();
    }
    auto bytes = sink.s + std::string("\x05\0\0\0" "ab", 6);

    StringSource in(bytes);
    testing::MemoryAssetStore target;
    bool restarted = false;
    ASSERT_THROW(slot.restoreFrom(in, target, [&]() { restarted = true; }), StructuralError);
    ASSERT_FALSE(restarted);
    ASSERT_EQ(slot.primaryContainer()->load()["n"], "before");
    ASSERT_EQ(slot.backups().size(), 1u);
}

} // namespace charx
