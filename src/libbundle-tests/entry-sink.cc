#include "charx/bundle/entry-sink.hh"
#include "charx/util/file-system.hh"

#include <gtest/gtest.h>

namespace charx {

TEST(BufferEntrySink, collectsChunksInOrder)
{
    BufferEntrySink sink;
    sink("abc");
    sink("");
    sink("def");
    ASSERT_EQ(sink.s, "abcdef");
    ASSERT_EQ(sink.bytesWritten(), 6u);
    ASSERT_FALSE(sink.isClosed());
}

TEST(BufferEntrySink, writeAfterFinishThrows)
{
    BufferEntrySink sink;
    sink("abc");
    sink.finish();
    ASSERT_TRUE(sink.isClosed());
    ASSERT_THROW(sink("more"), EntrySinkClosed);
    ASSERT_EQ(sink.s, "abc");
}

TEST(BufferEntrySink, finishIsIdempotent)
{
    BufferEntrySink sink;
    sink.finish();
    ASSERT_NO_THROW(sink.finish());
    ASSERT_TRUE(sink.isClosed());
}

class FileEntrySinkTest : public ::testing::Test
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

TEST_F(FileEntrySinkTest, finishMovesIntoPlace)
{
    auto path = tmpDir + "/out.charx";
    {
        FileEntrySink sink(path);
        ASSERT_EQ(sink.getPath(), path);
        sink("hello ");
        sink("world");
        ASSERT_FALSE(pathExists(path));
        sink.finish();
    }
    ASSERT_EQ(readFile(path), "hello world");
    ASSERT_EQ(readDirectoryNames(tmpDir), Strings{"out.charx"});
}

TEST_F(FileEntrySinkTest, unfinishedSinkLeavesNothing)
{
    auto path = tmpDir + "/out.charx";
    {
        FileEntrySink sink(path);
        sink(std::string(100000, 'x'));
    }
    ASSERT_FALSE(pathExists(path));
    ASSERT_TRUE(readDirectoryNames(tmpDir).empty());
}

TEST_F(FileEntrySinkTest, unfinishedSinkKeepsPreviousFile)
{
    auto path = tmpDir + "/out.charx";
    writeFile(path, "old");
    {
        FileEntrySink sink(path);
        sink("new");
    }
    ASSERT_EQ(readFile(path), "old");
}

TEST_F(FileEntrySinkTest, missingDirectory)
{
    ASSERT_THROW(FileEntrySink(tmpDir + "/no/such/dir/out.charx"), SysError);
}

TEST(StreamEntrySink, forwardsAndFlushes)
{
    StringSink out;
    StreamEntrySink sink(out);
    sink("abc");
    sink("def");
    sink.finish();
    ASSERT_EQ(out.s, "abcdef");
    ASSERT_THROW(sink("x"), EntrySinkClosed);
}

} // namespace charx
