#include "charx/util/file-system.hh"

#include <gtest/gtest.h>

namespace charx {

/* ----------------------------------------------------------------------------
 * canonPath
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesTrailingSlashes)
{
    ASSERT_EQ(canonPath("/this/is/a/path//"), "/this/is/a/path");
}

TEST(canonPath, removesDots)
{
    ASSERT_EQ(canonPath("/this/./is/a/path/./"), "/this/is/a/path");
}

TEST(canonPath, removesDots2)
{
    ASSERT_EQ(canonPath("/this/a/../is/a/path/"), "/this/is/a/path");
}

TEST(canonPath, dotDotAboveRootStaysAtRoot)
{
    ASSERT_EQ(canonPath("/../../etc"), "/etc");
}

TEST(canonPath, rejectsRelativePaths)
{
    ASSERT_THROW(canonPath("relative/path"), Error);
}

TEST(canonPath, rejectsTheEmptyPath)
{
    ASSERT_THROW(canonPath(""), Error);
}

/* ----------------------------------------------------------------------------
 * dirOf / baseNameOf / isInDir
 * --------------------------------------------------------------------------*/

TEST(dirOf, returnsEverythingBeforeLastSlash)
{
    ASSERT_EQ(dirOf("/dir/file"), "/dir");
    ASSERT_EQ(dirOf("/file"), "/");
    ASSERT_EQ(dirOf("file"), ".");
}

TEST(baseNameOf, ignoresTrailingSlashes)
{
    ASSERT_EQ(baseNameOf("/dir/file"), "file");
    ASSERT_EQ(baseNameOf("/dir/"), "dir");
    ASSERT_EQ(baseNameOf(""), "");
}

TEST(isInDir, strictlyBelow)
{
    ASSERT_TRUE(isInDir("/root/assets/a.png", "/root"));
    ASSERT_FALSE(isInDir("/root", "/root"));
    ASSERT_FALSE(isInDir("/rootkit/a.png", "/root"));
    ASSERT_FALSE(isInDir("/etc/passwd", "/root"));
}

/* ----------------------------------------------------------------------------
 * reading and writing files
 * --------------------------------------------------------------------------*/

TEST(writeFileAtomic, replacesExistingContents)
{
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() + "/database.bin";

    writeFile(path, "old");
    writeFileAtomic(path, "new contents");

    ASSERT_EQ(readFile(path), "new contents");
    ASSERT_EQ(readDirectoryNames(tmpDir.path()), Strings{"database.bin"});
}

TEST(writeFile, overwritesAndKeepsNulBytes)
{
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() + "/f";
    writeFile(path, "a much longer first version");
    writeFile(path, std::string_view("a\0b", 3));
    ASSERT_EQ(readFile(path), std::string("a\0b", 3));
}

TEST(readFile, missingFileThrows)
{
    AutoDelete tmpDir(createTempDir());
    ASSERT_THROW(readFile(tmpDir.path() + "/missing"), SysError);
}

TEST(readDirectoryNames, sortedRegularFilesOnly)
{
    AutoDelete tmpDir(createTempDir());
    writeFile(tmpDir.path() + "/b", "");
    writeFile(tmpDir.path() + "/a", "");
    createDirs(tmpDir.path() + "/sub/dir");

    ASSERT_EQ(readDirectoryNames(tmpDir.path()), (Strings{"a", "b"}));
}

/* ----------------------------------------------------------------------------
 * AutoDelete
 * --------------------------------------------------------------------------*/

TEST(AutoDelete, deletesOnScopeExit)
{
    Path dir;
    {
        AutoDelete tmpDir(createTempDir());
        dir = tmpDir.path();
        writeFile(dir + "/f", "x");
        ASSERT_TRUE(pathExists(dir));
    }
    ASSERT_FALSE(pathExists(dir));
}

TEST(AutoDelete, cancelKeepsThePath)
{
    Path dir;
    {
        AutoDelete tmpDir(createTempDir());
        dir = tmpDir.path();
        tmpDir.cancel();
    }
    ASSERT_TRUE(pathExists(dir));
    deletePath(dir);
    ASSERT_FALSE(pathExists(dir));
}

} // namespace charx
