#include "charx/store/local-asset-store.hh"
#include "charx/util/file-system.hh"
#include "charx/util/hash.hh"

#include <gtest/gtest.h>

namespace charx {

class LocalAssetStoreTest : public ::testing::Test
{
protected:
    AutoDelete tmpDir{createTempDir()};
    LocalAssetStore store{tmpDir.path() + "/store"};

    static inline const std::string png = std::string("\x89PNG\r\n\x1a\n", 8) + "pixels";
};

TEST_F(LocalAssetStoreTest, createsRootDirectory)
{
    ASSERT_TRUE(pathExists(tmpDir.path() + "/store"));
    ASSERT_EQ(store.rootDir(), canonPath(tmpDir.path() + "/store"));
}

TEST_F(LocalAssetStoreTest, saveIsContentAddressed)
{
    auto id = store.save(png, "whatever.bin");
    ASSERT_EQ(id, "assets/" + sha256Base16(png) + ".png");
    ASSERT_EQ(store.save(png), id);
    ASSERT_EQ(store.load(id), png);
    ASSERT_EQ(store.keys(), Strings{id});
}

TEST_F(LocalAssetStoreTest, unknownContentTakesExtensionFromHint)
{
    ASSERT_EQ(store.save("ID3 audio", "voice/line.MP3"), "assets/" + sha256Base16("ID3 audio") + ".mp3");
    ASSERT_EQ(store.save("opaque", "noext"), "assets/" + sha256Base16("opaque") + ".bin");
}

TEST_F(LocalAssetStoreTest, loadMissingThrowsAssetNotFound)
{
    ASSERT_THROW(store.load("assets/nope.png"), AssetNotFound);
}

TEST_F(LocalAssetStoreTest, putReplacesContents)
{
    store.put("assets/x.png", "one");
    store.put("assets/x.png", "two");
    ASSERT_TRUE(store.has("assets/x.png"));
    ASSERT_EQ(store.load("assets/x.png"), "two");
}

TEST_F(LocalAssetStoreTest, keysAreSortedAndRecursive)
{
    store.put("b/deep/file.png", "1");
    store.put("a.png", "2");
    store.put("assets/c.webp", "3");
    ASSERT_EQ(store.keys(), (Strings{"a.png", "assets/c.webp", "b/deep/file.png"}));
}

TEST_F(LocalAssetStoreTest, rejectsKeysOutsideTheRoot)
{
    ASSERT_THROW(store.put("../escape.png", "x"), AssetStoreError);
    ASSERT_THROW(store.put("assets/../../escape.png", "x"), AssetStoreError);
    ASSERT_THROW(store.put("/etc/passwd", "x"), AssetStoreError);
    ASSERT_THROW(store.put("", "x"), AssetStoreError);
    ASSERT_THROW(store.has("."), AssetStoreError);
    ASSERT_FALSE(pathExists(tmpDir.path() + "/escape.png"));
}

/* ----------------------------------------------------------------------------
 * HashOnlyAssetStore
 * --------------------------------------------------------------------------*/

TEST_F(LocalAssetStoreTest, hashOnlyStoreWritesNothing)
{
    HashOnlyAssetStore hashOnly(store);
    auto id = hashOnly.save("not an image", "clip.mp4");
    ASSERT_EQ(id, "assets/" + sha256Base16("not an image") + ".png");
    ASSERT_TRUE(store.keys().empty());
    ASSERT_FALSE(hashOnly.has(id));
}

TEST_F(LocalAssetStoreTest, hashOnlyStoreForwardsReads)
{
    store.put("assets/k.png", "v");
    HashOnlyAssetStore hashOnly(store);
    ASSERT_EQ(hashOnly.load("assets/k.png"), "v");
    ASSERT_EQ(hashOnly.keys(), Strings{"assets/k.png"});
}

} // namespace charx
