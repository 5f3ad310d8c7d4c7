#include "charx/bundle/archive-reader.hh"
#include "charx/bundle/tests/archives.hh"
#include "charx/store/tests/memory-asset-store.hh"
#include "charx/util/file-system.hh"
#include "charx/util/hash.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include <fcntl.h>

namespace charx {

using testing::Entries;
using testing::makeArchive;
using testing::MemoryAssetStore;

static const std::string png = std::string("\x89PNG\r\n\x1a\n", 8) + "image data";

static bool isReady(const std::shared_future<void> & f)
{
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

/* ----------------------------------------------------------------------------
 * routing of entries
 * --------------------------------------------------------------------------*/

TEST(ArchiveReader, routesMetadataAndAssets)
{
    MemoryAssetStore store;
    auto zip = makeArchive({
        {"card.json", R"({"spec":"chara_card_v3"})"},
        {"module.risum", "module bytes"},
        {"assets/icon/main.png", png},
        {"x_meta/notes.json", "{}"},
        {"manifest.json", "{}"},
    });

    ArchiveReader reader(store);
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.cardData(), R"({"spec":"chara_card_v3"})");
    ASSERT_EQ(reader.moduleData(), "module bytes");
    ASSERT_EQ(reader.manifestData(), "{}");
    ASSERT_TRUE(reader.excludedFiles().empty());

    auto assets = reader.assets();
    ASSERT_EQ(assets.size(), 1u);
    ASSERT_EQ(assets.at("assets/icon/main.png"), "assets/" + sha256Base16(png) + ".png");
    ASSERT_EQ(store.saves.load(), 1u);
}

TEST(ArchiveReader, customMetadataEntry)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"character.json", "{}"}, {"card.json", "not metadata here"}});

    ArchiveReader reader(store, {.metadataEntry = "character.json"});
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.cardData(), "{}");
    ASSERT_TRUE(reader.assets().empty());
}

TEST(ArchiveReader, archiveWithoutAssetsCompletes)
{
    MemoryAssetStore store;
    ArchiveReader reader(store);
    reader.parse(makeArchive({{"card.json", "{}"}}));
    ASSERT_TRUE(isReady(reader.done()));
    reader.done().get();
    ASSERT_EQ(store.saves.load(), 0u);
}

/* ----------------------------------------------------------------------------
 * chunked input
 * --------------------------------------------------------------------------*/

TEST(ArchiveReader, smallChunksGiveTheSameResult)
{
    Entries entries{{"card.json", R"({"a":1})"}};
    for (int i = 0; i < 20; i++)
        entries.emplace_back(fmt("assets/%d.bin", i), std::string(1000 + i, 'a' + i));
    auto zip = makeArchive(entries);

    for (size_t chunkSize : {1, 7, 512, 1 << 20}) {
        MemoryAssetStore store;
        ArchiveReader reader(store, {.chunkSize = chunkSize, .maxConcurrentSaves = 3, .maxQueuedSaves = 2});
        reader.parse(zip);
        reader.done().get();
        ASSERT_EQ(reader.cardData(), R"({"a":1})") << "chunk size " << chunkSize;
        ASSERT_EQ(reader.assets().size(), 20u) << "chunk size " << chunkSize;
        ASSERT_EQ(store.load(reader.assets().at("assets/7.bin")), std::string(1007, 'h'));
    }
}

TEST(ArchiveReader, outstandingSavesStayBoundedWithinOneChunk)
{
    Entries entries{{"card.json", "{}"}};
    for (int i = 0; i < 40; i++)
        entries.emplace_back(fmt("assets/%d.bin", i), fmt("asset %d", i));
    auto zip = makeArchive(entries);

    MemoryAssetStore store;
    store.onSave = [](std::string_view, std::string_view) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    };

    /* Just before the asset numbered `done` completed, `total - done + 1`
       assets were outstanding. */
    size_t peak = 0;
    ArchiveReader reader(
        store,
        {.chunkSize = zip.size(),
         .maxConcurrentSaves = 1,
         .maxQueuedSaves = 3,
         .onProgress = [&](size_t done, size_t total) { peak = std::max(peak, total - done + 1); }});
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.assets().size(), 40u);
    ASSERT_LE(peak, 3u);
}

TEST(ArchiveReader, parseFromDescriptor)
{
    auto zip = makeArchive({{"card.json", "{}"}, {"a.png", png}});
    AutoDelete tmpDir(createTempDir());
    auto path = tmpDir.path() + "/card.charx";
    writeFile(path, zip);

    AutoCloseFD fd = open(path.c_str(), O_RDONLY);
    ASSERT_TRUE(fd);

    MemoryAssetStore store;
    ArchiveReader reader(store);
    reader.parse(fd.get());
    reader.done().get();
    ASSERT_EQ(reader.assets().size(), 1u);
}

/* ----------------------------------------------------------------------------
 * size cap
 * --------------------------------------------------------------------------*/

TEST(ArchiveReader, entriesAboveTheCapAreExcluded)
{
    MemoryAssetStore store;
    auto zip = makeArchive({
        {"card.json", "{}"},
        {"small.bin", std::string(10, 's')},
        {"exact.bin", std::string(16, 'e')},
        {"large.bin", std::string(17, 'l')},
    });

    ArchiveReader reader(store, {.maxAssetSize = 16});
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.excludedFiles(), Strings{"large.bin"});
    auto assets = reader.assets();
    ASSERT_EQ(assets.size(), 2u);
    ASSERT_TRUE(assets.count("small.bin"));
    ASSERT_TRUE(assets.count("exact.bin"));
}

TEST(ArchiveReader, capAppliesToDeflatedEntries)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"card.json", "{}"}, {"huge.bin", std::string(1 << 20, 'h')}}, 9);
    ASSERT_LT(zip.size(), 100000u);

    ArchiveReader reader(store, {.maxAssetSize = 1000});
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.excludedFiles(), Strings{"huge.bin"});
    ASSERT_TRUE(reader.assets().empty());
}

/* ----------------------------------------------------------------------------
 * failures
 * --------------------------------------------------------------------------*/

TEST(ArchiveReader, failingAssetDoesNotStopTheOthers)
{
    MemoryAssetStore store;
    store.onSave = [](std::string_view data, std::string_view nameHint) {
        if (nameHint == "bad.bin")
            throw AssetStoreError("disk full");
    };

    auto zip = makeArchive({{"card.json", "{}"}, {"a.bin", "a"}, {"bad.bin", "b"}, {"c.bin", "c"}});

    ArchiveReader reader(store);
    reader.parse(zip);

    try {
        reader.done().get();
        FAIL() << "expected AssetPipelineFailure";
    } catch (AssetPipelineFailure & e) {
        ASSERT_EQ(e.failures.size(), 1u);
        ASSERT_EQ(e.failures[0].first, "bad.bin");
        ASSERT_THAT(e.failures[0].second, ::testing::HasSubstr("disk full"));
    }

    ASSERT_EQ(reader.cardData(), "{}");
    auto assets = reader.assets();
    ASSERT_EQ(assets.size(), 2u);
    ASSERT_TRUE(assets.count("a.bin"));
    ASSERT_TRUE(assets.count("c.bin"));
}

TEST(ArchiveReader, emptyInputIsStructuralError)
{
    MemoryAssetStore store;
    ArchiveReader reader(store);
    ASSERT_THROW(reader.parse(std::string_view()), StructuralError);
    ASSERT_THROW(reader.done().get(), StructuralError);
}

TEST(ArchiveReader, garbageIsStructuralError)
{
    MemoryAssetStore store;
    ArchiveReader reader(store);
    ASSERT_THROW(reader.parse(std::string_view("this is not a zip file at all, just some text")), StructuralError);
    ASSERT_THROW(reader.done().get(), StructuralError);
}

TEST(ArchiveReader, truncatedArchiveIsStructuralError)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"card.json", "{}"}, {"a.bin", std::string(5000, 'a')}});
    zip.resize(zip.size() / 2);

    ArchiveReader reader(store);
    ASSERT_THROW(reader.parse(zip), StructuralError);
}

TEST(ArchiveReader, requireManifest)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"card.json", "{}"}});

    ArchiveReader reader(store, {.requireManifest = true});
    ASSERT_THROW(reader.parse(zip), ManifestMissing);
    ASSERT_THROW(reader.done().get(), ManifestMissing);

    ArchiveReader reader2(store, {.requireManifest = true});
    reader2.parse(makeArchive({{"card.json", "{}"}, {"manifest.json", "{}"}}));
    reader2.done().get();
}

TEST(ArchiveReader, parsesOnlyOnce)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"card.json", "{}"}});
    ArchiveReader reader(store);
    reader.parse(zip);
    ASSERT_THROW(reader.parse(zip), Error);
}

TEST(ArchiveReader, doneBeforeParseThrows)
{
    MemoryAssetStore store;
    ArchiveReader reader(store);
    ASSERT_THROW(reader.done(), Error);
}

/* ----------------------------------------------------------------------------
 * hash-only imports and the hub signal
 * --------------------------------------------------------------------------*/

TEST(ArchiveReader, hashOnlyWritesNothing)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"card.json", "{}"}, {"voice.mp3", "ID3..."}});

    ArchiveReader reader(store, {.hashOnly = true, .hashSignal = "signal"});
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(reader.assets().at("voice.mp3"), "assets/" + sha256Base16("ID3...") + ".png");
    ASSERT_TRUE(store.keys().empty());
}

TEST(ArchiveReader, hashSignalIsSavedAfterTheInput)
{
    MemoryAssetStore store;
    auto zip = makeArchive({{"card.json", "{}"}});

    ArchiveReader reader(store, {.hashSignal = sha256Base16(zip)});
    reader.parse(zip);
    reader.done().get();

    ASSERT_EQ(store.keys(), Strings{"assets/" + sha256Base16(sha256Base16(zip)) + ".bin"});
}

/* ----------------------------------------------------------------------------
 * firstImage
 * --------------------------------------------------------------------------*/

TEST(ArchiveReader, firstImage)
{
    auto zip = makeArchive({{"card.json", "{}"}, {"a.webp", "w"}, {"b.PNG", "first"}, {"c.jpg", "second"}});
    StringSource source(zip);
    ASSERT_EQ(ArchiveReader::firstImage(source), "first");
}

TEST(ArchiveReader, firstImageNone)
{
    auto zip = makeArchive({{"card.json", "{}"}});
    StringSource source(zip);
    ASSERT_EQ(ArchiveReader::firstImage(source), std::nullopt);
}

} // namespace charx
