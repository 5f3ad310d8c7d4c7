#include "charx/bundle/chat-zip-export.hh"
#include "charx/bundle/archive-reader.hh"
#include "charx/store/tests/memory-asset-store.hh"

#include <gtest/gtest.h>

namespace charx {

static const nlohmann::json payload = nlohmann::json::parse(R"({"messages": [{"role": "user", "data": "hi {{inlay::abc}}"}]})");

static std::optional<InlayAsset> lookupSample(const std::string & id)
{
    if (id == "abc")
        return InlayAsset{.data = "png bytes", .ext = "png"};
    if (id == "snd")
        return InlayAsset{.data = "ogg bytes", .ext = ".OGG", .name = "voice", .width = {}, .height = {}};
    if (id == "empty")
        return InlayAsset{.data = "", .ext = "png"};
    if (id == "broken")
        throw AssetNotFound("asset '%s' is gone", id);
    if (id == "noext")
        return InlayAsset{.data = "raw"};
    return std::nullopt;
}

TEST(exportChatZip, writesPayloadInlaysAndManifest)
{
    BufferEntrySink sink;
    auto res = exportChatZip(sink, "chat", payload, {"abc", "snd", "abc", "", "noext"}, lookupSample);

    ASSERT_TRUE(sink.isClosed());
    ASSERT_TRUE(res.missingInlays.empty());
    ASSERT_EQ(res.manifest.assets.size(), 3u);
    ASSERT_EQ(res.manifest.assets.at("abc").file, "inlays/abc.png");
    ASSERT_EQ(res.manifest.assets.at("snd").file, "inlays/snd.ogg");
    ASSERT_EQ(res.manifest.assets.at("snd").kind, AssetKind::Audio);
    ASSERT_EQ(res.manifest.assets.at("snd").name, "voice");
    ASSERT_EQ(res.manifest.assets.at("noext").file, "inlays/noext.png");

    /* Read it back: the manifest is the last entry and matches. */
    testing::MemoryAssetStore store;
    ArchiveReader reader(store, {.metadataEntry = "chat.json", .requireManifest = true});
    reader.parse(sink.s);
    reader.done().get();

    ASSERT_EQ(nlohmann::json::parse(*reader.cardData()), payload);
    ASSERT_EQ(Manifest::parse(*reader.manifestData()), res.manifest);

    auto assets = reader.assets();
    ASSERT_EQ(assets.size(), 3u);
    ASSERT_EQ(store.load(assets.at("inlays/snd.ogg")), "ogg bytes");
}

TEST(exportChatZip, missingInlaysAreLeftOut)
{
    BufferEntrySink sink;
    auto res = exportChatZip(sink, "chat", payload, {"abc", "gone", "empty", "broken"}, lookupSample);

    ASSERT_EQ(res.missingInlays, (Strings{"gone", "empty", "broken"}));
    ASSERT_EQ(res.manifest.assets.size(), 1u);
    ASSERT_TRUE(sink.isClosed());
}

TEST(exportChatZip, noInlays)
{
    BufferEntrySink sink;
    auto res = exportChatZip(sink, "chat", payload, {}, lookupSample);
    ASSERT_TRUE(res.manifest.assets.empty());

    testing::MemoryAssetStore store;
    ArchiveReader reader(store, {.metadataEntry = "chat.json", .requireManifest = true});
    reader.parse(sink.s);
    reader.done().get();
    ASSERT_TRUE(reader.assets().empty());
}

} // namespace charx
