#include "charx/bundle/manifest.hh"
#include "charx/bundle/errors.hh"

#include <gtest/gtest.h>

namespace charx {

static Manifest sampleManifest()
{
    Manifest m;
    m.assets["abc"] = ManifestAsset{.file = "inlays/abc.png", .ext = "png"};
    m.assets["voice"] = ManifestAsset{
        .file = "inlays/voice.mp3",
        .ext = "mp3",
        .kind = AssetKind::Audio,
        .name = "greeting",
    };
    m.assets["pic"] = ManifestAsset{.file = "inlays/pic.webp", .ext = "webp", .width = 640, .height = 480};
    return m;
}

TEST(Manifest, renderKeepsCanonicalKeyOrder)
{
    Manifest m;
    m.assets["abc"] = ManifestAsset{.file = "inlays/abc.png", .ext = "png"};

    ASSERT_EQ(
        m.render(),
        R"({
  "type": "risuChatZip",
  "ver": 1,
  "chatFile": "chat.json",
  "inlaysDir": "inlays/",
  "inlays": {
    "abc": {
      "file": "inlays/abc.png",
      "ext": "png",
      "type": "image"
    }
  }
})");
}

TEST(Manifest, emptyManifest)
{
    auto json = Manifest().toJSON();
    ASSERT_TRUE(json["inlays"].is_object());
    ASSERT_TRUE(json["inlays"].empty());
}

TEST(Manifest, optionalFieldsAreOmitted)
{
    auto json = sampleManifest().toJSON();
    ASSERT_FALSE(json["inlays"]["abc"].contains("name"));
    ASSERT_FALSE(json["inlays"]["abc"].contains("width"));
    ASSERT_EQ(json["inlays"]["voice"]["name"], "greeting");
    ASSERT_EQ(json["inlays"]["voice"]["type"], "audio");
    ASSERT_EQ(json["inlays"]["pic"]["width"], 640);
}

TEST(Manifest, parseWhatWasRendered)
{
    auto m = sampleManifest();
    ASSERT_EQ(Manifest::parse(m.render()), m);
}

TEST(Manifest, parseAlternativeSpelling)
{
    auto m = Manifest::parse(R"({
        "type": "risuChatZip",
        "ver": 1,
        "payloadEntryName": "chat.json",
        "assetsDir": "inlays/",
        "assets": {"x": {"file": "inlays/x.mp4", "ext": "mp4", "type": "video", "name": null}}
    })");
    ASSERT_EQ(m.assets.at("x").kind, AssetKind::Video);
    ASSERT_EQ(m.assets.at("x").name, std::nullopt);
}

TEST(Manifest, parseErrors)
{
    ASSERT_THROW(Manifest::parse("not json"), StructuralError);
    ASSERT_THROW(Manifest::parse("{}"), StructuralError);
    ASSERT_THROW(
        Manifest::parse(R"({"type":"risuChatZip","ver":1,"chatFile":"chat.json","inlaysDir":"inlays/",)"
                        R"("inlays":{"x":{"file":"f","ext":"e","type":"hologram"}}})"),
        StructuralError);
    ASSERT_THROW(
        Manifest::parse(R"({"type":"risuChatZip","ver":"one","chatFile":"c","inlaysDir":"i","inlays":{}})"),
        StructuralError);
}

} // namespace charx
