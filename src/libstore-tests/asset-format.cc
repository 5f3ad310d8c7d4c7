#include "charx/store/asset-format.hh"

#include <gtest/gtest.h>

namespace charx {

/* ----------------------------------------------------------------------------
 * sniffImageFormat
 * --------------------------------------------------------------------------*/

TEST(sniffImageFormat, png)
{
    ASSERT_EQ(sniffImageFormat(std::string_view("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16)), ImageFormat::PNG);
}

TEST(sniffImageFormat, jpegNeedsEndMarker)
{
    ASSERT_EQ(sniffImageFormat("\xff\xd8\xff\xe0 some data \xff\xd9"), ImageFormat::JPEG);
    ASSERT_EQ(sniffImageFormat("\xff\xd8\xff\xe0 truncated"), ImageFormat::Unknown);
    ASSERT_EQ(sniffImageFormat("\xff\xd8"), ImageFormat::Unknown);
}

TEST(sniffImageFormat, gifBothVersions)
{
    ASSERT_EQ(sniffImageFormat("GIF87a...."), ImageFormat::GIF);
    ASSERT_EQ(sniffImageFormat("GIF89a...."), ImageFormat::GIF);
    ASSERT_EQ(sniffImageFormat("GIF90a...."), ImageFormat::Unknown);
}

TEST(sniffImageFormat, bmp)
{
    ASSERT_EQ(sniffImageFormat("BM6\x01"), ImageFormat::BMP);
}

TEST(sniffImageFormat, avifBrandAtOffsetFour)
{
    ASSERT_EQ(sniffImageFormat(std::string_view("\0\0\0\x1c" "ftypavif\0\0\0\0", 16)), ImageFormat::AVIF);
}

TEST(sniffImageFormat, webpNeedsRiffAndWebpTags)
{
    ASSERT_EQ(sniffImageFormat(std::string_view("RIFF\x24\0\0\0WEBPVP8 ", 16)), ImageFormat::WEBP);
    ASSERT_EQ(sniffImageFormat(std::string_view("RIFF\x24\0\0\0WAVEfmt ", 16)), ImageFormat::Unknown);
}

TEST(sniffImageFormat, shortOrEmptyInput)
{
    ASSERT_EQ(sniffImageFormat(""), ImageFormat::Unknown);
    ASSERT_EQ(sniffImageFormat("RIFF"), ImageFormat::Unknown);
    ASSERT_EQ(sniffImageFormat("plain text"), ImageFormat::Unknown);
}

TEST(imageFormatExtension, extensions)
{
    ASSERT_EQ(imageFormatExtension(ImageFormat::JPEG), "jpg");
    ASSERT_EQ(imageFormatExtension(ImageFormat::WEBP), "webp");
    ASSERT_EQ(imageFormatExtension(ImageFormat::Unknown), "");
}

/* ----------------------------------------------------------------------------
 * extensions and kinds
 * --------------------------------------------------------------------------*/

TEST(extensionOf, lastComponentOnly)
{
    ASSERT_EQ(extensionOf("dir.d/file"), "");
    ASSERT_EQ(extensionOf("dir/file.PNG"), "png");
    ASSERT_EQ(extensionOf("archive.tar.gz"), "gz");
    ASSERT_EQ(extensionOf("noext"), "");
}

TEST(normaliseExtension, stripsDotAndLowercases)
{
    ASSERT_EQ(normaliseExtension(".WebP"), "webp");
    ASSERT_EQ(normaliseExtension("mp3"), "mp3");
}

TEST(assetKindFromExtension, classifies)
{
    ASSERT_EQ(assetKindFromExtension("mp3"), AssetKind::Audio);
    ASSERT_EQ(assetKindFromExtension(".FLAC"), AssetKind::Audio);
    ASSERT_EQ(assetKindFromExtension("webm"), AssetKind::Video);
    ASSERT_EQ(assetKindFromExtension("png"), AssetKind::Image);
    ASSERT_EQ(assetKindFromExtension("whatever"), AssetKind::Image);
    ASSERT_EQ(showAssetKind(AssetKind::Video), "video");
}

} // namespace charx
