#include "charx/store/asset-format.hh"
#include "charx/util/util.hh"

namespace charx {

ImageFormat sniffImageFormat(std::string_view data)
{
    auto at = [&](size_t offset, std::string_view magic) { return data.substr(offset).starts_with(magic); };

    if (data.size() >= 4 && at(0, "\xff\xd8") && data.ends_with("\xff\xd9"))
        return ImageFormat::JPEG;
    if (at(0, "\x89PNG\r\n\x1a\n"))
        return ImageFormat::PNG;
    if (at(0, "GIF87a") || at(0, "GIF89a"))
        return ImageFormat::GIF;
    if (at(0, "BM"))
        return ImageFormat::BMP;
    if (data.size() >= 12 && at(4, "ftypavif"))
        return ImageFormat::AVIF;
    if (data.size() >= 12 && at(0, "RIFF") && at(8, "WEBP"))
        return ImageFormat::WEBP;
    return ImageFormat::Unknown;
}

std::string_view imageFormatExtension(ImageFormat format)
{
    switch (format) {
    case ImageFormat::JPEG:
        return "jpg";
    case ImageFormat::PNG:
        return "png";
    case ImageFormat::GIF:
        return "gif";
    case ImageFormat::BMP:
        return "bmp";
    case ImageFormat::AVIF:
        return "avif";
    case ImageFormat::WEBP:
        return "webp";
    case ImageFormat::Unknown:
        return "";
    }
    unreachable();
}

std::string_view showImageFormat(ImageFormat format)
{
    switch (format) {
    case ImageFormat::JPEG:
        return "JPEG";
    case ImageFormat::PNG:
        return "PNG";
    case ImageFormat::GIF:
        return "GIF";
    case ImageFormat::BMP:
        return "BMP";
    case ImageFormat::AVIF:
        return "AVIF";
    case ImageFormat::WEBP:
        return "WEBP";
    case ImageFormat::Unknown:
        return "Unknown";
    }
    unreachable();
}

AssetKind assetKindFromExtension(std::string_view ext)
{
    auto e = normaliseExtension(ext);
    if (e == "wav" || e == "mp3" || e == "ogg" || e == "flac")
        return AssetKind::Audio;
    if (e == "webm" || e == "mp4" || e == "mkv")
        return AssetKind::Video;
    return AssetKind::Image;
}

std::string_view showAssetKind(AssetKind kind)
{
    switch (kind) {
    case AssetKind::Image:
        return "image";
    case AssetKind::Audio:
        return "audio";
    case AssetKind::Video:
        return "video";
    }
    unreachable();
}

std::string normaliseExtension(std::string_view ext)
{
    if (ext.starts_with('.'))
        ext.remove_prefix(1);
    return toLower(std::string(ext));
}

std::string extensionOf(std::string_view name)
{
    auto slash = name.rfind('/');
    if (slash != name.npos)
        name.remove_prefix(slash + 1);
    auto dot = name.rfind('.');
    if (dot == name.npos)
        return "";
    return normaliseExtension(name.substr(dot + 1));
}

} // namespace charx
