#pragma once
///@file

#include <string>
#include <string_view>

namespace charx {

/**
 * Image container formats recognised by their leading magic bytes.
 */
enum class ImageFormat { JPEG, PNG, GIF, BMP, AVIF, WEBP, Unknown };

/**
 * Identify the image format of `data` from its magic bytes. JPEG
 * additionally requires the end-of-image marker at the very end.
 */
ImageFormat sniffImageFormat(std::string_view data);

/**
 * The conventional file extension (without dot) for `format`, or the
 * empty string for `ImageFormat::Unknown`.
 */
std::string_view imageFormatExtension(ImageFormat format);

std::string_view showImageFormat(ImageFormat format);

enum class AssetKind { Image, Audio, Video };

/**
 * Classify an asset by its file extension. Anything that is not a
 * known audio or video extension counts as an image.
 */
AssetKind assetKindFromExtension(std::string_view ext);

std::string_view showAssetKind(AssetKind kind);

/**
 * Normalise an extension: strip a leading dot and lower-case it.
 */
std::string normaliseExtension(std::string_view ext);

/**
 * The extension of the last path component of `name`, normalised, or
 * the empty string if it has none.
 */
std::string extensionOf(std::string_view name);

} // namespace charx
