#pragma once
///@file

#include "charx/store/asset-format.hh"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace charx {

struct ManifestAsset
{
    /// Entry name inside the container.
    std::string file;
    std::string ext;
    AssetKind kind = AssetKind::Image;
    std::optional<std::string> name;
    std::optional<uint64_t> width, height;

    bool operator==(const ManifestAsset &) const = default;
};

/**
 * The index written as the last entry of an exported container. Its
 * presence shows that the container was written completely.
 */
struct Manifest
{
    std::string formatTag = "risuChatZip";
    uint64_t version = 1;
    std::string payloadEntryName = "chat.json";
    std::string assetDir = "inlays/";
    std::map<std::string, ManifestAsset> assets;

    /**
     * Render the manifest with keys in their canonical order, indented
     * by two spaces.
     */
    std::string render() const;

    nlohmann::ordered_json toJSON() const;

    /**
     * Parse a manifest. Both the `chatFile`/`inlaysDir`/`inlays` and the
     * `payloadEntryName`/`assetsDir`/`assets` spellings are accepted.
     *
     * @throws StructuralError if the document is not a valid manifest.
     */
    static Manifest parse(std::string_view s);

    bool operator==(const Manifest &) const = default;
};

} // namespace charx
