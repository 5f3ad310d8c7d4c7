#pragma once
///@file

#include "charx/bundle/entry-sink.hh"
#include "charx/bundle/manifest.hh"

#include <functional>

namespace charx {

/**
 * An inlay (image, audio or video embedded in a chat) as returned by
 * an `InlayLookup`.
 */
struct InlayAsset
{
    std::string data;
    std::string ext;
    /// Derived from `ext` if not set.
    std::optional<AssetKind> kind;
    std::optional<std::string> name;
    std::optional<uint64_t> width, height;
};

/**
 * Resolve an inlay id. Returns std::nullopt if the inlay is unknown.
 */
typedef std::function<std::optional<InlayAsset>(const std::string & id)> InlayLookup;

struct ChatZipExportResult
{
    Manifest manifest;
    /// Inlays that could not be resolved and were left out.
    Strings missingInlays;
};

/**
 * Write a chat archive to `sink`: `chat.json` holding `payload`, then
 * every distinct non-empty inlay as `inlays/<id>.<ext>`, then
 * `manifest.json`. The sink is finished on success.
 */
ChatZipExportResult exportChatZip(
    EntrySink & sink,
    std::string_view baseName,
    const nlohmann::json & payload,
    const Strings & inlayIds,
    const InlayLookup & lookup);

} // namespace charx
