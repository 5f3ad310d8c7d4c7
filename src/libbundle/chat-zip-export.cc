#include "charx/bundle/chat-zip-export.hh"
#include "charx/bundle/archive-writer.hh"
#include "charx/util/logging.hh"

namespace charx {

ChatZipExportResult exportChatZip(
    EntrySink & sink,
    std::string_view baseName,
    const nlohmann::json & payload,
    const Strings & inlayIds,
    const InlayLookup & lookup)
{
    Activity act(*logger, lvlTalkative, actExportArchive, fmt("exporting chat '%s'", baseName));

    ChatZipExportResult res;
    auto & manifest = res.manifest;

    ArchiveWriter writer(sink);
    writer.init();

    manifest.payloadEntryName = writer.write("chat.json", payload.dump(2));

    std::vector<std::string> ids;
    StringSet seen;
    for (auto & id : inlayIds)
        if (!id.empty() && seen.insert(id).second)
            ids.push_back(id);

    size_t done = 0;
    for (auto & id : ids) {
        act.progress(done++, ids.size());

        std::optional<InlayAsset> inlay;
        try {
            inlay = lookup(id);
        } catch (Error & e) {
            warn("could not look up inlay '%s': %s", id, e.message());
        }

        if (!inlay || inlay->data.empty()) {
            res.missingInlays.push_back(id);
            continue;
        }

        auto ext = normaliseExtension(inlay->ext);
        if (ext.empty())
            ext = "png";

        auto file = writer.write(manifest.assetDir + id + "." + ext, inlay->data);
        manifest.assets.insert_or_assign(
            id,
            ManifestAsset{
                .file = file,
                .ext = ext,
                .kind = inlay->kind ? *inlay->kind : assetKindFromExtension(ext),
                .name = inlay->name,
                .width = inlay->width,
                .height = inlay->height,
            });
    }
    if (!ids.empty())
        act.progress(done, ids.size());

    writer.write("manifest.json", manifest.render());
    writer.end();

    if (!res.missingInlays.empty())
        warn("%d inlays were missing and left out of the archive", res.missingInlays.size());

    return res;
}

} // namespace charx
