#include "charx/bundle/manifest.hh"
#include "charx/bundle/errors.hh"

namespace charx {

nlohmann::ordered_json Manifest::toJSON() const
{
    auto assetsJson = nlohmann::ordered_json::object();
    for (auto & [id, asset] : assets) {
        nlohmann::ordered_json a;
        a["file"] = asset.file;
        a["ext"] = asset.ext;
        a["type"] = std::string(showAssetKind(asset.kind));
        if (asset.name)
            a["name"] = *asset.name;
        if (asset.width)
            a["width"] = *asset.width;
        if (asset.height)
            a["height"] = *asset.height;
        assetsJson[id] = std::move(a);
    }

    nlohmann::ordered_json res;
    res["type"] = formatTag;
    res["ver"] = version;
    res["chatFile"] = payloadEntryName;
    res["inlaysDir"] = assetDir;
    res["inlays"] = std::move(assetsJson);
    return res;
}

std::string Manifest::render() const
{
    return toJSON().dump(2);
}

static const nlohmann::json & member(const nlohmann::json & obj, std::initializer_list<const char *> names)
{
    for (auto name : names) {
        auto i = obj.find(name);
        if (i != obj.end())
            return *i;
    }
    throw StructuralError("manifest has no '%s' field", *names.begin());
}

Manifest Manifest::parse(std::string_view s)
{
    try {
        auto json = nlohmann::json::parse(s);
        Manifest res;
        res.formatTag = member(json, {"type"}).get<std::string>();
        res.version = member(json, {"ver"}).get<uint64_t>();
        res.payloadEntryName = member(json, {"chatFile", "payloadEntryName"}).get<std::string>();
        res.assetDir = member(json, {"inlaysDir", "assetsDir"}).get<std::string>();
        for (auto & [id, a] : member(json, {"inlays", "assets"}).items()) {
            ManifestAsset asset;
            asset.file = member(a, {"file"}).get<std::string>();
            asset.ext = member(a, {"ext"}).get<std::string>();
            auto type = member(a, {"type"}).get<std::string>();
            if (type == "audio")
                asset.kind = AssetKind::Audio;
            else if (type == "video")
                asset.kind = AssetKind::Video;
            else if (type == "image")
                asset.kind = AssetKind::Image;
            else
                throw StructuralError("manifest asset '%s' has unknown type '%s'", id, type);
            if (auto i = a.find("name"); i != a.end() && !i->is_null())
                asset.name = i->get<std::string>();
            if (auto i = a.find("width"); i != a.end() && !i->is_null())
                asset.width = i->get<uint64_t>();
            if (auto i = a.find("height"); i != a.end() && !i->is_null())
                asset.height = i->get<uint64_t>();
            res.assets.insert_or_assign(id, std::move(asset));
        }
        return res;
    } catch (nlohmann::json::exception & e) {
        throw StructuralError("invalid manifest: %s", e.what());
    }
}

} // namespace charx
