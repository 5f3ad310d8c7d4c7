#include "charx/store/asset-store.hh"
#include "charx/store/asset-format.hh"
#include "charx/util/hash.hh"

namespace charx {

std::string AssetStore::hash(std::string_view data) const
{
    return sha256Base16(data);
}

std::string assetExtension(std::string_view data, std::string_view nameHint)
{
    auto ext = imageFormatExtension(sniffImageFormat(data));
    if (!ext.empty())
        return std::string(ext);
    auto hinted = extensionOf(nameHint);
    return hinted.empty() ? "bin" : hinted;
}

AssetId makeAssetId(std::string_view hash, std::string_view ext)
{
    return "assets/" + std::string(hash) + "." + std::string(ext);
}

} // namespace charx
