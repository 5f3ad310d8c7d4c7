#include "charx/store/tests/memory-asset-store.hh"

namespace charx::testing {

AssetId MemoryAssetStore::save(std::string_view data, std::string_view nameHint)
{
    if (onSave)
        onSave(data, nameHint);
    auto id = makeAssetId(hash(data), assetExtension(data, nameHint));
    contents.lock()->insert_or_assign(id, std::string(data));
    saves++;
    return id;
}

std::string MemoryAssetStore::load(const AssetId & id)
{
    auto state(contents.lock());
    auto i = state->find(id);
    if (i == state->end())
        throw AssetNotFound("asset '%s' does not exist in %s", id, describe());
    return i->second;
}

void MemoryAssetStore::put(const std::string & key, std::string_view data)
{
    contents.lock()->insert_or_assign(key, std::string(data));
}

bool MemoryAssetStore::has(const std::string & key)
{
    return contents.lock()->count(key);
}

Strings MemoryAssetStore::keys()
{
    Strings res;
    auto state(contents.lock());
    for (auto & [key, _] : *state)
        res.push_back(key);
    return res;
}

} // namespace charx::testing
