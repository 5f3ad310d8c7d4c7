#include "charx/store/local-asset-store.hh"
#include "charx/util/file-system.hh"
#include "charx/util/util.hh"
#include "charx/util/logging.hh"

#include <filesystem>

namespace charx {

LocalAssetStore::LocalAssetStore(const Path & root)
    : root(canonPath(std::filesystem::absolute(root).string()))
{
    createDirs(this->root);
}

std::string LocalAssetStore::describe() const
{
    return fmt("local asset store '%s'", root);
}

Path LocalAssetStore::keyToPath(const std::string & key) const
{
    if (key.empty() || key.starts_with('/'))
        throw AssetStoreError("invalid asset key '%s'", key);
    auto path = canonPath(root + "/" + key);
    if (!isInDir(path, root))
        throw AssetStoreError("asset key '%s' is outside of %s", key, describe());
    return path;
}

AssetId LocalAssetStore::save(std::string_view data, std::string_view nameHint)
{
    auto id = makeAssetId(hash(data), assetExtension(data, nameHint));
    if (has(id))
        debug("asset '%s' is already present", id);
    else
        put(id, data);
    return id;
}

std::string LocalAssetStore::load(const AssetId & id)
{
    auto path = keyToPath(id);
    if (!pathExists(path))
        throw AssetNotFound("asset '%s' does not exist in %s", id, describe());
    return readFile(path);
}

void LocalAssetStore::put(const std::string & key, std::string_view data)
{
    auto path = keyToPath(key);
    createDirs(dirOf(path));
    writeFileAtomic(path, data);
    vomit("wrote asset '%s' (%s)", key, renderSize(data.size()));
}

bool LocalAssetStore::has(const std::string & key)
{
    return pathExists(keyToPath(key));
}

Strings LocalAssetStore::keys()
{
    Strings res;
    try {
        for (auto & entry : std::filesystem::recursive_directory_iterator(root)) {
            if (!entry.is_regular_file())
                continue;
            auto name = entry.path().filename().string();
            /* Skip the temporaries of writes still in flight. */
            if (name.starts_with('.'))
                continue;
            res.push_back(std::filesystem::relative(entry.path(), root).string());
        }
    } catch (std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "listing %s", describe());
    }
    res.sort();
    return res;
}

std::string HashOnlyAssetStore::describe() const
{
    return "hash-only view of " + next.describe();
}

AssetId HashOnlyAssetStore::save(std::string_view data, std::string_view nameHint)
{
    return makeAssetId(hash(data), "png");
}

} // namespace charx
