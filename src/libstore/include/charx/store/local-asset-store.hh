#pragma once
///@file

#include "charx/store/asset-store.hh"

namespace charx {

/**
 * An asset store rooted at a directory. Keys are relative paths below
 * the root; content is replaced atomically so concurrent readers never
 * observe a partially written asset.
 */
class LocalAssetStore : public AssetStore
{
    Path root;

    Path keyToPath(const std::string & key) const;

public:

    /**
     * The root directory is created if it does not exist.
     */
    explicit LocalAssetStore(const Path & root);

    std::string describe() const override;

    AssetId save(std::string_view data, std::string_view nameHint = "") override;

    std::string load(const AssetId & id) override;

    void put(const std::string & key, std::string_view data) override;

    bool has(const std::string & key) override;

    Strings keys() override;

    const Path & rootDir() const
    {
        return root;
    }
};

/**
 * A decorator that only computes content identifiers. `save()` returns
 * `assets/<sha256>.png` without touching the underlying store; all
 * other operations are forwarded.
 */
class HashOnlyAssetStore : public AssetStore
{
    AssetStore & next;

public:

    explicit HashOnlyAssetStore(AssetStore & next)
        : next(next)
    {
    }

    std::string describe() const override;

    AssetId save(std::string_view data, std::string_view nameHint = "") override;

    std::string hash(std::string_view data) const override
    {
        return next.hash(data);
    }

    std::string load(const AssetId & id) override
    {
        return next.load(id);
    }

    void put(const std::string & key, std::string_view data) override
    {
        next.put(key, data);
    }

    bool has(const std::string & key) override
    {
        return next.has(key);
    }

    Strings keys() override
    {
        return next.keys();
    }
};

} // namespace charx
