#pragma once
/**
 * @file
 *
 * The content-addressed asset persistence capability.
 */

#include "charx/util/types.hh"
#include "charx/util/error.hh"

#include <string_view>

namespace charx {

MakeError(AssetStoreError, Error);
MakeError(AssetNotFound, AssetStoreError);

/**
 * Stable identifier of a stored asset, e.g.
 * `assets/<sha256>.png`.
 */
typedef std::string AssetId;

/**
 * A store of binary assets. Implementations must be safe to call from
 * several threads at once.
 */
struct AssetStore
{
    virtual ~AssetStore() {}

    /**
     * Human-readable description, used in log messages.
     */
    virtual std::string describe() const = 0;

    /**
     * Store `data` under an identifier derived from its content and
     * return that identifier. Saving the same content twice yields the
     * same identifier. `nameHint` is the original entry name and only
     * serves to pick an extension when the content is not a
     * recognised image.
     */
    virtual AssetId save(std::string_view data, std::string_view nameHint = "") = 0;

    /**
     * The content hash `save()` would use, without storing anything.
     */
    virtual std::string hash(std::string_view data) const;

    /**
     * @throws AssetNotFound
     */
    virtual std::string load(const AssetId & id) = 0;

    /**
     * Store `data` under an explicit key, replacing any previous
     * content. Used when restoring a backup keyed by storage path.
     */
    virtual void put(const std::string & key, std::string_view data) = 0;

    virtual bool has(const std::string & key) = 0;

    /**
     * Every key in the store, sorted.
     */
    virtual Strings keys() = 0;
};

/**
 * The extension a content-addressed save uses for `data`: the sniffed
 * image format, else the extension of `nameHint`, else `bin`.
 */
std::string assetExtension(std::string_view data, std::string_view nameHint);

/**
 * The identifier content-addressed stores assign: `assets/<hash>.<ext>`.
 */
AssetId makeAssetId(std::string_view hash, std::string_view ext);

} // namespace charx
