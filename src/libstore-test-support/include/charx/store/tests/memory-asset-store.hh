#pragma once
///@file

#include "charx/store/asset-store.hh"
#include "charx/util/sync.hh"

#include <atomic>
#include <functional>
#include <map>

namespace charx::testing {

/**
 * An in-memory `AssetStore` for unit tests. `onSave` runs before every
 * content-addressed save, outside of any lock, so a test can make a
 * save fail or block.
 */
class MemoryAssetStore : public AssetStore
{
    Sync<std::map<std::string, std::string>> contents;

public:

    std::function<void(std::string_view data, std::string_view nameHint)> onSave;

    std::atomic<size_t> saves{0};

    std::string describe() const override
    {
        return "memory asset store";
    }

    AssetId save(std::string_view data, std::string_view nameHint = "") override;

    std::string load(const AssetId & id) override;

    void put(const std::string & key, std::string_view data) override;

    bool has(const std::string & key) override;

    Strings keys() override;
};

} // namespace charx::testing
