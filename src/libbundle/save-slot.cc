#include "charx/bundle/save-slot.hh"
#include "charx/bundle/bundle-settings.hh"
#include "charx/util/file-system.hh"
#include "charx/util/util.hh"

#include <algorithm>
#include <chrono>

namespace charx {

static constexpr std::string_view backupPrefix = "dbbackup-";
static constexpr std::string_view backupSuffix = ".bin";

SaveSlot::SaveSlot(const Path & dir)
    : dir(dir)
{
    createDirs(dir);
}

Path SaveSlot::primaryPath() const
{
    return dir + "/database.bin";
}

Path SaveSlot::backupPath(std::string_view id) const
{
    return fmt("%s/%s%s%s", dir, backupPrefix, id, backupSuffix);
}

bool SaveSlot::hasPrimary() const
{
    return pathExists(primaryPath());
}

void SaveSlot::save(const StateObject & state, unsigned int retention)
{
    auto encoded = encodeState(state);
    writePrimary(encoded);
    auto id = addBackup(encoded);
    debug("saved state to '%s', backup %s", primaryPath(), id);
    prune(retention);
}

void SaveSlot::save(const StateObject & state)
{
    save(state, bundleSettings.backupRetention);
}

void SaveSlot::writePrimary(std::string_view encoded)
{
    writeFileAtomic(primaryPath(), encoded);
}

std::string SaveSlot::addBackup(std::string_view encoded)
{
    uint64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    /* Two saves within the same millisecond get consecutive ids. */
    auto backups = this->backups();
    if (!backups.empty())
        if (auto newest = string2Int<uint64_t>(backups.front()); newest && *newest >= ms)
            ms = *newest + 1;

    auto id = std::to_string(ms);
    writeFileAtomic(backupPath(id), encoded);
    return id;
}

std::vector<std::string> SaveSlot::backups() const
{
    std::vector<std::pair<uint64_t, std::string>> found;
    for (auto & name : readDirectoryNames(dir)) {
        if (!hasPrefix(name, backupPrefix) || !hasSuffix(name, backupSuffix))
            continue;
        auto id = name.substr(backupPrefix.size(), name.size() - backupPrefix.size() - backupSuffix.size());
        if (auto n = string2Int<uint64_t>(id))
            found.emplace_back(*n, id);
    }

    std::sort(found.begin(), found.end(), [](auto & a, auto & b) { return a.first > b.first; });

    std::vector<std::string> res;
    for (auto & [n, id] : found)
        res.push_back(id);
    return res;
}

void SaveSlot::prune(unsigned int retention)
{
    auto ids = backups();
    for (size_t i = retention; i < ids.size(); ++i) {
        debug("removing old backup %s", ids[i]);
        deletePath(backupPath(ids[i]));
    }
}

void SaveSlot::ensureInitialized()
{
    if (hasPrimary())
        return;
    printInfo("initialising empty state in '%s'", primaryPath());
    writePrimary(encodeState(StateObject::object()));
}

ref<StateContainer> SaveSlot::primaryContainer() const
{
    return make_ref<LegacySaveContainer>(primaryPath());
}

std::vector<ref<StateContainer>> SaveSlot::backupContainers() const
{
    std::vector<ref<StateContainer>> res;
    for (auto & id : backups())
        res.push_back(make_ref<LegacySaveContainer>(backupPath(id)));
    return res;
}

RestoreResult SaveSlot::restoreFrom(Source & source, AssetStore & store, const std::function<void()> & restart)
{
    /* Only a backup that was read to the end replaces the primary
       save. */
    auto res = restoreBackup(source, store);
    writePrimary(res.encodedState);
    printInfo("restored %d assets and the application state", res.assetsRestored);
    if (restart)
        restart();
    return res;
}

} // namespace charx
