#pragma once
///@file

#include "charx/bundle/chunked-backup.hh"
#include "charx/bundle/state-container.hh"
#include "charx/util/ref.hh"

namespace charx {

/**
 * The primary save of the application state, `<dir>/database.bin`,
 * and its chain of dated backups, `<dir>/dbbackup-<unix-ms>.bin`.
 */
class SaveSlot
{
    Path dir;

public:

    /**
     * The directory is created if needed.
     */
    explicit SaveSlot(const Path & dir);

    Path primaryPath() const;

    Path backupPath(std::string_view id) const;

    bool hasPrimary() const;

    /**
     * Encode `state`, atomically replace the primary save, record a
     * backup of it and prune the chain to `retention` entries.
     */
    void save(const StateObject & state, unsigned int retention);

    /**
     * `save()` keeping `backup-retention` backups.
     */
    void save(const StateObject & state);

    /**
     * Atomically replace the primary save with an already encoded
     * state.
     */
    void writePrimary(std::string_view encoded);

    /**
     * Add `encoded` to the backup chain.
     *
     * @return The new backup's identifier.
     */
    std::string addBackup(std::string_view encoded);

    /**
     * Backup identifiers, most recent first.
     */
    std::vector<std::string> backups() const;

    /**
     * Delete the oldest backups until at most `retention` are left.
     */
    void prune(unsigned int retention);

    /**
     * Write an empty state if there is no primary save yet.
     */
    void ensureInitialized();

    ref<StateContainer> primaryContainer() const;

    /**
     * Containers for the backup chain, most recent first.
     */
    std::vector<ref<StateContainer>> backupContainers() const;

    /**
     * Restore a chunked backup: its assets go to `store`, its state
     * record becomes the primary save, then `restart` is called so the
     * application reloads.
     *
     * The primary save is only replaced once the whole backup has been
     * read and verified; if that fails it is left as it was and
     * `restart` is not called.
     */
    RestoreResult restoreFrom(Source & source, AssetStore & store, const std::function<void()> & restart);
};

} // namespace charx
