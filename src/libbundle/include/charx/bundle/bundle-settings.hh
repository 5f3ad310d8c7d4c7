#pragma once
///@file

#include "charx/util/configuration.hh"
#include "charx/util/types.hh"

namespace charx {

struct BundleSettings : Config
{
    Setting<uint64_t> maxAssetSize{
        this,
        50 * 1024 * 1024,
        "max-asset-size",
        R"(
          Entries of an imported archive whose decoded size exceeds this
          many bytes are not stored; their names are reported as
          excluded instead.
        )"};

    Setting<uint64_t> feedChunkSize{
        this,
        1024 * 1024,
        "feed-chunk-size",
        "Size of the chunks in which archive bytes are fed to the decoder."};

    Setting<unsigned int> maxConcurrentSaves{
        this, 10, "max-concurrent-saves", "Maximum number of assets that are written to the asset store at once."};

    Setting<unsigned int> maxQueuedSaves{
        this,
        30,
        "max-queued-saves",
        R"(
          Maximum number of decoded assets that may wait for the asset
          store. Decoding pauses while this many are outstanding.
        )"};

    Setting<unsigned int> backupRetention{
        this, 20, "backup-retention", "Number of dated backups of the primary save that are kept."};

    Setting<std::string> stateCompression{
        this,
        "br",
        "state-compression",
        R"(
          Compression method used when encoding application state, e.g.
          `br` or `none`.
        )"};

    Setting<std::string> dataDir{
        this,
        "",
        "data-dir",
        R"(
          Directory holding the asset store and the saved state. If
          empty, `$XDG_DATA_HOME/charx` (or `~/.local/share/charx`) is
          used.
        )"};

    Setting<std::string> assetHubUrl{
        this,
        "",
        "asset-hub-url",
        R"(
          Base URL of the asset hub consulted before importing an
          archive. If empty, the hub is not consulted.
        )"};
};

extern BundleSettings bundleSettings;

/**
 * The effective data directory, see the `data-dir` setting.
 */
Path getDataDir();

} // namespace charx
