#pragma once
///@file

#include "charx/bundle/asset-pipeline.hh"
#include "charx/bundle/bundle-settings.hh"
#include "charx/bundle/errors.hh"
#include "charx/util/serialise.hh"

#include <optional>

namespace charx {

/**
 * Streaming importer for character archives: zip containers holding a
 * `card.json` metadata entry, an optional `module.risum` blob and any
 * number of assets.
 *
 * Metadata entries are buffered and available as soon as `parse()`
 * returns; assets are persisted in the background by an
 * `AssetPipeline`, and `done()` tells when that has finished.
 *
 * A reader is good for a single `parse()`.
 */
class ArchiveReader
{
public:

    struct Options
    {
        /// Entry holding the main metadata document.
        std::string metadataEntry = "card.json";

        /// Entry holding the secondary metadata blob.
        std::string secondaryEntry = "module.risum";

        /// Entries larger than this are excluded.
        uint64_t maxAssetSize = bundleSettings.maxAssetSize;

        /// Input is fed to the decoder in chunks of this size.
        size_t chunkSize = bundleSettings.feedChunkSize;

        unsigned int maxConcurrentSaves = bundleSettings.maxConcurrentSaves;

        unsigned int maxQueuedSaves = bundleSettings.maxQueuedSaves;

        /// Only compute asset identifiers; write nothing.
        bool hashOnly = false;

        /**
         * Saved as an asset once the whole input has been read, unless
         * `hashOnly` is set. Marks an archive whose assets the asset
         * hub already holds.
         */
        std::optional<std::string> hashSignal;

        /// Fail with `ManifestMissing` if there is no `manifest.json`.
        bool requireManifest = false;

        AssetPipeline::ProgressCallback onProgress;
    };

    ArchiveReader(AssetStore & store, Options options);

    explicit ArchiveReader(AssetStore & store)
        : ArchiveReader(store, Options{})
    {
    }

    ArchiveReader(const ArchiveReader &) = delete;

    /**
     * Decode a container held in memory.
     */
    void parse(std::string_view data);

    /**
     * Decode a container read from a file descriptor.
     */
    void parse(Descriptor fd);

    /**
     * Decode a container read incrementally from `source`.
     *
     * @throws StructuralError if the container is unreadable.
     */
    void parse(Source & source);

    /**
     * Becomes ready once every asset has been handled. Fails with
     * `AssetPipelineFailure` if any asset could not be saved, or with
     * the structural error that aborted `parse()`.
     */
    std::shared_future<void> done() const;

    const std::optional<std::string> & cardData() const
    {
        return card;
    }

    const std::optional<std::string> & moduleData() const
    {
        return module;
    }

    const std::optional<std::string> & manifestData() const
    {
        return manifest;
    }

    /**
     * Names of entries that were dropped for exceeding the size cap.
     */
    const Strings & excludedFiles() const
    {
        return excluded;
    }

    /**
     * Asset identifiers assigned so far, keyed by entry name.
     */
    std::map<std::string, AssetId> assets();

    /**
     * The contents of the first `.jpg`, `.jpeg` or `.png` entry of the
     * container in `source`, if any.
     */
    static std::optional<std::string> firstImage(Source & source);

private:

    AssetStore & store;
    Options options;

    std::optional<std::string> card, module, manifest;
    Strings excluded;

    std::unique_ptr<AssetPipeline> pipeline;
    std::optional<std::shared_future<void>> completion;

    void decodeEntries(Source & source);

    void handleEntry(const std::string & name, std::string && data);

    void finish();
};

} // namespace charx
