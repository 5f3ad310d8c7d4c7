#pragma once
/**
 * @file
 *
 * The containers application state can be recovered from, behind one
 * interface so that recovery can try them uniformly.
 */

#include "charx/bundle/archive-reader.hh"
#include "charx/bundle/state-codec.hh"
#include "charx/store/filetransfer.hh"

namespace charx {

struct StateContainer
{
    virtual ~StateContainer() {}

    /**
     * Where the state comes from, e.g. a path or URL.
     */
    virtual std::string describe() const = 0;

    /**
     * Decode the state.
     *
     * @throws Error if the container is missing or unreadable.
     */
    virtual StateObject load() = 0;
};

/**
 * A single encoded state, as written for the primary save and the
 * backup chain.
 */
class LegacySaveContainer : public StateContainer
{
    std::optional<Path> path;
    std::string data;
    std::string label;

public:

    explicit LegacySaveContainer(const Path & path)
        : path(path)
        , label(path)
    {
    }

    /**
     * An encoded state already held in memory.
     */
    static LegacySaveContainer fromBytes(std::string data, std::string label);

    std::string describe() const override
    {
        return label;
    }

    StateObject load() override;

private:
    LegacySaveContainer() = default;
};

/**
 * A chunked backup file. Loading restores its assets into the given
 * store and returns its state record.
 */
class ChunkedBackupContainer : public StateContainer
{
    Path path;
    AssetStore & store;

public:

    ChunkedBackupContainer(const Path & path, AssetStore & store)
        : path(path)
        , store(store)
    {
    }

    std::string describe() const override
    {
        return path;
    }

    StateObject load() override;
};

/**
 * A character archive. Loading imports its assets and returns the
 * parsed metadata entry once they have been persisted. Assets that
 * could not be saved are reported but do not fail the load.
 */
class ArchiveContainer : public StateContainer
{
    Path path;
    AssetStore & store;
    ArchiveReader::Options options;

public:

    ArchiveContainer(const Path & path, AssetStore & store, ArchiveReader::Options options = {})
        : path(path)
        , store(store)
        , options(std::move(options))
    {
    }

    std::string describe() const override
    {
        return path;
    }

    StateObject load() override;
};

/**
 * An encoded state downloaded from a URL.
 */
class RemoteStateContainer : public StateContainer
{
    ref<FileTransfer> fileTransfer;
    std::string uri;

public:

    RemoteStateContainer(ref<FileTransfer> fileTransfer, std::string uri)
        : fileTransfer(fileTransfer)
        , uri(std::move(uri))
    {
    }

    std::string describe() const override
    {
        return uri;
    }

    StateObject load() override;
};

} // namespace charx
