#include "charx/bundle/state-container.hh"
#include "charx/bundle/chunked-backup.hh"
#include "charx/util/file-system.hh"

#include <fcntl.h>

namespace charx {

LegacySaveContainer LegacySaveContainer::fromBytes(std::string data, std::string label)
{
    LegacySaveContainer res;
    res.data = std::move(data);
    res.label = std::move(label);
    return res;
}

StateObject LegacySaveContainer::load()
{
    return decodeState(path ? readFile(*path) : data);
}

StateObject ChunkedBackupContainer::load()
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening backup '%1%'", path);
    auto st = maybeStat(path);
    FdSource source(fd.get());
    auto res = restoreBackup(source, store, {}, st ? st->st_size : 0);
    if (!res.failedAssets.empty())
        warn("%d assets of backup '%s' could not be restored", res.failedAssets.size(), path);
    return std::move(res.state);
}

StateObject ArchiveContainer::load()
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening archive '%1%'", path);

    ArchiveReader reader(store, options);
    reader.parse(fd.get());

    if (!reader.cardData())
        throw StructuralError("archive '%s' has no '%s' entry", path, options.metadataEntry);

    StateObject state;
    try {
        state = nlohmann::json::parse(*reader.cardData());
    } catch (nlohmann::json::exception & e) {
        throw StructuralError("'%s' in archive '%s' is not valid JSON: %s", options.metadataEntry, path, e.what());
    }

    try {
        reader.done().get();
    } catch (AssetPipelineFailure & e) {
        logWarning(e.info());
    }

    return state;
}

StateObject RemoteStateContainer::load()
{
    auto result = fileTransfer->download(FileTransferRequest(uri));
    return decodeState(result.data);
}

} // namespace charx
