#include "charx/store/remote-assets.hh"
#include "charx/util/hash.hh"

namespace charx {

std::string remoteAssetUrl(std::string_view hubUrl, std::string_view hash)
{
    return std::string(hubUrl) + "/rs/assets/" + sha256Base16(hash) + ".png";
}

RemoteAssetCheck checkRemoteAssets(FileTransfer & fileTransfer, std::string_view hubUrl, Source & archive)
{
    HashSink hashSink;
    archive.drainInto(hashSink);

    RemoteAssetCheck res;
    res.hash = hashSink.finish().first.toBase16();

    FileTransferRequest request(remoteAssetUrl(hubUrl, res.hash));
    try {
        auto result = fileTransfer.transfer(request);
        res.exists = result.status == 0 || (result.status >= 200 && result.status < 300);
    } catch (FileTransferError & e) {
        if (e.error == FileTransfer::NotFound)
            debug("archive %s is not on the asset hub", res.hash);
        else
            warn("could not check the asset hub for archive %s: %s", res.hash, e.msg());
    }

    return res;
}

} // namespace charx
