#pragma once
///@file

#include "charx/store/filetransfer.hh"
#include "charx/util/serialise.hh"

namespace charx {

struct RemoteAssetCheck
{
    /**
     * Whether the hub already holds a copy of the archive.
     */
    bool exists = false;

    /**
     * Hex SHA-256 of the archive bytes. When `exists` is set this is
     * the signal an importer records instead of re-uploading.
     */
    std::string hash;
};

/**
 * The URL under which an asset hub publishes the archive whose
 * content hash is `hash`: `<hubUrl>/rs/assets/<sha256(hash)>.png`.
 */
std::string remoteAssetUrl(std::string_view hubUrl, std::string_view hash);

/**
 * Ask the hub at `hubUrl` whether it already holds the archive read
 * from `archive`, which is hashed as it is drained. Transfer failures
 * are logged as warnings and reported as a miss.
 */
RemoteAssetCheck checkRemoteAssets(FileTransfer & fileTransfer, std::string_view hubUrl, Source & archive);

} // namespace charx
