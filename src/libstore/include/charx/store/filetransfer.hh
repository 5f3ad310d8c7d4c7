#pragma once
///@file

#include "charx/util/types.hh"
#include "charx/util/ref.hh"
#include "charx/util/configuration.hh"
#include "charx/util/logging.hh"

#include <memory>
#include <optional>
#include <string>

namespace charx {

struct FileTransferSettings : Config
{
    Setting<std::string> userAgentSuffix{
        this, "", "user-agent-suffix", "String appended to the user agent in HTTP requests."};

    Setting<uint64_t> connectTimeout{
        this,
        15,
        "connect-timeout",
        R"(
          The timeout (in seconds) for establishing connections to the
          asset hub. Zero means curl's default.
        )"};

    Setting<uint64_t> stalledTransferTimeout{
        this,
        300,
        "stalled-transfer-timeout",
        R"(
          The timeout (in seconds) for receiving data from servers
          during download. The transfer is aborted if no data arrives
          for this long.
        )"};
};

extern FileTransferSettings fileTransferSettings;

enum struct HttpMethod { GET, HEAD };

struct FileTransferRequest
{
    std::string uri;
    Headers headers;
    HttpMethod method = HttpMethod::GET;
    ActivityId parentAct;

    FileTransferRequest(std::string_view uri)
        : uri(uri)
        , parentAct(getCurActivity())
    {
    }

    std::string verb() const
    {
        return method == HttpMethod::HEAD ? "checking" : "downloading";
    }
};

struct FileTransferResult
{
    /**
     * HTTP status of the final response, or 0 for other protocols.
     */
    unsigned int status = 0;

    /**
     * The final URI after redirections.
     */
    std::string effectiveUri;

    std::string data;

    uint64_t bodySize = 0;
};

struct FileTransfer
{
    enum Error { NotFound, Forbidden, Misc, Transient };

    virtual ~FileTransfer() {}

    /**
     * Perform `request` synchronously. A response outside the 2xx
     * range is reported as `FileTransferError`.
     */
    virtual FileTransferResult transfer(const FileTransferRequest & request) = 0;

    FileTransferResult download(const FileTransferRequest & request)
    {
        return transfer(request);
    }
};

/**
 * A FileTransfer backed by libcurl.
 */
ref<FileTransfer> makeCurlFileTransfer();

/**
 * The process-wide file transfer object.
 */
ref<FileTransfer> getFileTransfer();

class FileTransferError : public Error
{
public:
    FileTransfer::Error error;
    /// HTTP status, or 0 if the request never got a response
    unsigned int status;

    template<typename... Args>
    FileTransferError(FileTransfer::Error error, unsigned int status, const Args &... args)
        : Error(args...)
        , error(error)
        , status(status)
    {
    }
};

} // namespace charx
