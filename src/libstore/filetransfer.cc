#include "charx/store/filetransfer.hh"
#include "charx/util/config-global.hh"
#include "charx/util/util.hh"

#include <curl/curl.h>

#include <mutex>

namespace charx {

FileTransferSettings fileTransferSettings;

static GlobalConfig::Register rFileTransferSettings(&fileTransferSettings);

struct curlFileTransfer : public FileTransfer
{
    struct TransferItem
    {
        const FileTransferRequest & request;
        FileTransferResult result;
        Activity act;
        CURL * req = 0;
        struct curl_slist * requestHeaders = 0;
        std::string statusMsg;

        TransferItem(const FileTransferRequest & request)
            : request(request)
            , act(*logger,
                  lvlTalkative,
                  actFileTransfer,
                  fmt("%s '%s'", request.verb(), request.uri),
                  {request.uri},
                  request.parentAct)
        {
            for (auto & [name, value] : request.headers)
                requestHeaders = curl_slist_append(requestHeaders, (name + ": " + value).c_str());
        }

        ~TransferItem()
        {
            if (req)
                curl_easy_cleanup(req);
            if (requestHeaders)
                curl_slist_free_all(requestHeaders);
        }

        /* Get the HTTP status code, or 0 for other protocols. */
        long getHTTPStatus()
        {
            long httpStatus = 0;
            long protocol = 0;
            curl_easy_getinfo(req, CURLINFO_PROTOCOL, &protocol);
            if (protocol == CURLPROTO_HTTP || protocol == CURLPROTO_HTTPS)
                curl_easy_getinfo(req, CURLINFO_RESPONSE_CODE, &httpStatus);
            return httpStatus;
        }

        size_t writeCallback(void * contents, size_t size, size_t nmemb)
        {
            size_t realSize = size * nmemb;
            result.bodySize += realSize;
            result.data.append((char *) contents, realSize);
            return realSize;
        }

        static size_t writeCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
        {
            return ((TransferItem *) userp)->writeCallback(contents, size, nmemb);
        }

        size_t headerCallback(void * contents, size_t size, size_t nmemb)
        {
            size_t realSize = size * nmemb;
            std::string line((char *) contents, realSize);
            vomit("got header for '%s': %s", request.uri, trim(line));
            if (hasPrefix(line, "HTTP/")) {
                /* "HTTP/1.1 404 Not Found" */
                auto code = line.find(' ');
                auto reason = code == line.npos ? line.npos : line.find(' ', code + 1);
                statusMsg = reason == line.npos ? "" : trim(line.substr(reason + 1));
                result.data.clear();
                result.bodySize = 0;
            }
            return realSize;
        }

        static size_t headerCallbackWrapper(void * contents, size_t size, size_t nmemb, void * userp)
        {
            return ((TransferItem *) userp)->headerCallback(contents, size, nmemb);
        }

        int progressCallback(curl_off_t dltotal, curl_off_t dlnow)
        {
            act.progress(dlnow, dltotal);
            return 0;
        }

        static int progressCallbackWrapper(
            void * userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
        {
            return ((TransferItem *) userp)->progressCallback(dltotal, dlnow);
        }

        void init()
        {
            req = curl_easy_init();
            if (!req)
                throw FileTransferError(Misc, 0, "unable to initialise curl for '%s'", request.uri);

            curl_easy_setopt(req, CURLOPT_URL, request.uri.c_str());
            curl_easy_setopt(req, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(req, CURLOPT_MAXREDIRS, 10);
            curl_easy_setopt(req, CURLOPT_NOSIGNAL, 1);
            curl_easy_setopt(
                req,
                CURLOPT_USERAGENT,
                ("curl/" LIBCURL_VERSION " charx"
                 + (fileTransferSettings.userAgentSuffix.get() != "" ? " " + fileTransferSettings.userAgentSuffix.get()
                                                                     : ""))
                    .c_str());
            curl_easy_setopt(req, CURLOPT_WRITEFUNCTION, TransferItem::writeCallbackWrapper);
            curl_easy_setopt(req, CURLOPT_WRITEDATA, this);
            curl_easy_setopt(req, CURLOPT_HEADERFUNCTION, TransferItem::headerCallbackWrapper);
            curl_easy_setopt(req, CURLOPT_HEADERDATA, this);

            curl_easy_setopt(req, CURLOPT_XFERINFOFUNCTION, progressCallbackWrapper);
            curl_easy_setopt(req, CURLOPT_XFERINFODATA, this);
            curl_easy_setopt(req, CURLOPT_NOPROGRESS, 0);

            curl_easy_setopt(req, CURLOPT_HTTPHEADER, requestHeaders);

            if (request.method == HttpMethod::HEAD)
                curl_easy_setopt(req, CURLOPT_NOBODY, 1);

            curl_easy_setopt(req, CURLOPT_CONNECTTIMEOUT, (long) fileTransferSettings.connectTimeout.get());

            curl_easy_setopt(req, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(req, CURLOPT_LOW_SPEED_TIME, (long) fileTransferSettings.stalledTransferTimeout.get());
        }

        FileTransferResult finish(CURLcode code)
        {
            auto httpStatus = getHTTPStatus();
            result.status = httpStatus;

            char * effectiveUriCStr = nullptr;
            curl_easy_getinfo(req, CURLINFO_EFFECTIVE_URL, &effectiveUriCStr);
            if (effectiveUriCStr)
                result.effectiveUri = effectiveUriCStr;

            debug(
                "finished %s of '%s'; curl status = %d, HTTP status = %d, body = %d bytes",
                request.verb(),
                request.uri,
                code,
                httpStatus,
                result.bodySize);

            if (code == CURLE_OK && (httpStatus == 0 || (httpStatus >= 200 && httpStatus < 300))) {
                act.progress(result.bodySize, result.bodySize);
                return std::move(result);
            }

            Error err = Transient;
            if (httpStatus == 404 || httpStatus == 410 || code == CURLE_FILE_COULDNT_READ_FILE)
                err = NotFound;
            else if (httpStatus == 401 || httpStatus == 403 || httpStatus == 407)
                err = Forbidden;
            else if (httpStatus >= 300 && httpStatus < 500 && httpStatus != 408 && httpStatus != 429)
                err = Misc;

            if (httpStatus != 0)
                throw FileTransferError(
                    err,
                    httpStatus,
                    "unable to %s '%s': HTTP error %d ('%s')",
                    request.method == HttpMethod::HEAD ? "check" : "download",
                    request.uri,
                    httpStatus,
                    statusMsg);
            throw FileTransferError(
                err,
                0,
                "unable to %s '%s': %s (%d)",
                request.method == HttpMethod::HEAD ? "check" : "download",
                request.uri,
                curl_easy_strerror(code),
                code);
        }
    };

    curlFileTransfer()
    {
        static std::once_flag globalInit;
        std::call_once(globalInit, curl_global_init, CURL_GLOBAL_ALL);
    }

    FileTransferResult transfer(const FileTransferRequest & request) override
    {
        TransferItem item(request);
        item.init();
        return item.finish(curl_easy_perform(item.req));
    }
};

ref<FileTransfer> makeCurlFileTransfer()
{
    return make_ref<curlFileTransfer>();
}

ref<FileTransfer> getFileTransfer()
{
    static ref<FileTransfer> fileTransfer = makeCurlFileTransfer();
    return fileTransfer;
}

} // namespace charx
