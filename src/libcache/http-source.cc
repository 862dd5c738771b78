#include "papercache/cache/http-source.hh"
#include "papercache/util/logging.hh"

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include <curl/curl.h>

namespace papercache {

namespace {

struct CurlDeleter
{
    void operator()(CURL * req) const
    {
        curl_easy_cleanup(req);
    }
};

size_t writeCallback(void * contents, size_t size, size_t nmemb, void * userp)
{
    size_t realSize = size * nmemb;
    static_cast<std::string *>(userp)->append(static_cast<char *>(contents), realSize);
    return realSize;
}

/**
 * Whether a failed request is worth repeating.
 */
bool isTransient(CURLcode code, long httpStatus)
{
    if (httpStatus == 404 || httpStatus == 410)
        return false;
    if (httpStatus >= 400 && httpStatus < 500 && httpStatus != 408 && httpStatus != 429)
        return false;
    if (httpStatus == 501 || httpStatus == 505 || httpStatus == 511)
        return false;

    switch (code) {
    case CURLE_FAILED_INIT:
    case CURLE_URL_MALFORMAT:
    case CURLE_NOT_BUILT_IN:
    case CURLE_REMOTE_ACCESS_DENIED:
    case CURLE_FILE_COULDNT_READ_FILE:
    case CURLE_FUNCTION_NOT_FOUND:
    case CURLE_ABORTED_BY_CALLBACK:
    case CURLE_BAD_FUNCTION_ARGUMENT:
    case CURLE_INTERFACE_FAILED:
    case CURLE_UNKNOWN_OPTION:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_TOO_MANY_REDIRECTS:
    case CURLE_WRITE_ERROR:
    case CURLE_UNSUPPORTED_PROTOCOL:
        return false;
    default:
        return true;
    }
}

} // namespace

HttpArchiveSource::HttpArchiveSource(const CacheSettings & settings)
    : settings(settings)
{
    static std::once_flag globalInit;
    std::call_once(globalInit, curl_global_init, CURL_GLOBAL_ALL);
}

std::string HttpArchiveSource::download(const std::string & url)
{
    std::unique_ptr<CURL, CurlDeleter> req(curl_easy_init());
    if (!req)
        throw TransferError(false, "cannot initialise curl for '%s'", url);

    std::string body;

    curl_easy_setopt(req.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(req.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.get(), CURLOPT_USERAGENT, settings.userAgent.get().c_str());
    curl_easy_setopt(req.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(req.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(req.get(), CURLOPT_CONNECTTIMEOUT, (long) settings.connectTimeout.get());
    curl_easy_setopt(req.get(), CURLOPT_TIMEOUT, (long) settings.transferTimeout.get());

    debug("downloading '%s'", url);

    auto code = curl_easy_perform(req.get());

    long httpStatus = 0;
    curl_easy_getinfo(req.get(), CURLINFO_RESPONSE_CODE, &httpStatus);

    if (code != CURLE_OK)
        throw TransferError(
            isTransient(code, httpStatus),
            "unable to download '%s': %s (%d)",
            url,
            curl_easy_strerror(code),
            (int) code);

    if (httpStatus >= 400)
        throw TransferError(isTransient(code, httpStatus), "unable to download '%s': HTTP error %d", url, httpStatus);

    debug("downloaded %d bytes from '%s'", body.size(), url);

    return body;
}

bool HttpArchiveSource::isAvailable(std::string_view key)
{
    auto url = settings.probeUrl.get() + std::string(key);
    auto attempts = std::max(1u, settings.probeAttempts.get());

    for (unsigned int attempt = 1;; attempt++) {
        try {
            auto body = download(url);
            bool available = body.find(settings.probeMarker.get()) != std::string::npos;
            if (!available)
                printTalkative("no archive available for '%s'", key);
            return available;
        } catch (TransferError & e) {
            if (!e.transient || attempt >= attempts) {
                printError("cannot check whether '%s' is available: %s", key, e.message());
                return false;
            }
            unsigned int ms = baseRetryTimeMs << (attempt - 1);
            warn("%s; retrying in %d ms", e.message(), ms);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }
}

std::string HttpArchiveSource::fetch(std::string_view key)
{
    auto url = settings.sourceUrl.get() + std::string(key);
    printInfo("downloading source from '%s'", url);
    return download(url);
}

} // namespace papercache
