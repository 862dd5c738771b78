#pragma once
///@file

#include "papercache/cache/archive-source.hh"
#include "papercache/cache/cache-settings.hh"

namespace papercache {

/**
 * Archives served over HTTP(S) (or `file://`) at `<source-url><key>`,
 * with availability read from the page at `<probe-url><key>`.
 */
struct HttpArchiveSource : ArchiveSource
{
    HttpArchiveSource(const CacheSettings & settings);

    /**
     * GET `<probe-url><key>` and look for `probe-marker` in the body.
     * Transient errors are retried up to `probe-attempts` times; any
     * error left after that is logged and reported as unavailable.
     */
    bool isAvailable(std::string_view key) override;

    std::string fetch(std::string_view key) override;

    /**
     * A single GET of `url`, returning the body.
     *
     * @throws TransferError on a curl error or an HTTP status >= 400
     */
    std::string download(const std::string & url);

    /**
     * Delay before the first probe retry; doubled on each further one.
     */
    unsigned int baseRetryTimeMs = 250;

private:

    const CacheSettings & settings;
};

} // namespace papercache
