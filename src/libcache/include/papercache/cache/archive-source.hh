#pragma once
///@file

#include "papercache/util/error.hh"

#include <string_view>

namespace papercache {

/**
 * Downloading an archive failed.
 */
class TransferError : public Error
{
public:
    /**
     * Whether retrying has a chance of succeeding (timeouts, 5xx and
     * the like), as opposed to e.g. a 404.
     */
    bool transient;

    template<typename... Args>
    TransferError(bool transient, const Args &... args)
        : Error(args...)
        , transient(transient)
    {
    }
};

/**
 * Where archives come from. Both calls block and apply their own
 * timeouts.
 */
struct ArchiveSource
{
    virtual ~ArchiveSource() {}

    /**
     * Whether an archive exists for `key`. Called once before each
     * download; a `false` means no download is attempted.
     */
    virtual bool isAvailable(std::string_view key) = 0;

    /**
     * The raw archive bytes for `key`.
     *
     * @throws TransferError
     */
    virtual std::string fetch(std::string_view key) = 0;
};

} // namespace papercache
