#pragma once
/**
 * @file
 *
 * @brief How an `ensureCached` call failed.
 *
 * Failures inside the cache are exceptions; at the pipeline boundary
 * they are turned into a `CacheFailure` value that names what went
 * wrong, where, and (for a failed rollback) what went wrong first.
 */

#include "papercache/util/error.hh"

#include <memory>
#include <optional>

#include <nlohmann/json_fwd.hpp>

namespace papercache {

enum struct FailureKind {
    /** The availability probe said the key has no archive. */
    Unavailable,
    /** Downloading the archive failed. */
    TransferFailed,
    /** The archive has absolute, `..`, symlink or hardlink members. */
    UnsafeArchive,
    /** The archive extracted fine but holds no payload file. */
    EmptyArchive,
    /** The archive could not be read at all. */
    BadArchive,
    /** The new tree could not be moved into place; the old entry is intact. */
    PublishFailed,
    /** Publish failed and the old entry could not be restored either. */
    RollbackFailed,
    LockTimeout,
    /** The entry is stale and repair was not requested. */
    StaleEntry,
    InvalidKey,
    IoError,
};

enum struct CacheStage {
    CheckExisting,
    FastPathHit,
    Fetch,
    Extract,
    PostValidate,
    Publish,
    Cleanup,
};

std::string_view showFailureKind(FailureKind kind);

std::string_view showCacheStage(CacheStage stage);

struct CacheFailure
{
    FailureKind kind;
    CacheStage stage;
    std::string message;

    /**
     * The failure that led to this one. Only set for
     * `RollbackFailed`, where it is the `PublishFailed` record.
     */
    std::shared_ptr<const CacheFailure> cause;

    /**
     * One line: `<kind> during <stage>: <message>`, followed by the
     * cause chain.
     */
    std::string describe() const;

    nlohmann::json toJSON() const;

    /**
     * Whether a human has to look at the cache root. True only when a
     * backup could not be moved back into place.
     */
    bool needsOperatorAttention() const
    {
        return kind == FailureKind::RollbackFailed;
    }
};

struct CacheOutcome
{
    std::optional<CacheFailure> failure;

    /**
     * A valid entry was already present and nothing was fetched.
     */
    bool fastPath = false;

    bool ok() const
    {
        return !failure;
    }

    explicit operator bool() const
    {
        return ok();
    }
};

/**
 * Carries a fully classified `CacheFailure` through the pipeline.
 */
class CacheError : public Error
{
    CacheFailure failure_;

public:
    CacheError(CacheFailure failure);

    const CacheFailure & failure() const
    {
        return failure_;
    }
};

} // namespace papercache
