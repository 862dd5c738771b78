#include "papercache/cache/cache-failure.hh"

#include <nlohmann/json.hpp>

namespace papercache {

std::string_view showFailureKind(FailureKind kind)
{
    switch (kind) {
    case FailureKind::Unavailable:
        return "unavailable";
    case FailureKind::TransferFailed:
        return "transfer-failed";
    case FailureKind::UnsafeArchive:
        return "unsafe-archive";
    case FailureKind::EmptyArchive:
        return "empty-archive";
    case FailureKind::BadArchive:
        return "bad-archive";
    case FailureKind::PublishFailed:
        return "publish-failed";
    case FailureKind::RollbackFailed:
        return "rollback-failed";
    case FailureKind::LockTimeout:
        return "lock-timeout";
    case FailureKind::StaleEntry:
        return "stale-entry";
    case FailureKind::InvalidKey:
        return "invalid-key";
    case FailureKind::IoError:
        return "io-error";
    default:
        unreachable();
    }
}

std::string_view showCacheStage(CacheStage stage)
{
    switch (stage) {
    case CacheStage::CheckExisting:
        return "check-existing";
    case CacheStage::FastPathHit:
        return "fast-path-hit";
    case CacheStage::Fetch:
        return "fetch";
    case CacheStage::Extract:
        return "extract";
    case CacheStage::PostValidate:
        return "post-validate";
    case CacheStage::Publish:
        return "publish";
    case CacheStage::Cleanup:
        return "cleanup";
    default:
        unreachable();
    }
}

std::string CacheFailure::describe() const
{
    auto s = fmt("%s during %s: %s", showFailureKind(kind), showCacheStage(stage), message);
    if (cause)
        s += "; caused by " + cause->describe();
    return s;
}

nlohmann::json CacheFailure::toJSON() const
{
    auto res = nlohmann::json::object();
    res["kind"] = std::string(showFailureKind(kind));
    res["stage"] = std::string(showCacheStage(stage));
    res["message"] = message;
    res["cause"] = cause ? cause->toJSON() : nlohmann::json(nullptr);
    return res;
}

CacheError::CacheError(CacheFailure failure)
    : Error(failure.describe())
    , failure_(std::move(failure))
{
}

} // namespace papercache
