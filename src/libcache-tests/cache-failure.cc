#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "papercache/cache/cache-failure.hh"

namespace papercache {

TEST(CacheFailure, describe)
{
    CacheFailure failure{
        .kind = FailureKind::EmptyArchive,
        .stage = CacheStage::PostValidate,
        .message = "no .tex files",
    };

    ASSERT_EQ(failure.describe(), "empty-archive during post-validate: no .tex files");
    ASSERT_FALSE(failure.needsOperatorAttention());
}

TEST(CacheFailure, describeWithCause)
{
    CacheFailure failure{
        .kind = FailureKind::RollbackFailed,
        .stage = CacheStage::Publish,
        .message = "cannot restore",
        .cause = std::make_shared<const CacheFailure>(CacheFailure{
            .kind = FailureKind::PublishFailed,
            .stage = CacheStage::Publish,
            .message = "cannot move into place",
        }),
    };

    ASSERT_EQ(
        failure.describe(),
        "rollback-failed during publish: cannot restore; "
        "caused by publish-failed during publish: cannot move into place");
    ASSERT_TRUE(failure.needsOperatorAttention());
}

TEST(CacheFailure, toJSON)
{
    CacheFailure failure{
        .kind = FailureKind::LockTimeout,
        .stage = CacheStage::CheckExisting,
        .message = "timed out",
    };

    ASSERT_EQ(
        failure.toJSON().dump(),
        R"#({"cause":null,"kind":"lock-timeout","message":"timed out","stage":"check-existing"})#");
}

TEST(CacheFailure, toJSONNestsCause)
{
    CacheFailure failure{
        .kind = FailureKind::RollbackFailed,
        .stage = CacheStage::Publish,
        .message = "outer",
        .cause = std::make_shared<const CacheFailure>(CacheFailure{
            .kind = FailureKind::PublishFailed,
            .stage = CacheStage::Publish,
            .message = "inner",
        }),
    };

    auto json = failure.toJSON();
    ASSERT_EQ(json["cause"]["kind"].get<std::string>(), "publish-failed");
    ASSERT_EQ(json["cause"]["message"].get<std::string>(), "inner");
    ASSERT_TRUE(json["cause"]["cause"].is_null());
}

TEST(CacheFailure, everyKindHasAName)
{
    for (auto kind :
         {FailureKind::Unavailable,
          FailureKind::TransferFailed,
          FailureKind::UnsafeArchive,
          FailureKind::EmptyArchive,
          FailureKind::BadArchive,
          FailureKind::PublishFailed,
          FailureKind::RollbackFailed,
          FailureKind::LockTimeout,
          FailureKind::StaleEntry,
          FailureKind::InvalidKey,
          FailureKind::IoError})
        ASSERT_FALSE(showFailureKind(kind).empty());
}

TEST(CacheError, carriesFailure)
{
    try {
        throw CacheError(CacheFailure{
            .kind = FailureKind::PublishFailed,
            .stage = CacheStage::Publish,
            .message = "boom",
        });
    } catch (Error & e) {
        auto cacheError = dynamic_cast<CacheError *>(&e);
        ASSERT_NE(cacheError, nullptr);
        ASSERT_EQ(cacheError->failure().kind, FailureKind::PublishFailed);
        ASSERT_EQ(e.message(), "publish-failed during publish: boom");
    }
}

TEST(CacheOutcome, okWithoutFailure)
{
    CacheOutcome outcome;
    ASSERT_TRUE(outcome.ok());
    ASSERT_TRUE(static_cast<bool>(outcome));

    outcome.failure = CacheFailure{.kind = FailureKind::Unavailable, .stage = CacheStage::Fetch, .message = ""};
    ASSERT_FALSE(outcome.ok());
}

} // namespace papercache
