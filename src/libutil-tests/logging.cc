#include "papercache/util/logging.hh"

#include <gtest/gtest.h>

#include <vector>

namespace papercache {

struct CapturingLogger : Logger
{
    std::vector<std::pair<Verbosity, std::string>> & lines;

    CapturingLogger(std::vector<std::pair<Verbosity, std::string>> & lines)
        : lines(lines)
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        lines.emplace_back(lvl, std::string(s));
    }

    void logEI(const ErrorInfo & ei) override
    {
        lines.emplace_back(ei.level, ei.msg.str());
    }
};

class LoggingTest : public ::testing::Test
{
    std::unique_ptr<Logger> savedLogger;
    Verbosity savedVerbosity;

protected:
    std::vector<std::pair<Verbosity, std::string>> lines;

    void SetUp() override
    {
        savedVerbosity = verbosity;
        savedLogger = std::move(logger);
        logger = std::make_unique<CapturingLogger>(lines);
    }

    void TearDown() override
    {
        logger = std::move(savedLogger);
        verbosity = savedVerbosity;
    }
};

TEST_F(LoggingTest, printMacrosRespectVerbosity)
{
    verbosity = lvlInfo;

    printError("an error");
    printInfo("some info");
    debug("hidden detail");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, lvlError);
    EXPECT_EQ(lines[0].second, "an error");
    EXPECT_EQ(lines[1].first, lvlInfo);
    EXPECT_EQ(lines[1].second, "some info");
}

TEST_F(LoggingTest, debugShownAtDebugVerbosity)
{
    verbosity = lvlDebug;

    debug("staging '%s'", "2301.00001");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].second.find("2301.00001"), std::string::npos);
}

TEST_F(LoggingTest, warnIsPrefixed)
{
    warn("repairing stale entry '%s'", "k");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].first, lvlWarn);
    EXPECT_NE(lines[0].second.find("warning:"), std::string::npos);
    EXPECT_NE(lines[0].second.find("repairing stale entry"), std::string::npos);
}

TEST_F(LoggingTest, logErrorUsesErrorInfo)
{
    Error e(std::string("cache failure"));

    logError(e.info());

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].first, lvlError);
    EXPECT_EQ(lines[0].second, "cache failure");
}

TEST_F(LoggingTest, ignoredExceptionIsLogged)
{
    try {
        throw Error(std::string("cleanup failed"));
    } catch (...) {
        ignoreExceptionInDestructor();
    }

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].second.find("(ignored)"), std::string::npos);
    EXPECT_NE(lines[0].second.find("cleanup failed"), std::string::npos);
}

} // namespace papercache
