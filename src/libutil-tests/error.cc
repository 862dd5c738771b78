#include "papercache/util/error.hh"
#include "papercache/util/strings.hh"

#include <gtest/gtest.h>

namespace papercache {

MakeError(TestError, Error);

/* ----------------------------------------------------------------------------
 * BaseError
 * --------------------------------------------------------------------------*/

TEST(Error, literalMessage)
{
    TestError e(std::string("no placeholders here: %s"));
    ASSERT_EQ(e.message(), "no placeholders here: %s");
}

TEST(Error, whatHasPrefixAndMessage)
{
    TestError e(std::string("something broke"));
    std::string what = e.what();
    ASSERT_NE(what.find("error:"), std::string::npos);
    ASSERT_NE(what.find("something broke"), std::string::npos);
}

TEST(Error, formattedArgumentsAppearInMessage)
{
    TestError e("cannot open '%s' after %d tries", "2301.00001", 3);
    auto msg = e.message();
    ASSERT_NE(msg.find("2301.00001"), std::string::npos);
    ASSERT_NE(msg.find("3"), std::string::npos);
    ASSERT_TRUE(hasPrefix(msg, "cannot open '"));
}

TEST(Error, addTraceIsShownOutermostFirst)
{
    try {
        try {
            throw TestError(std::string("inner problem"));
        } catch (Error & e) {
            e.addTrace(HintFmt(std::string("while extracting")));
            e.addTrace(HintFmt(std::string("while caching")));
            throw;
        }
    } catch (Error & e) {
        ASSERT_TRUE(e.hasTrace());
        std::string what = e.what();
        auto outer = what.find("while caching");
        auto inner = what.find("while extracting");
        ASSERT_NE(outer, std::string::npos);
        ASSERT_NE(inner, std::string::npos);
        ASSERT_LT(outer, inner);
        ASSERT_EQ(e.message(), "inner problem");
    }
}

TEST(Error, subclassesAreCatchableAsError)
{
    ASSERT_THROW(throw UsageError(std::string("bad flag")), Error);
    ASSERT_THROW(throw SysError(ENOENT, "opening '%s'", "x"), SystemError);
}

TEST(Error, exitStatus)
{
    TestError e(std::string("x"));
    ASSERT_EQ(e.info().status, 1u);
    e.withExitStatus(3);
    ASSERT_EQ(e.info().status, 3u);
}

/* ----------------------------------------------------------------------------
 * SysError
 * --------------------------------------------------------------------------*/

TEST(SysError, includesStrerror)
{
    SysError e(ENOENT, "opening file '%s'", "/nonexistent");
    ASSERT_EQ(e.errNo, ENOENT);
    auto msg = e.message();
    ASSERT_NE(msg.find("opening file"), std::string::npos);
    ASSERT_NE(msg.find("/nonexistent"), std::string::npos);
    ASSERT_NE(msg.find(strerror(ENOENT)), std::string::npos);
}

TEST(SysError, usesAmbientErrno)
{
    errno = EACCES;
    SysError e("doing something");
    ASSERT_EQ(e.errNo, EACCES);
}

} // namespace papercache
