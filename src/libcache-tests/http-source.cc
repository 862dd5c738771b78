#include <gtest/gtest.h>

#include "papercache/cache/http-source.hh"
#include "papercache/cache/source-cache.hh"
#include "papercache/cache/tests/archives.hh"
#include "papercache/cache/tests/cache-root.hh"

namespace papercache {

/**
 * Serves "archives" and probe pages from a local directory through
 * `file://` URLs, so the real libcurl code paths run without a network.
 */
class HttpSourceTest : public tests::CacheRootTest
{
protected:
    std::filesystem::path served;
    CacheSettings settings;

    void SetUp() override
    {
        CacheRootTest::SetUp();
        served = tmpDir / "served";
        createDirs(served / "e-print");
        createDirs(served / "format");

        settings.sourceUrl = "file://" + (served / "e-print").string() + "/";
        settings.probeUrl = "file://" + (served / "format").string() + "/";
        settings.cacheDir = root.string();
    }

    void publish(const std::string & key, const std::string & archive)
    {
        writeFile(served / "e-print" / key, archive);
        writeFile(served / "format" / key, "<html><a href='/e-print/" + key + "'>Download source</a></html>");
    }
};

TEST_F(HttpSourceTest, downloadReturnsBody)
{
    writeFile(served / "blob", "hello");
    HttpArchiveSource source(settings);

    ASSERT_EQ(source.download("file://" + (served / "blob").string()), "hello");
}

TEST_F(HttpSourceTest, missingFileIsPermanentFailure)
{
    HttpArchiveSource source(settings);

    try {
        source.download("file://" + (served / "missing").string());
        FAIL() << "download of a missing file succeeded";
    } catch (TransferError & e) {
        ASSERT_FALSE(e.transient);
    }
}

TEST_F(HttpSourceTest, unsupportedProtocolIsPermanentFailure)
{
    HttpArchiveSource source(settings);

    try {
        source.download("no-such-protocol://example.org/x");
        FAIL() << "download with an unknown protocol succeeded";
    } catch (TransferError & e) {
        ASSERT_FALSE(e.transient);
    }
}

TEST_F(HttpSourceTest, probeLooksForMarker)
{
    publish("2301.00001", "archive");
    writeFile(served / "format" / "2301.00002", "<html>PDF only</html>");
    HttpArchiveSource source(settings);

    ASSERT_TRUE(source.isAvailable("2301.00001"));
    ASSERT_FALSE(source.isAvailable("2301.00002"));
}

TEST_F(HttpSourceTest, probeOfMissingPageIsUnavailable)
{
    HttpArchiveSource source(settings);

    ASSERT_FALSE(source.isAvailable("2301.99999"));
}

TEST_F(HttpSourceTest, customMarker)
{
    writeFile(served / "format" / "k", "sources: yes");
    settings.probeMarker = "sources: yes";
    HttpArchiveSource source(settings);

    ASSERT_TRUE(source.isAvailable("k"));
}

TEST_F(HttpSourceTest, unreachableProbeIsUnavailable)
{
    settings.probeUrl = "http://127.0.0.1:1/format/";
    settings.probeAttempts = 2;
    HttpArchiveSource source(settings);
    source.baseRetryTimeMs = 1;

    ASSERT_FALSE(source.isAvailable("k"));
}

TEST_F(HttpSourceTest, fetchUsesSourceUrl)
{
    publish("2301.00001", "archive bytes");
    HttpArchiveSource source(settings);

    ASSERT_EQ(source.fetch("2301.00001"), "archive bytes");
}

TEST_F(HttpSourceTest, endToEnd)
{
    publish("2301.00001", tests::makePaperTarball("\\begin{document}"));
    HttpArchiveSource source(settings);

    auto outcome = ensureCached(source, "2301.00001", settings);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(readFile(root / "2301.00001" / "main.tex"), "\\begin{document}");
}

TEST_F(HttpSourceTest, endToEndUnavailable)
{
    HttpArchiveSource source(settings);

    auto outcome = ensureCached(source, "2301.00001", settings);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.failure->kind, FailureKind::Unavailable);
    EXPECT_FALSE(pathExists(root / "2301.00001"));
}

} // namespace papercache
