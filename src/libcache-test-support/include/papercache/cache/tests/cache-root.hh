#pragma once
///@file

#include <gtest/gtest.h>

#include "papercache/util/file-system.hh"

namespace papercache::tests {

/**
 * Gives every test a fresh, empty cache root that is removed afterwards.
 */
class CacheRootTest : public ::testing::Test
{
    std::unique_ptr<AutoDelete> delTmpDir;

protected:
    std::filesystem::path tmpDir;
    std::filesystem::path root;

    void SetUp() override
    {
        tmpDir = createTempDir();
        delTmpDir = std::make_unique<AutoDelete>(tmpDir);
        root = tmpDir / "cache";
    }

    void TearDown() override
    {
        delTmpDir.reset();
    }
};

/**
 * Names in `dir`, or none if it does not exist.
 */
std::vector<std::string> listDir(const std::filesystem::path & dir);

} // namespace papercache::tests
