#pragma once
///@file

#include "papercache/cache/archive-source.hh"

#include <atomic>
#include <functional>
#include <string>

namespace papercache::tests {

/**
 * An `ArchiveSource` whose answers come from plain functions, counting
 * how often it was asked. Safe to share between threads as long as the
 * functions are.
 */
struct FakeArchiveSource : ArchiveSource
{
    std::function<bool(std::string_view key)> available = [](std::string_view) { return true; };

    /**
     * Produces the archive bytes. Unset means every fetch fails.
     */
    std::function<std::string(std::string_view key)> archive;

    std::atomic<unsigned int> probes{0};
    std::atomic<unsigned int> fetches{0};

    bool isAvailable(std::string_view key) override
    {
        probes++;
        return available(key);
    }

    std::string fetch(std::string_view key) override
    {
        fetches++;
        if (!archive)
            throw TransferError(false, "no archive for '%s'", key);
        return archive(key);
    }
};

} // namespace papercache::tests
