#include "papercache/cache/cache-lock.hh"
#include "papercache/cache/key.hh"

namespace papercache {

std::filesystem::path getCacheLockPath(const std::filesystem::path & root, std::string_view key)
{
    return root / lockDirName / (hashKey(key) + ".lock");
}

} // namespace papercache
