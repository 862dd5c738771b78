#include "papercache/cache/tests/cache-root.hh"

#include <algorithm>

namespace papercache::tests {

std::vector<std::string> listDir(const std::filesystem::path & dir)
{
    std::vector<std::string> names;
    if (!pathExists(dir))
        return names;
    for (auto & entry : std::filesystem::directory_iterator(dir))
        names.push_back(entry.path().filename().string());
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace papercache::tests
