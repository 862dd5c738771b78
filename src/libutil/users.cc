#include "papercache/util/users.hh"
#include "papercache/util/environment-variables.hh"

namespace papercache {

static std::filesystem::path userDir(const std::string & ownVar, const std::string & xdgVar, const char * inHome)
{
    if (auto dir = getEnvNonEmpty(ownVar))
        return *dir;
    if (auto dir = getEnvNonEmpty(xdgVar))
        return std::filesystem::path(*dir) / "papercache";
    return std::filesystem::path(getHome()) / inHome / "papercache";
}

std::filesystem::path getCacheDir()
{
    return userDir("PAPERCACHE_CACHE_HOME", "XDG_CACHE_HOME", ".cache");
}

std::filesystem::path getConfigDir()
{
    return userDir("PAPERCACHE_CONFIG_HOME", "XDG_CONFIG_HOME", ".config");
}

} // namespace papercache
