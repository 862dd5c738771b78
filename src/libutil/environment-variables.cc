#include "papercache/util/environment-variables.hh"
#include "papercache/util/error.hh"

#include <cstdlib>

namespace papercache {

std::optional<std::string> getEnv(const std::string & key)
{
    if (auto value = ::getenv(key.c_str()))
        return value;
    return std::nullopt;
}

std::optional<std::string> getEnvNonEmpty(const std::string & key)
{
    auto value = getEnv(key);
    if (value && value->empty())
        return std::nullopt;
    return value;
}

void setEnv(const char * name, const char * value)
{
    if (::setenv(name, value, 1) == -1)
        throw SysError("setting environment variable '%s'", name);
}

} // namespace papercache
