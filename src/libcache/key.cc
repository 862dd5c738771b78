#include "papercache/cache/key.hh"
#include "papercache/util/hash.hh"

namespace papercache {

void checkKey(std::string_view key)
{
    if (key.empty())
        throw InvalidKey("cache key must not be empty");
    if (key == "." || key == "..")
        throw InvalidKey("cache key '%s' is not a valid directory name", key);
    if (key.find('/') != key.npos)
        throw InvalidKey("cache key '%s' must not contain '/'", key);
    if (key.find('\0') != key.npos)
        throw InvalidKey("cache key must not contain a NUL character");
    if (key[0] == '.')
        throw InvalidKey("cache key '%s' must not start with '.'", key);
}

std::string hashKey(std::string_view key)
{
    return hashString(key).to_base16();
}

} // namespace papercache
