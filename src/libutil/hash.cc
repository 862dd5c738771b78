#include "papercache/util/hash.hh"

#include <cstring>

#include <openssl/sha.h>

namespace papercache {

static const char base16Chars[] = "0123456789abcdef";

std::string Hash::to_base16() const
{
    std::string buf;
    buf.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        buf.push_back(base16Chars[hash[i] >> 4]);
        buf.push_back(base16Chars[hash[i] & 0x0f]);
    }
    return buf;
}

bool Hash::operator==(const Hash & h2) const noexcept
{
    return std::memcmp(hash, h2.hash, size) == 0;
}

std::strong_ordering Hash::operator<=>(const Hash & h2) const noexcept
{
    auto cmp = std::memcmp(hash, h2.hash, size);
    if (cmp < 0)
        return std::strong_ordering::less;
    if (cmp > 0)
        return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

Hash hashString(std::string_view s)
{
    SHA256_CTX ctx;
    Hash hash;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, s.data(), s.size());
    SHA256_Final(hash.hash, &ctx);
    return hash;
}

} // namespace papercache
