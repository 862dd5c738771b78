#pragma once
///@file

#include "papercache/util/types.hh"

#include <compare>
#include <cstdint>
#include <string_view>

namespace papercache {

/**
 * A SHA-256 digest.
 */
struct Hash
{
    constexpr static size_t size = 32;

    uint8_t hash[size] = {};

    /**
     * Lower-case hexadecimal rendering, `2 * size` characters long.
     */
    std::string to_base16() const;

    bool operator==(const Hash & h2) const noexcept;
    std::strong_ordering operator<=>(const Hash & h2) const noexcept;
};

/**
 * Compute the SHA-256 hash of the given string.
 */
Hash hashString(std::string_view s);

} // namespace papercache
