#pragma once
///@file

#include "papercache/util/types.hh"

#include <algorithm>
#include <optional>

namespace papercache {

/**
 * Split `s` at any of the characters in `separators`, dropping empty
 * pieces.
 */
template<class C>
C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r")
{
    C result;
    for (auto start = s.find_first_not_of(separators); start != s.npos;) {
        auto end = std::min(s.find_first_of(separators, start), s.size());
        result.insert(result.end(), std::string(s.substr(start, end - start)));
        start = s.find_first_not_of(separators, end);
    }
    return result;
}

template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss)
{
    std::string res;
    bool first = true;
    for (auto & s : ss) {
        if (!first)
            res += sep;
        res += s;
        first = false;
    }
    return res;
}

std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Parse a decimal integer, or return nothing if `s` is not one or is
 * out of range for `N`.
 */
template<class N>
std::optional<N> string2Int(std::string_view s);

/**
 * Like `string2Int()`, but allow a binary unit suffix: "4K" is 4096.
 *
 * @throws UsageError if `s` is not a valid number of this form.
 */
template<class N>
N string2IntWithUnitPrefix(std::string_view s);

bool hasPrefix(std::string_view s, std::string_view prefix);

bool hasSuffix(std::string_view s, std::string_view suffix);

} // namespace papercache
