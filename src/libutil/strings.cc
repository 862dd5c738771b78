#include "papercache/util/strings.hh"
#include "papercache/util/error.hh"

#include <cctype>
#include <limits>

#include <boost/lexical_cast.hpp>

namespace papercache {

std::string trim(std::string_view s, std::string_view whitespace)
{
    auto start = s.find_first_not_of(whitespace);
    if (start == s.npos)
        return "";
    return std::string(s.substr(start, s.find_last_not_of(whitespace) - start + 1));
}

template<class N>
std::optional<N> string2Int(std::string_view s)
{
    /* lexical_cast wraps "-1" around for unsigned types. */
    if (!std::numeric_limits<N>::is_signed && hasPrefix(s, "-"))
        return std::nullopt;
    N n;
    if (!boost::conversion::try_lexical_convert(s.data(), s.size(), n))
        return std::nullopt;
    return n;
}

template<class N>
N string2IntWithUnitPrefix(std::string_view s)
{
    int shift = 0;
    if (!s.empty() && std::isalpha((unsigned char) s.back())) {
        switch (std::toupper((unsigned char) s.back())) {
        case 'K':
            shift = 10;
            break;
        case 'M':
            shift = 20;
            break;
        case 'G':
            shift = 30;
            break;
        case 'T':
            shift = 40;
            break;
        default:
            throw UsageError("invalid unit specifier '%s'", s.back());
        }
        s.remove_suffix(1);
    }

    auto n = string2Int<N>(s);
    if (!n)
        throw UsageError("'%s' is not an integer", s);

    if (shift) {
        using limits = std::numeric_limits<N>;
        if (shift >= limits::digits || *n > (limits::max() >> shift) || *n < (limits::min() >> shift))
            throw UsageError("'%s' followed by a unit is out of range", s);
        *n <<= shift;
    }

    return *n;
}

template std::optional<int> string2Int<int>(std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(std::string_view s);
template std::optional<long> string2Int<long>(std::string_view s);
template std::optional<unsigned long> string2Int<unsigned long>(std::string_view s);

template int string2IntWithUnitPrefix<int>(std::string_view s);
template unsigned int string2IntWithUnitPrefix<unsigned int>(std::string_view s);
template long string2IntWithUnitPrefix<long>(std::string_view s);
template unsigned long string2IntWithUnitPrefix<unsigned long>(std::string_view s);

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

bool hasSuffix(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace papercache
