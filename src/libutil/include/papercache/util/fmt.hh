#pragma once
///@file

#include <boost/format.hpp>
#include <string>
#include <string_view>

#include "papercache/util/ansicolor.hh"

namespace papercache {

/**
 * Surplus or missing arguments are tolerated: a mismatched log message
 * must never take down a cache operation.
 */
inline void setExceptions(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * `boost::format` with the arguments applied. A format string on its
 * own is returned unchanged, so text from elsewhere that happens to
 * contain `%` can be passed through safely.
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    (f % ... % args);
    return f.str();
}

template<class T>
struct Highlighted
{
    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Highlighted<T> & h)
{
    return out << ANSI_MAGENTA << h.value << ANSI_NORMAL;
}

/**
 * An error message: like `fmt()`, but the interpolated values are
 * highlighted.
 */
class HintFmt
{
    boost::format f;

public:

    /**
     * A message taken literally, placeholders and all.
     */
    HintFmt(const std::string & literal)
        : f("%s")
    {
        f % literal;
    }

    template<typename... Args>
    HintFmt(const std::string & fs, const Args &... args)
        : f(fs)
    {
        setExceptions(f);
        (f % ... % Highlighted<Args>{args});
    }

    std::string str() const
    {
        return f.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace papercache
