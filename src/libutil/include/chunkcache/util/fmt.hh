#pragma once
///@file

#include <boost/format.hpp>
#include <string>
#include "chunkcache/util/ansicolor.hh"

namespace chunkcache {

/**
 * Make a `boost::format` throw on bad format strings, but tolerate a
 * mismatched number of arguments: a log message with a missing
 * argument is better than an exception while reporting an error.
 */
inline void setExceptions(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * With a single argument the string is returned as-is, so text from
 * elsewhere (an SQLite message, a file name) is never treated as a
 * format string.
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

/**
 * `boost::format(fs) % args...` as a string.
 */
template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    (f % ... % args);
    return f.str();
}

/**
 * Interpolated `HintFmt` arguments are wrapped in this to be
 * highlighted.
 */
template<class T>
struct Magenta
{
    Magenta(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & y)
{
    return out << ANSI_WARNING << y.value << ANSI_NORMAL;
}

/**
 * Wrap a `HintFmt` argument in this to print it without highlighting,
 * e.g. a nested error message that brings its own colours.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Uncolored<T> & y)
{
    return out << ANSI_NORMAL << y.value;
}

/**
 * The message of an error or trace: a `boost::format` whose arguments
 * (artifact names, paths, chunk numbers) are highlighted.
 */
class HintFmt
{
    boost::format f;

public:

    /**
     * `literal` is shown verbatim, `%` included.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : f(format)
    {
        setExceptions(f);
        (*this % ... % args);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        f % Magenta(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        f % value.value;
        return *this;
    }

    std::string str() const
    {
        return f.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace chunkcache
