#pragma once
///@file

#include "chunkcache/util/types.hh"
#include "chunkcache/util/error.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/strings.hh"

#include <cctype>
#include <optional>

namespace chunkcache {

/**
 * Sanity checks that must pass before any other library code runs.
 */
void initLibUtil();

/**
 * A null-terminated `argv` pointing into `ss`, which must outlive it.
 */
std::vector<char *> stringsToCharPtrs(const Strings & ss);

/**
 * Parse a decimal integer. Negative input to an unsigned type, trailing
 * garbage and overflow all give `std::nullopt`.
 */
template<class N>
std::optional<N> string2Int(const std::string_view s);

/**
 * Parse a size such as `4M`: an integer with an optional binary unit
 * suffix (`K`, `M`, `G` or `T`, in either case).
 *
 * @throws UsageError on anything else.
 */
template<class N>
N string2IntWithUnitPrefix(std::string_view s)
{
    unsigned int shift = 0;
    if (!s.empty()) {
        switch (s.back()) {
        case 'K': case 'k': shift = 10; break;
        case 'M': case 'm': shift = 20; break;
        case 'G': case 'g': shift = 30; break;
        case 'T': case 't': shift = 40; break;
        default:
            if (!isdigit((unsigned char) s.back()))
                throw UsageError("invalid unit specifier '%1%'", s.back());
        }
        if (shift)
            s.remove_suffix(1);
    }
    auto n = string2Int<N>(s);
    if (!n)
        throw UsageError("'%s' is not an integer", s);
    return *n << shift;
}

/**
 * Render a byte count in KiB, MiB, ... with one decimal, e.g. `25.0
 * MiB`. With `align` the number is padded to six columns.
 */
std::string renderSize(int64_t value, bool align = false);

bool hasPrefix(std::string_view s, std::string_view prefix);

/**
 * For use in a `catch (...)` inside a destructor: log the current
 * exception at `lvl` and swallow it.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

/**
 * Remove the indentation shared by all non-empty lines of `s`, so that
 * setting descriptions can be written as indented raw strings.
 */
std::string stripIndentation(std::string_view s);

inline std::string operator+(const std::string & s1, std::string_view s2)
{
    std::string s(s1);
    s.append(s2);
    return s;
}

} // namespace chunkcache
