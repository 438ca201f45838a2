#pragma once
///@file

#include "chunkcache/util/types.hh"

#include <algorithm>
#include <list>
#include <string>
#include <string_view>
#include <vector>

namespace chunkcache {

/**
 * Split `s` at any of `separators` into a container of type C. Runs of
 * separators count as one, and no empty tokens are produced.
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
std::string concatStringsSep(const std::string_view sep, const C & ss)
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

/**
 * `concatStringsSep()` over `fn` applied to each element.
 */
template<class C, class F>
std::string concatMapStringsSep(std::string_view sep, const C & iterable, F fn)
{
    std::vector<std::string> strings;
    for (auto & elem : iterable)
        strings.push_back(fn(elem));
    return concatStringsSep(sep, strings);
}

/**
 * `s` without trailing whitespace.
 */
std::string chomp(std::string_view s);

std::string replaceStrings(std::string s, std::string_view from, std::string_view to);

/**
 * Single-quote `s` for a POSIX shell, for messages that show a command
 * line.
 */
std::string escapeShellArgAlways(const std::string_view s);

} // namespace chunkcache
