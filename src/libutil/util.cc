#include "chunkcache/util/util.hh"
#include "chunkcache/util/exit.hh"
#include "chunkcache/util/fmt.hh"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <limits>

namespace chunkcache {

Exit::~Exit() {}

void initLibUtil()
{
    /* A binary linked with the wrong runtime can fail to unwind, and
       everything in chunkcache reports errors by throwing. */
    try {
        throw Error("exception self-check");
    } catch (const Error &) {
        return;
    }
    panic("C++ exception handling does not work; chunkcache was built or linked incorrectly");
}

std::vector<char *> stringsToCharPtrs(const Strings & ss)
{
    std::vector<char *> res;
    res.reserve(ss.size() + 1);
    for (auto & s : ss)
        res.push_back(const_cast<char *>(s.c_str()));
    res.push_back(nullptr);
    return res;
}

template<class N>
std::optional<N> string2Int(const std::string_view s)
{
    if (!std::numeric_limits<N>::is_signed && !s.empty() && s[0] == '-')
        return std::nullopt;
    N n;
    if (!boost::conversion::try_lexical_convert(s.data(), s.size(), n))
        return std::nullopt;
    return n;
}

template std::optional<int> string2Int<int>(const std::string_view s);
template std::optional<long> string2Int<long>(const std::string_view s);
template std::optional<long long> string2Int<long long>(const std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(const std::string_view s);
template std::optional<unsigned long> string2Int<unsigned long>(const std::string_view s);
template std::optional<unsigned long long> string2Int<unsigned long long>(const std::string_view s);

std::string renderSize(int64_t value, bool align)
{
    /* Anything up to 1 MiB is shown in KiB. */
    static const char units[] = "KMGTPE";
    double n = (double) value / 1024;
    size_t unit = 0;
    while ((n > 1024 || n < -1024) && unit + 1 < sizeof(units) - 1) {
        n /= 1024;
        ++unit;
    }
    return fmt(align ? "%6.1f %ciB" : "%.1f %ciB", n, units[unit]);
}

bool hasPrefix(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    try {
        try {
            throw;
        } catch (Error & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.info().msg);
        } catch (std::exception & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
        }
    } catch (...) {
        /* Logging itself failed; nothing is left to report it to. */
    }
}

std::string stripIndentation(std::string_view s)
{
    std::vector<std::string_view> lines;
    for (size_t pos = 0; pos < s.size();) {
        auto eol = std::min(s.find('\n', pos), s.size());
        lines.push_back(s.substr(pos, eol - pos));
        pos = eol + 1;
    }

    size_t indent = std::string::npos;
    for (auto & line : lines) {
        auto first = line.find_first_not_of(' ');
        if (first != std::string::npos)
            indent = std::min(indent, first);
    }
    if (indent == std::string::npos)
        indent = 0;

    std::string res;
    for (auto & line : lines) {
        if (line.size() > indent)
            res.append(line.substr(indent));
        res.push_back('\n');
    }
    return res;
}

} // namespace chunkcache
