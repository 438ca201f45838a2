#include "chunkcache/util/strings.hh"

namespace chunkcache {

std::string chomp(std::string_view s)
{
    auto last = s.find_last_not_of(" \n\r\t");
    return std::string(s.substr(0, last == s.npos ? 0 : last + 1));
}

std::string replaceStrings(std::string s, std::string_view from, std::string_view to)
{
    if (from.empty())
        return s;
    for (auto pos = s.find(from); pos != s.npos; pos = s.find(from, pos + to.size()))
        s.replace(pos, from.size(), to);
    return s;
}

std::string escapeShellArgAlways(const std::string_view s)
{
    return "'" + replaceStrings(std::string(s), "'", "'\\''") + "'";
}

} // namespace chunkcache
