#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <string_view>
#include <map>
#include <vector>

namespace chunkcache {

typedef std::list<std::string> Strings;

/**
 * Alias to ordered std::string -> std::string map container with
 * transparent comparator, so lookups by `std::string_view` do not
 * allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

using StringSet = std::set<std::string, std::less<>>;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;

} // namespace chunkcache
