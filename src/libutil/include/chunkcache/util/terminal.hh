#pragma once
///@file

#include <limits>
#include <string>
#include <string_view>

namespace chunkcache {

/**
 * Whether stderr is a terminal that should get colours. `NO_COLOR`
 * and `TERM=dumb` turn colours off.
 */
bool isTTY();

/**
 * Cut `s` down to `width` columns, expanding tabs and dropping
 * carriage returns and bells. Colour sequences are kept (and take no
 * width) unless `filterAll` is set; other escape sequences are always
 * removed.
 */
std::string filterANSIEscapes(
    std::string_view s, bool filterAll = false, unsigned int width = std::numeric_limits<unsigned int>::max());

} // namespace chunkcache
