#include "chunkcache/util/terminal.hh"
#include "chunkcache/util/environment-variables.hh"

#include <unistd.h>

namespace chunkcache {

bool isTTY()
{
    static const bool tty = [] {
        if (!isatty(STDERR_FILENO))
            return false;
        if (getEnv("NO_COLOR") || getEnv("NOCOLOR"))
            return false;
        auto term = getEnv("TERM");
        return term && *term != "dumb";
    }();
    return tty;
}

/* Length of the escape sequence starting at s[0] == '\e'. Sets `sgr` if
   it is a CSI "select graphic rendition" (colour) sequence. */
static size_t escapeLength(std::string_view s, bool & sgr)
{
    sgr = false;
    size_t n = 1;
    auto in = [&](char lo, char hi) { return n < s.size() && s[n] >= lo && s[n] <= hi; };

    if (n < s.size() && s[n] == '[') {
        ++n;
        while (in(0x30, 0x3f))
            ++n; // parameters
        while (in(0x20, 0x2f))
            ++n; // intermediates
        if (in(0x40, 0x7e))
            sgr = s[n++] == 'm';
    } else if (in(0x40, 0x5f))
        ++n;

    return n;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll, unsigned int width)
{
    std::string res;
    size_t column = 0;

    while (!s.empty()) {
        char c = s.front();

        if (c == '\e') {
            bool sgr;
            auto n = escapeLength(s, sgr);
            if (sgr && !filterAll)
                res.append(s.substr(0, n));
            s.remove_prefix(n);
            continue;
        }

        s.remove_prefix(1);

        if (c == '\r' || c == '\a')
            continue;

        if (c == '\t') {
            do {
                if (++column > width)
                    return res;
                res.push_back(' ');
            } while (column % 8);
            continue;
        }

        /* UTF-8 continuation bytes take no column of their own. */
        if ((c & 0xc0) != 0x80 && ++column > width)
            break;
        res.push_back(c);
    }

    return res;
}

} // namespace chunkcache
