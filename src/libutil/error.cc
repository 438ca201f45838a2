#include "chunkcache/util/error.hh"
#include "chunkcache/util/logging.hh"
#include "chunkcache/util/strings.hh"
#include "chunkcache/util/terminal.hh"

#include <sstream>
#include <vector>

#include <cerrno>
#include <unistd.h>

namespace chunkcache {

/* Without --show-trace, errors show at most this many contexts. */
static constexpr size_t maxTracesShown = 4;

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream out;
        showErrorInfo(out, err, loggerSettings.showTrace.get());
        what_ = out.str();
    }
    return *what_;
}

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

static std::string levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error:" ANSI_NORMAL " ";
    case lvlWarn:
        return ANSI_WARNING "warning:" ANSI_NORMAL " ";
    case lvlNotice:
        return ANSI_RED "note:" ANSI_NORMAL " ";
    case lvlDebug:
    case lvlVomit:
        return ANSI_WARNING "debug:" ANSI_NORMAL " ";
    default:
        return ANSI_GREEN "info:" ANSI_NORMAL " ";
    }
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    auto prefix = levelPrefix(einfo.level);
    /* Continuation lines line up with the text after the prefix. */
    std::string indent(filterANSIEscapes(prefix, true).size(), ' ');

    auto msg = tokenizeString<std::vector<std::string>>(einfo.msg.str(), "\n");
    if (msg.empty())
        msg.push_back("");

    if (einfo.traces.empty())
        out << prefix << msg.front();
    else {
        out << chomp(prefix) << "\n";
        size_t shown = 0;
        std::string previous;
        for (auto & trace : einfo.traces) {
            auto s = trace.hint.str();
            if (s.empty() || s == previous)
                continue;
            if (!showTrace && shown == maxTracesShown) {
                out << indent << ANSI_WARNING "(trace truncated; use '--show-trace' to see all of it)" ANSI_NORMAL "\n";
                break;
            }
            out << indent << "… " << s << "\n";
            previous = std::move(s);
            ++shown;
        }
        out << "\n" << indent << msg.front();
    }

    for (size_t i = 1; i < msg.size(); ++i)
        out << "\n" << indent << msg[i];

    return out;
}

static void writeErr(std::string_view buf)
{
    while (!buf.empty()) {
        auto n = ::write(STDERR_FILENO, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        buf.remove_prefix(n);
    }
}

void panic(std::string_view msg)
{
    writeErr(ANSI_RED "chunkcache: unrecoverable internal error: " ANSI_NORMAL);
    writeErr(msg);
    writeErr("\n");
    abort();
}

void unreachable(std::source_location loc)
{
    panic(fmt("unexpected condition in %s at %s:%d", loc.function_name(), loc.file_name(), loc.line()));
}

} // namespace chunkcache
