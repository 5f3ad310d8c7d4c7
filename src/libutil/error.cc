#include "charx/util/error.hh"
#include "charx/util/logging.hh"

#include <sstream>

namespace charx {

std::optional<std::string> ErrorInfo::programName = std::nullopt;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

const std::string & BaseError::msg() const
{
    if (!what_)
        what_ = showErrorInfo(err, loggerSettings.showTrace);
    return *what_;
}

static std::string_view levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error";
    case lvlWarn:
        return ANSI_WARNING "warning";
    case lvlNotice:
        return ANSI_RED "note";
    case lvlInfo:
        return ANSI_GREEN "info";
    case lvlDebug:
        return ANSI_WARNING "debug";
    default:
        return ANSI_GREEN "talk";
    }
}

std::string showErrorInfo(const ErrorInfo & einfo, bool showTrace)
{
    auto prefix = std::string(levelPrefix(einfo.level)) + ":" ANSI_NORMAL " ";

    std::ostringstream out;
    size_t shown = 0;
    for (auto & trace : einfo.traces) {
        if (!showTrace && shown == 3) {
            out << ANSI_WARNING "(" << einfo.traces.size() - shown
                << " more; use '--show-trace' to see them)" ANSI_NORMAL "\n";
            break;
        }
        out << "… " << trace << "\n";
        shown++;
    }
    if (!shown)
        return prefix + einfo.msg.str();

    return prefix + "\n" + out.str() + "\n" + prefix + einfo.msg.str();
}

void unreachable(std::source_location loc)
{
    writeToStderr(
        fmt(ANSI_RED "charx: internal error" ANSI_NORMAL ": unexpected condition at %s:%d in %s\n",
            loc.file_name(),
            loc.line(),
            loc.function_name()));
    std::terminate();
}

} // namespace charx
