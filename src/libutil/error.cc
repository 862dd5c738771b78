#include "papercache/util/error.hh"
#include "papercache/util/logging.hh"

#include <sstream>

namespace papercache {

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(std::move(hint));
    what_.reset();
}

const char * BaseError::what() const noexcept
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err);
        what_ = oss.str();
    }
    return what_->c_str();
}

static const char * levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error:";
    case lvlWarn:
        return ANSI_MAGENTA "warning:";
    case lvlNotice:
        return ANSI_RED "note:";
    case lvlInfo:
    case lvlTalkative:
        return ANSI_GREEN "info:";
    default:
        return ANSI_MAGENTA "debug:";
    }
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    out << levelPrefix(einfo.level) << ANSI_NORMAL " " << einfo.msg;

    for (auto & trace : einfo.traces)
        if (auto s = trace.str(); !s.empty())
            out << "\n  … " << s;

    return out;
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    /* Logging itself may throw; nothing may escape. */
    try {
        try {
            throw;
        } catch (BaseError & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.message());
        } catch (std::exception & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
        }
    } catch (...) {
    }
}

void unreachable(std::source_location loc)
{
    writeToStderr(fmt("papercache: unexpected condition in %s at %s:%d\n", loc.function_name(), loc.file_name(), loc.line()));
    std::terminate();
}

} // namespace papercache
