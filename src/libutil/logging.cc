#include "papercache/util/logging.hh"
#include "papercache/util/environment-variables.hh"
#include "papercache/util/file-descriptor.hh"

#include <sstream>

#include <unistd.h>

namespace papercache {

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeStderrLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_MAGENTA "warning:" ANSI_NORMAL " " + msg);
}

/**
 * Plain lines on standard error. Under systemd each line starts with
 * its syslog priority, e.g. `<4>` for a warning.
 */
class StderrLogger : public Logger
{
    bool systemd = getEnv("IN_SYSTEMD") == "1";

    static char priority(Verbosity lvl)
    {
        switch (lvl) {
        case lvlError:
            return '3';
        case lvlWarn:
            return '4';
        case lvlNotice:
        case lvlInfo:
            return '5';
        case lvlTalkative:
            return '6';
        default:
            return '7';
        }
    }

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string line;
        if (systemd)
            line = std::string{'<', priority(lvl), '>'};
        line += s;
        line += '\n';
        writeToStderr(line);
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);
        log(ei.level, oss.str());
    }
};

std::unique_ptr<Logger> makeStderrLogger()
{
    return std::make_unique<StderrLogger>();
}

void writeToStderr(std::string_view s)
{
    try {
        writeFull(STDERR_FILENO, s);
    } catch (SystemError &) {
        /* Cleanup code logs too, and must run to completion even if
           stderr has gone away. */
    }
}

} // namespace papercache
