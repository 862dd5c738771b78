#pragma once
///@file

#include "papercache/util/error.hh"

#include <memory>
#include <string_view>

namespace papercache {

/**
 * Where log output goes. The default writes lines to standard error;
 * programs and tests may install their own.
 */
class Logger
{
public:

    virtual ~Logger() = default;

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    virtual void warn(const std::string & msg);
};

extern std::unique_ptr<Logger> logger;

/**
 * Messages above this level are dropped.
 */
extern Verbosity verbosity;

std::unique_ptr<Logger> makeStderrLogger();

/**
 * Log an error or warning together with its traces.
 */
#define logErrorInfo(level, errorInfo)                       \
    do {                                                     \
        if ((level) <= papercache::verbosity)                \
            papercache::logger->logEI(errorInfo);            \
    } while (0)

#define logError(errorInfo) logErrorInfo(papercache::lvlError, errorInfo)

/**
 * Print a one-line message. A macro so that the arguments are not
 * evaluated when the message is not shown.
 */
#define printMsg(level, args...)                                   \
    do {                                                           \
        auto lvl_ = (level);                                       \
        if (lvl_ <= papercache::verbosity)                         \
            papercache::logger->log(lvl_, papercache::fmt(args));  \
    } while (0)

#define printError(args...) printMsg(papercache::lvlError, args)
#define notice(args...) printMsg(papercache::lvlNotice, args)
#define printInfo(args...) printMsg(papercache::lvlInfo, args)
#define printTalkative(args...) printMsg(papercache::lvlTalkative, args)
#define debug(args...) printMsg(papercache::lvlDebug, args)

/**
 * Log a message with a "warning:" prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    if (lvlWarn <= verbosity)
        logger->warn(fmt(fs, args...));
}

/**
 * Write to standard error, ignoring failures.
 */
void writeToStderr(std::string_view s);

} // namespace papercache
