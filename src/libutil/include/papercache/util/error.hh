#pragma once
///@file

#include "papercache/util/fmt.hh"

#include <cstring>
#include <list>
#include <optional>
#include <source_location>

namespace papercache {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlDebug } Verbosity;

/**
 * The contents of an exception. It is only rendered to text when
 * shown.
 */
struct ErrorInfo
{
    Verbosity level = lvlError;
    HintFmt msg;

    /**
     * Context added while the exception propagated, outermost first.
     */
    std::list<HintFmt> traces;

    unsigned int status = 1;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

/**
 * Root of the exception hierarchy. Catch `Error` rather than this.
 *
 * A message given as a single string is used literally; with further
 * arguments it is a `boost::format` string.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    mutable std::optional<std::string> what_;

public:

    BaseError(const std::string & msg)
        : err{.msg = HintFmt(msg)}
    {
    }

    template<typename... Args>
    BaseError(const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.msg = std::move(hint)}
    {
    }

    /**
     * The message alone, without the "error:" prefix or traces.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override;

    const ErrorInfo & info() const
    {
        return err;
    }

    void withExitStatus(unsigned int status)
    {
        err.status = status;
    }

    /**
     * Add context, such as what was being done when the error occurred.
     * The most recently added context is shown first.
     */
    template<typename... Args>
    void addTrace(const std::string & fs, const Args &... args)
    {
        addTrace(HintFmt(fs, args...));
    }

    void addTrace(HintFmt hint);

    bool hasTrace() const
    {
        return !err.traces.empty();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * Catch this rather than `SysError`.
 */
MakeError(SystemError, Error);

/**
 * A failed system call. The message is followed by `strerror(errNo)`.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError(fmt("%s: %s", HintFmt(args...).str(), strerror(errNo)))
        , errNo(errNo)
    {
    }

    /**
     * Uses `errno`, so nothing may run between the failing call and
     * this.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Log and discard the exception being handled. For destructors and
 * other code that must not throw.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

[[gnu::noinline, gnu::cold, noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace papercache
