#pragma once
/**
 * @file
 *
 * @brief Exceptions used throughout inkforge.
 *
 * Everything the builder throws on purpose derives from `BaseError`, which
 * carries an `ErrorInfo`: a severity, a formatted message and the exit status
 * the process should end with if the error reaches `main`. Rendering happens
 * in the logger, not where the error is raised.
 *
 * `Error` is what code catches. `Interrupted` derives from `BaseError` but not
 * from `Error`, so a plain `catch (Error &)` never swallows a shutdown request.
 */

#include "inkforge/libutil/fmt.hh"

#include <cstring>
#include <exception>
#include <list>
#include <memory>
#include <optional>
#include <source_location>

namespace inkforge {

typedef enum {
    lvlError = 0,
    lvlWarn,
    lvlNotice,
    lvlInfo,
    lvlTalkative,
    lvlChatty,
    lvlDebug,
    lvlVomit
} Verbosity;

/**
 * For `-v` and `--quiet`, which may be repeated past either end.
 */
Verbosity verbosityFromIntClamped(int val);

struct ErrorInfo {
    Verbosity level = Verbosity::lvlError;
    HintFmt msg;
    /** exit status of the builder if nothing handles the error */
    unsigned int status = 1;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

/**
 * Common base of our own errors and of foreign exceptions that crossed an
 * await point. Records the coroutine frames the exception unwound through.
 */
class BaseException : public std::exception
{
public:
    struct AsyncTraceFrame
    {
        std::source_location location;
        /** e.g. the build session the frame belonged to */
        std::optional<std::string> description;
    };

private:
    std::shared_ptr<std::list<AsyncTraceFrame>> _asyncTrace;

public:
    std::shared_ptr<const std::list<AsyncTraceFrame>> asyncTrace() const
    {
        return _asyncTrace;
    }

    void
    addAsyncTrace(std::source_location loc, std::optional<std::string> description = std::nullopt)
    {
        if (!_asyncTrace) {
            _asyncTrace = std::make_shared<std::list<AsyncTraceFrame>>();
        }
        _asyncTrace->push_back(AsyncTraceFrame{loc, std::move(description)});
    }
};

class BaseError : public BaseException
{
protected:
    mutable ErrorInfo err;

    mutable std::optional<std::string> what_;
    const std::string & calcWhat() const;

public:
    BaseError(const BaseError &) = default;
    BaseError & operator=(BaseError const & rhs) = default;

    template<typename... Args>
    BaseError(unsigned int status, const Args & ... args)
        : err { .level = lvlError, .msg = HintFmt(args...), .status = status }
    { }

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args & ... args)
        : err { .level = lvlError, .msg = HintFmt(fs, args...) }
    { }

    BaseError(HintFmt hint)
        : err { .level = lvlError, .msg = hint }
    { }

    BaseError(ErrorInfo && e)
        : err(std::move(e))
    { }

    const char * what() const noexcept override { return calcWhat().c_str(); }
    const std::string & msg() const { return calcWhat(); }
    const ErrorInfo & info() const { calcWhat(); return err; }
};

#define MakeError(newClass, superClass) \
    /* NOLINTNEXTLINE(bugprone-macro-parentheses) */    \
    class newClass : public superClass                  \
    {                                                   \
    public:                                             \
        using superClass::superClass;                   \
    }

MakeError(Error, BaseError);

/**
 * Bad command line or configuration. Reported without a trace and ends the
 * builder with exit status 1.
 */
MakeError(UsageError, Error);

/**
 * A non-inkforge exception (kj's, the standard library's) that escaped a
 * coroutine. The original is kept in `inner` so handlers can still look at
 * it.
 */
class ForeignException : public BaseException
{
    std::shared_ptr<std::string> _what;

    ForeignException(std::string && what, std::exception_ptr && inner)
        : _what(std::make_shared<std::string>(std::move(what)))
        , inner(std::move(inner)) // NOLINT(bugprone-throw-keyword-missing)
    {
    }

public:
    const std::exception_ptr inner;

    static ForeignException wrapCurrent()
    {
        try {
            std::rethrow_exception(std::current_exception());
        } catch (std::exception & e) {
            return {e.what(), std::current_exception()};
        } catch (...) {
            return {"(non-std::exception)", std::current_exception()};
        }
    }

    const char * what() const noexcept override
    {
        return _what->c_str();
    }
};

/**
 * A failed system call. The message gets `strerror(errNo)` appended; callers
 * inspect `errNo` to tell expected conditions (ENOENT, ESRCH) apart.
 */
class SysError : public Error
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo_, const Args & ... args)
        : Error("")
    {
        errNo = errNo_;
        auto hf = HintFmt(args...);
        err.msg = HintFmt("%1%: %2%", Uncolored(hf.str()), strerror(errNo));
    }

    template<typename... Args>
    SysError(const Args & ... args)
        : SysError(errno, args ...)
    {
    }
};

/**
 * For destructors only: log the exception in flight at `lvl` and drop it.
 */
void ignoreExceptionInDestructor(Verbosity lvl = lvlError);

}
