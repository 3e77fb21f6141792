#pragma once
///@file
/// Process-wide logging. Everything goes to stderr, one line per message,
/// with a syslog priority prefix when running under systemd.

#include "inkforge/libutil/types.hh"
#include "inkforge/libutil/error.hh"

#include <optional>

namespace inkforge {

class Logger
{
public:
    virtual ~Logger() { }

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    /**
     * Render an error the way `showErrorInfo` does and log it at its level.
     */
    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }
};

extern Logger * logger;

Logger * makeSimpleLogger();

/**
 * Messages above this level are dropped. Set from `-v` and `--quiet`.
 */
extern Verbosity verbosity;

/**
 * Log a caught error. The error's own level is replaced by `level`.
 */
#define logErrorInfo(level, errorInfo...)                         \
    do {                                                          \
        if ((level) <= ::inkforge::verbosity) {                   \
            ::inkforge::logger->logEI((level), errorInfo);        \
        }                                                         \
    } while (0)

#define logError(errorInfo...) logErrorInfo(::inkforge::lvlError, errorInfo)

/**
 * Format and log a message. Arguments are only evaluated when `level` is
 * enabled, and `fs` must be a string literal.
 */
#define printMsg(level, fs, args...)                                                                  \
    do {                                                                                              \
        auto _inkforge_print_lvl = level;                                                             \
        const char * _inkforge_format = []<size_t N>(const char(&_inkforge_fs)[N]) {                  \
            return _inkforge_fs;                                                                      \
        }(fs);                                                                                        \
        if (_inkforge_print_lvl <= ::inkforge::verbosity) {                                           \
            ::inkforge::logger->log(                                                                  \
                _inkforge_print_lvl, ::inkforge::HintFmt(_inkforge_format, ##args).str()              \
            );                                                                                        \
        }                                                                                             \
    } while (0)

#define printWarning(fs, args...) printMsg(::inkforge::lvlWarn, fs, ##args)
#define printError(fs, args...) printMsg(::inkforge::lvlError, fs, ##args)
#define notice(fs, args...) printMsg(::inkforge::lvlNotice, fs, ##args)
#define printInfo(fs, args...) printMsg(::inkforge::lvlInfo, fs, ##args)
#define printTalkative(fs, args...) printMsg(::inkforge::lvlTalkative, fs, ##args)
#define debug(fs, args...) printMsg(::inkforge::lvlDebug, fs, ##args)
#define vomit(fs, args...) printMsg(::inkforge::lvlVomit, fs, ##args)

#define printTaggedWarning(fs, args...) \
    printWarning(ANSI_WARNING "warning:" ANSI_NORMAL " " fs, ##args)

/**
 * Write `s` to stderr under a process-wide lock. Write errors are dropped.
 */
void writeLogsToStderr(std::string_view s);

/**
 * For conditions an operator must act on (a volume that could not be
 * released). Goes to syslog at LOG_CRIT as well as stderr.
 */
void logFatal(std::string const & s);

/**
 * Cuts a stage's output into lines. A carriage return rewinds to the start
 * of the current line, so progress bars collapse to their final state. A
 * line reaching `maxLineLength` bytes is cut there and the rest continues as
 * the next line.
 */
class LogLineSplitter
{
    std::string line;
    size_t pos = 0;
    size_t maxLineLength;

public:
    explicit LogLineSplitter(size_t maxLineLength = 4096) : maxLineLength(maxLineLength) {}

    /**
     * Consume `input` up to and including the next newline and return the
     * finished line. Returns `nullopt` once `input` is exhausted without a
     * newline; the partial line stays buffered.
     */
    std::optional<std::string> feed(std::string_view & input);

    /**
     * Return the buffered partial line and reset.
     */
    std::string finish();
};

}
