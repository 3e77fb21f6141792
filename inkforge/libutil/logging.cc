#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/terminal.hh"

#include <cstdlib>
#include <limits>
#include <mutex>
#include <sstream>
#include <syslog.h>
#include <unistd.h>

namespace inkforge {

Logger * logger = makeSimpleLogger();

class SimpleLogger : public Logger
{
public:

    bool systemd, tty;

    SimpleLogger()
    {
        auto inSystemd = getenv("IN_SYSTEMD");
        systemd = inSystemd && std::string_view(inSystemd) == "1";
        tty = shouldANSI();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity) return;

        std::string prefix;

        if (systemd) {
            char c;
            switch (lvl) {
            case lvlError: c = '3'; break;
            case lvlWarn: c = '4'; break;
            case lvlNotice: case lvlInfo: c = '5'; break;
            case lvlTalkative: case lvlChatty: c = '6'; break;
            case lvlDebug: case lvlVomit:
            default: c = '7'; break;
            }
            prefix = std::string("<") + c + ">";
        }

        writeLogsToStderr(prefix + filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::stringstream oss;
        showErrorInfo(oss, ei);

        log(ei.level, oss.str());
    }
};

Verbosity verbosity = lvlInfo;

Logger * makeSimpleLogger()
{
    return new SimpleLogger();
}

void writeLogsToStderr(std::string_view s)
{
    // leaked on purpose, session tasks may still log during static destruction
    static auto * lock = new std::mutex;

    std::unique_lock _lock(*lock);
    try {
        writeFull(STDERR_FILENO, s, false);
    } catch (SysError & e) {
        // a closed stderr must not stop volume cleanup from running
    }
}

void logFatal(std::string const & s)
{
    writeLogsToStderr(s + "\n");
    syslog(LOG_CRIT, "%s", s.c_str());
}

std::optional<std::string> LogLineSplitter::feed(std::string_view & input)
{
    while (!input.empty()) {
        const auto c = input.front();
        input.remove_prefix(1);

        if (c == '\r') {
            pos = 0;
        } else if (c == '\n') {
            return finish();
        } else {
            if (pos >= line.size()) {
                line.resize(pos + 1);
            }
            line[pos++] = c;
            if (line.size() >= maxLineLength) {
                return finish();
            }
        }
    }

    return std::nullopt;
}

std::string LogLineSplitter::finish()
{
    pos = 0;
    return std::exchange(line, {});
}

}
