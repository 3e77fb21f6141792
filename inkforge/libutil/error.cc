#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/ansicolor.hh"
#include "inkforge/libutil/logging.hh"

#include <algorithm>
#include <sstream>

namespace inkforge {

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err);
        what_ = oss.str();
    }
    return *what_;
}

Verbosity verbosityFromIntClamped(int val)
{
    return static_cast<Verbosity>(std::clamp(val, int(lvlError), int(lvlVomit)));
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
    case lvlTalkative:
        return ANSI_GREEN "talk";
    case lvlChatty:
        return ANSI_GREEN "chat";
    case lvlDebug:
        return ANSI_WARNING "debug";
    case lvlVomit:
        return ANSI_GREEN "vomit";
    }
    return ANSI_RED "error";
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    return out << levelPrefix(einfo.level) << ":" ANSI_NORMAL " " << einfo.msg.str();
}

void ignoreExceptionInDestructor(Verbosity lvl)
{
    // no need to rethrow Interrupted, we are already unwinding
    try {
        throw;
    } catch (std::exception & e) { // NOLINT(inkforge-foreign-exceptions)
        printMsg(lvl, "error (ignored): %1%", e.what());
    } catch (...) {
        printMsg(lvl, "error (ignored): exception of unknown type");
    }
}

}
