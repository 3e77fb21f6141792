#include "inkforge/libmain/shared.hh"
#include "inkforge/libutil/ansicolor.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/fmt.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/signals.hh"

#include <iostream>
#include <kj/async-unix.h>
#include <openssl/opensslv.h>
#include <signal.h>
#include <sys/stat.h>

namespace inkforge {

// only there so INTERRUPT_NOTIFY_SIGNAL interrupts blocking syscalls with EINTR
static void sigHandler(int signo) { }

void initInkforge()
{
    kj::UnixEventPort::setReservedSignal(KJ_RESERVED_SIGNAL);

    startSignalHandlerThread();

    // children are reaped through pidfds, SIGCHLD must not be ignored
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;

    act.sa_handler = SIG_DFL;
    if (sigaction(SIGCHLD, &act, 0))
        throw SysError("resetting SIGCHLD");

    act.sa_handler = sigHandler;
    if (sigaction(INTERRUPT_NOTIFY_SIGNAL, &act, 0)) {
        throw SysError("handling interrupt notify signal %i", INTERRUPT_NOTIFY_SIGNAL);
    }

    // records, logs and artifacts are read by other services
    umask(0022);
}

std::string getArg(const std::string & opt,
    Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end) throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% (inkforge) %2%", programName, INKFORGE_VERSION) << std::endl;
    std::cout << "OpenSSL: " << OPENSSL_VERSION_TEXT << "\n";
}

int handleExceptions(const std::string & programName, std::function<int()> fun)
{
    ReceiveInterrupts receiveInterrupts;

    try {
        return fun();
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1%' for more information.", programName + " --help");
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (const std::bad_alloc & e) {
        printError(ANSI_RED "error:" ANSI_NORMAL " out of memory");
        return 1;
    }
    // anything else is a bug; let it reach the terminate handler with its stack
}

}
