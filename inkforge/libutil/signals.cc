#include "inkforge/libutil/signals.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/logging.hh"

#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace inkforge {

std::atomic_unsigned_lock_free _interruptSequence{0};
thread_local std::atomic_unsigned_lock_free::value_type threadInterruptSeq{_interruptSequence.load()
};

Interrupted makeInterrupted()
{
    return Interrupted("interrupted by a signal");
}

void _interrupted()
{
    // throwing while unwinding would terminate; the next check picks it up
    if (!std::uncaught_exceptions()) {
        throw makeInterrupted();
    }
}

/**
 * Registered interrupt callbacks, keyed by a never-reused token. Callbacks
 * run without `lock` held, so they may register or drop callbacks
 * themselves.
 */
struct InterruptCallbacks {
    typedef int64_t Token;

    Token nextToken = 0;
    std::map<Token, std::function<void()>> callbacks;

    std::mutex lock;
};

static std::mutex interruptCallbacksLock;
static std::shared_ptr<InterruptCallbacks> _interruptCallbacks;

static std::shared_ptr<InterruptCallbacks> interruptCallbacks(bool create)
{
    std::lock_guard guard(interruptCallbacksLock);
    if (!_interruptCallbacks && create) {
        _interruptCallbacks = std::make_shared<InterruptCallbacks>();
    }
    return _interruptCallbacks;
}

static void triggerInterrupt()
{
    _interruptSequence++;

    auto callbacks = interruptCallbacks(false);
    if (!callbacks) {
        return;
    }

    InterruptCallbacks::Token i = 0;
    while (true) {
        std::function<void()> callback;
        {
            std::lock_guard guard(callbacks->lock);
            auto lb = callbacks->callbacks.lower_bound(i);
            if (lb == callbacks->callbacks.end())
                break;

            callback = lb->second;
            i = lb->first + 1;
        }

        try {
            callback();
        } catch (...) {
            ignoreExceptionInDestructor();
        }
    }
}

static void signalHandlerThread(sigset_t set)
{
    pthread_setname_np(pthread_self(), "signal handler");
    while (true) {
        int signal = 0;
        sigwait(&set, &signal);

        if (signal == SIGINT) {
            if (_interruptSequence.load() > 0) {
                // a second ^C kills the builder outright, even mid-shutdown
                sigset_t unblock;
                sigemptyset(&unblock);
                sigaddset(&unblock, signal);
                pthread_sigmask(SIG_UNBLOCK, &unblock, nullptr);
                kill(getpid(), SIGINT);
            } else {
                triggerInterrupt();
            }
        } else if (signal == SIGTERM || signal == SIGHUP) {
            triggerInterrupt();
        }
    }
}

static sigset_t savedSignalMask;
static bool savedSignalMaskIsSet = false;

static void saveSignalMask()
{
    if (sigprocmask(SIG_BLOCK, nullptr, &savedSignalMask))
        throw SysError("querying signal mask");

    savedSignalMaskIsSet = true;
}

void startSignalHandlerThread()
{
    saveSignalMask();

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGPIPE);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr))
        throw SysError("blocking signals");

    std::thread(signalHandlerThread, set).detach();
}

void restoreSignals()
{
    // processes that never started the handler thread manage their own signals
    if (!savedSignalMaskIsSet)
        return;

    if (sigprocmask(SIG_SETMASK, &savedSignalMask, nullptr))
        throw SysError("restoring signals");
}

struct InterruptCallbackImpl : InterruptCallback
{
    std::shared_ptr<InterruptCallbacks> parent;
    InterruptCallbacks::Token token;
    InterruptCallbackImpl(std::shared_ptr<InterruptCallbacks> parent, InterruptCallbacks::Token token)
        : parent(parent)
        , token(token)
    {
    }
    ~InterruptCallbackImpl() override
    {
        std::lock_guard guard(parent->lock);
        parent->callbacks.erase(token);
    }
};

std::unique_ptr<InterruptCallback> createInterruptCallback(std::function<void()> callback)
{
    auto callbacks = interruptCallbacks(true);

    std::lock_guard guard(callbacks->lock);
    auto token = callbacks->nextToken++;
    callbacks->callbacks.emplace(token, callback);

    return std::make_unique<InterruptCallbackImpl>(callbacks, token);
}

}
