#pragma once
///@file
/// The builder blocks SIGINT, SIGTERM, SIGHUP and SIGPIPE on every thread and
/// takes them in one handler thread, which turns them into interrupt
/// requests. Children call `restoreSignals()` before exec so build tools do
/// not inherit the blocked mask.

#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/result.hh"

#include <kj/async.h>
#include <memory>
#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <functional>

namespace inkforge {

/// reserved signal used to notify threads of interruption requests, e.g. the
/// service manager sending SIGTERM. the handler thread fans these out.
static inline constexpr int INTERRUPT_NOTIFY_SIGNAL = SIGUSR1;
/// kj needs a signal for internal use. we hand it SIGUSR2.
static inline constexpr int KJ_RESERVED_SIGNAL = SIGUSR2;

class Interrupted;

/// bumped once per interrupt request
extern std::atomic_unsigned_lock_free _interruptSequence;

/// the last `_interruptSequence` this thread has thrown for
extern thread_local std::atomic_unsigned_lock_free::value_type threadInterruptSeq;

Interrupted makeInterrupted();
void _interrupted();

/**
 * Throw `Interrupted` once per interrupt request this thread has not seen
 * yet. Cheap enough for loops over directory entries.
 */
void inline checkInterrupt()
{
    const auto seq = _interruptSequence.load(std::memory_order::relaxed);
    if (seq > threadInterruptSeq) {
        threadInterruptSeq = seq;
        _interrupted();
    }
}

MakeError(Interrupted, BaseError);

void restoreSignals();

/**
 * Block the handled signals in the calling thread and everything it starts
 * afterwards, and start the handler thread. The mask in effect before is
 * what `restoreSignals()` goes back to.
 */
void startSignalHandlerThread();

struct InterruptCallback
{
    virtual ~InterruptCallback() { };
};

/**
 * Run `callback` on the handler thread for every interrupt request, until
 * the returned handle is destroyed.
 */
std::unique_ptr<InterruptCallback> createInterruptCallback(
    std::function<void()> callback);

template<typename T>
kj::Promise<Result<T>> makeInterruptible(kj::Promise<Result<T>> p)
{
    auto onInterrupt = kj::newPromiseAndCrossThreadFulfiller<Result<T>>();
    // std::function needs a copyable capture
    auto fulfiller =
        std::make_shared<decltype(onInterrupt.fulfiller)>(std::move(onInterrupt.fulfiller));
    auto interruptCallback = createInterruptCallback([fulfiller] {
        (*fulfiller)->fulfill(result::failure(std::make_exception_ptr(makeInterrupted())));
    });
    return p.attach(std::move(interruptCallback)).exclusiveJoin(std::move(onInterrupt.promise));
}

/**
 * While alive, interrupt requests also send `INTERRUPT_NOTIFY_SIGNAL` to the
 * constructing thread, waking it from blocking system calls.
 */
struct ReceiveInterrupts
{
    pthread_t target;
    std::unique_ptr<InterruptCallback> callback;

    ReceiveInterrupts()
        : target(pthread_self())
        , callback(createInterruptCallback([&] { pthread_kill(target, INTERRUPT_NOTIFY_SIGNAL); }))
    {
    }
};

}
