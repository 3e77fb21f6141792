#pragma once
///@file

#include "inkforge/libutil/result.hh"

#include <chrono>
#include <kj/async.h>
#include <kj/timer.h>
#include <optional>

namespace inkforge {

enum class SupervisedOutcome { Completed, TimedOut, Cancelled };

/**
 * The wall-clock budget of one session. The deadline is hard: work that is
 * still running when it passes is dropped, and work that finishes after it
 * passed counts as timed out all the same.
 */
class TimeoutSupervisor
{
    kj::Timer & timer;
    std::chrono::steady_clock::duration budget;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

public:
    TimeoutSupervisor(kj::Timer & timer, std::chrono::steady_clock::duration budget)
        : timer(timer)
        , budget(budget)
    {
    }

    /**
     * Start the clock. The session calls this when it enters `Provisioning`.
     */
    void start();

    std::optional<std::chrono::steady_clock::time_point> deadline() const
    {
        return deadline_;
    }

    /**
     * Whether the deadline has strictly passed.
     */
    bool expired() const;

    /**
     * Race `work` against the deadline and `cancelled`. Whichever loses is
     * dropped, which cancels it. Errors of `work` are passed on unless the
     * deadline passed before they arrived.
     */
    kj::Promise<Result<SupervisedOutcome>>
    supervise(kj::Promise<Result<void>> work, kj::Promise<void> cancelled);
};

}
