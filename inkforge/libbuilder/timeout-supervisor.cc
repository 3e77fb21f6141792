#include "inkforge/libbuilder/timeout-supervisor.hh"

#include <algorithm>

namespace inkforge {

void TimeoutSupervisor::start()
{
    deadline_ = std::chrono::steady_clock::now() + budget;
}

bool TimeoutSupervisor::expired() const
{
    return deadline_ && std::chrono::steady_clock::now() > *deadline_;
}

kj::Promise<Result<SupervisedOutcome>>
TimeoutSupervisor::supervise(kj::Promise<Result<void>> work, kj::Promise<void> cancelled)
try {
    if (!deadline_) {
        start();
    }

    auto remaining = std::max(
        std::chrono::steady_clock::duration::zero(), *deadline_ - std::chrono::steady_clock::now()
    );
    auto delay = std::chrono::duration_cast<std::chrono::nanoseconds>(remaining).count() * kj::NANOSECONDS;

    auto outcome = co_await work
        .then([](Result<void> r) -> Result<SupervisedOutcome> {
            if (r.has_error()) {
                return r.error();
            }
            return SupervisedOutcome::Completed;
        })
        .exclusiveJoin(timer.afterDelay(delay).then([]() -> Result<SupervisedOutcome> {
            return SupervisedOutcome::TimedOut;
        }))
        .exclusiveJoin(cancelled.then([]() -> Result<SupervisedOutcome> {
            return SupervisedOutcome::Cancelled;
        }));

    // the work may have finished in the same turn the deadline passed
    if (expired() && (outcome.has_error() || outcome.value() == SupervisedOutcome::Completed)) {
        co_return SupervisedOutcome::TimedOut;
    }
    co_return outcome;
} catch (...) {
    co_return result::current_exception();
}

}
