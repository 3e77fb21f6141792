#pragma once
///@file

#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libbuilder/orchestrator.hh"
#include "inkforge/libbuilder/session-records.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/types.hh"

#include <kj/async.h>
#include <kj/timer.h>

namespace inkforge {

/**
 * The directory through which requests reach the builder and results leave
 * it. Producers write a request as `new/<anything>.json`, preferably by
 * renaming it into place, and ask for a cancellation by creating an empty
 * `cancel/<token>`.
 *
 * - `accepted/<token>.json`: requests handed to the orchestrator whose
 *   result has not been written yet
 * - `rejected/<name>` and `rejected/<name>.reason`: requests that can never
 *   run, and why
 * - `results/<token>.json`: the final session state, written once per
 *   session
 */
class Spool
{
    Path root;
    Orchestrator & orchestrator;
    const BuilderSettings & settings;
    SessionRecords records;

    Path dir(std::string_view sub) const
    {
        return root + "/" + std::string(sub);
    }

    void reject(const Path & file, const std::string & name, const std::string & why);
    void writeResult(const BuildSession & session);
    bool intake(const Path & file, const std::string & name);
    void processCancellations();

public:
    Spool(Path root, Orchestrator & orchestrator, const BuilderSettings & settings);

    KJ_DISALLOW_COPY_AND_MOVE(Spool);

    /**
     * Resubmit accepted requests that never got a session record, and
     * write results the previous run did not get to. Run after
     * `Orchestrator::recover`.
     */
    void resume();

    /**
     * One pass over `new/` and `cancel/`. Returns the number of submitted
     * requests.
     */
    unsigned scan();

    /**
     * Scan every `spool-poll-interval` milliseconds until cancelled.
     */
    kj::Promise<Result<void>> run(kj::Timer & timer);
};

}
