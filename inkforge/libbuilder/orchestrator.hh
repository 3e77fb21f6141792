#pragma once
///@file

#include "inkforge/libbuilder/build-session.hh"
#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libbuilder/sandbox.hh"
#include "inkforge/libbuilder/session-records.hh"
#include "inkforge/libbuilder/slot-pool.hh"
#include "inkforge/libbuilder/stage.hh"
#include "inkforge/libbuilder/volume.hh"
#include "inkforge/libutil/result.hh"

#include <functional>
#include <kj/async.h>
#include <kj/timer.h>
#include <map>
#include <memory>
#include <vector>

namespace inkforge {

struct SessionHandle
{
    std::shared_ptr<const BuildSession> session;
    /**
     * Resolves once the session is terminal, its resources are released and
     * its slot is free again.
     */
    kj::Promise<void> completion;
};

/**
 * Admits build requests, runs each admitted session through the pipeline in
 * its own task, and tears every session down through one path regardless of
 * how it ended.
 *
 * Everything here runs on the thread of the event loop that owns `timer`.
 */
class Orchestrator : private kj::TaskSet::ErrorHandler
{
public:
    using FinishedListener = std::function<void(const BuildSession &)>;

private:
    struct ActiveSession
    {
        std::shared_ptr<BuildSession> session;
        kj::Own<kj::PromiseFulfiller<void>> cancel;
        kj::ForkedPromise<void> cancelled;
        std::string cancelReason;
        kj::Own<kj::PromiseFulfiller<void>> finish;
        kj::ForkedPromise<void> finished;
    };

    /**
     * What a running session holds. Owned by the session's task only.
     */
    struct SessionResources
    {
        std::optional<VolumeHandle> volume;
        std::unique_ptr<Sandbox> sandbox;
        std::optional<ArtifactSet> artifacts;
    };

    const BuilderSettings & settings;
    VolumeManager & volumes;
    SandboxRuntime & runtime;
    std::vector<StageDefinition> pipeline;
    kj::Timer & timer;

    SessionRecords records;
    SlotPool slots_;
    std::map<std::string, ActiveSession> active;
    std::vector<FinishedListener> listeners;

    unsigned consecutiveSandboxFailures = 0;
    bool admissionsHalted_ = false;
    bool shuttingDown = false;

    kj::TaskSet tasks;

    void taskFailed(kj::Exception && exception) override;

    kj::Promise<void> runSession(std::shared_ptr<BuildSession> session);
    kj::Promise<std::optional<SlotPool::Slot>> admit(ActiveSession & entry);
    kj::Promise<Result<void>> execute(BuildSession & session, SessionResources & res);
    void recordFailure(BuildSession & session, std::exception_ptr failure);
    kj::Promise<void> terminateSandbox(BuildSession & session, SessionResources & res);
    kj::Promise<void> releaseVolume(BuildSession & session, VolumeHandle & volume);
    void raiseAlerts(const BuildSession & session);
    void haltAdmissions(const std::string & why);

    void persist(const BuildSession & session);
    void notify(const BuildSession & session);

public:
    Orchestrator(
        const BuilderSettings & settings,
        VolumeManager & volumes,
        SandboxRuntime & runtime,
        std::vector<StageDefinition> pipeline,
        kj::Timer & timer
    );

    KJ_DISALLOW_COPY_AND_MOVE(Orchestrator);

    /**
     * Check a request without submitting it. Throws `InvalidBuildRequest`.
     */
    void validate(const BuildRequest & request) const;

    /**
     * Queue a request. Never blocks; the session waits in `Queued` until a
     * slot is free. Throws `InvalidBuildRequest` for requests that can never
     * run, including a token that is already active.
     */
    SessionHandle submit(BuildRequest request);

    /**
     * Cancel an active session. Returns false if there is no such session.
     */
    bool cancel(const std::string & token, std::string reason = "cancelled by the operator");

    /**
     * Release everything left behind by sessions of a previous run that
     * never reached a terminal state. Must finish before the first submit.
     */
    kj::Promise<Result<void>> recover();

    /**
     * Refuse new submissions, cancel every active session and wait until all
     * of them are torn down.
     */
    kj::Promise<Result<void>> shutdown();

    std::vector<std::shared_ptr<const BuildSession>> activeSessions() const;

    const SlotPool & slots() const
    {
        return slots_;
    }

    /**
     * Set once a volume could not be released. Queued sessions stay queued
     * until the builder is restarted.
     */
    bool admissionsHalted() const
    {
        return admissionsHalted_;
    }

    /**
     * Called with every session that reached a terminal state, after its
     * resources were released.
     */
    void onFinished(FinishedListener listener);
};

}
