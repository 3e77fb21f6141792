#include "inkforge/libbuilder/orchestrator.hh"
#include "inkforge/libbuilder/artifacts.hh"
#include "inkforge/libbuilder/timeout-supervisor.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"

#include <kj/exception.h>
#include <regex>

namespace inkforge {

static std::string describeFailure(std::exception_ptr failure)
{
    try {
        std::rethrow_exception(failure);
    } catch (BaseError & e) {
        return e.msg();
    } catch (kj::Exception & e) {
        return e.getDescription().cStr();
    } catch (std::exception & e) { // NOLINT(inkforge-foreign-exceptions)
        return e.what();
    } catch (...) { // NOLINT(inkforge-foreign-exceptions)
        return "(non-std::exception)";
    }
}

Orchestrator::Orchestrator(
    const BuilderSettings & settings,
    VolumeManager & volumes,
    SandboxRuntime & runtime,
    std::vector<StageDefinition> pipeline,
    kj::Timer & timer
)
    : settings(settings)
    , volumes(volumes)
    , runtime(runtime)
    , pipeline(std::move(pipeline))
    , timer(timer)
    , records(settings.stateDir)
    , slots_(settings.workerCount)
    , tasks(*this)
{
    createDirs(settings.stateDir.get() + "/logs");
    createDirs(settings.artifactsDir);
}

void Orchestrator::taskFailed(kj::Exception && exception)
{
    printError("build session task failed: %s", exception.getDescription().cStr());
}

void Orchestrator::validate(const BuildRequest & request) const
{
    static const std::regex tokenRegex("^[A-Za-z0-9_-]{1,128}$");

    if (!std::regex_match(request.token, tokenRegex)) {
        throw InvalidBuildRequest("invalid session token '%s'", request.token.substr(0, 128));
    }
    if (request.sourceUrl.empty()) {
        throw InvalidBuildRequest("session '%s' has no source URL", request.token);
    }
    validateRequestVersions(request);
    validateProjectDirectory(request);
}

SessionHandle Orchestrator::submit(BuildRequest request)
{
    validate(request);
    if (shuttingDown) {
        throw Error("the builder is shutting down, not accepting session '%s'", request.token);
    }
    if (active.contains(request.token)) {
        throw InvalidBuildRequest("session '%s' is already active", request.token);
    }

    auto session = std::make_shared<BuildSession>(
        std::move(request), settings.limits(), settings.logLines
    );

    auto cancel = kj::newPromiseAndFulfiller<void>();
    auto finish = kj::newPromiseAndFulfiller<void>();
    auto & entry = active.emplace(session->token(), ActiveSession{
        .session = session,
        .cancel = std::move(cancel.fulfiller),
        .cancelled = cancel.promise.fork(),
        .cancelReason = "",
        .finish = std::move(finish.fulfiller),
        .finished = finish.promise.fork(),
    }).first->second;

    SessionHandle handle{session, entry.finished.addBranch()};
    tasks.add(runSession(session));

    printInfo(
        "session '%s' queued for %s (%d of %d slots in use)",
        session->token(),
        session->request().sourceUrl,
        slots_.used(),
        slots_.capacity()
    );
    return handle;
}

bool Orchestrator::cancel(const std::string & token, std::string reason)
{
    auto i = active.find(token);
    if (i == active.end()) {
        return false;
    }
    auto & entry = i->second;
    if (entry.cancel->isWaiting()) {
        notice("cancelling session '%s': %s", token, reason);
        entry.cancelReason = std::move(reason);
        entry.cancel->fulfill();
    }
    return true;
}

kj::Promise<std::optional<SlotPool::Slot>> Orchestrator::admit(ActiveSession & entry)
{
    auto slot = co_await slots_.acquire()
        .then([](SlotPool::Slot s) { return std::optional<SlotPool::Slot>(std::move(s)); })
        .exclusiveJoin(entry.cancelled.addBranch().then([] {
            return std::optional<SlotPool::Slot>();
        }));

    if (slot && admissionsHalted_) {
        // hand the slot on, every other queued session ends up here as well
        slot.reset();
        co_await entry.cancelled.addBranch();
    }
    co_return slot;
}

kj::Promise<void> Orchestrator::runSession(std::shared_ptr<BuildSession> session)
{
    // never run any part of a session inside submit()
    co_await kj::evalLater([] {});

    auto & token = session->token();
    auto & entry = active.at(token);

    auto slot = co_await admit(entry);
    SessionResources res;

    if (slot) {
        debug("session '%s' got worker slot %d", token, slot->index());

        TimeoutSupervisor supervisor(timer, session->limits().maxBuildDuration);
        session->advance(SessionState::Provisioning, "provision");
        supervisor.start();

        auto outcome = co_await supervisor.supervise(
            execute(*session, res), entry.cancelled.addBranch()
        );

        // nothing is recorded before the sandbox is gone
        co_await terminateSandbox(*session, res);

        if (outcome.has_error()) {
            recordFailure(*session, outcome.error());
        } else {
            switch (outcome.value()) {
            case SupervisedOutcome::Completed:
                if (res.artifacts) {
                    try {
                        session->succeed(*res.artifacts);
                    } catch (InvalidTransition &) {
                        recordFailure(*session, std::current_exception());
                    }
                } else {
                    session->fail(
                        FailureKind::ArtifactMissing, "the pipeline completed without artifacts"
                    );
                }
                break;
            case SupervisedOutcome::TimedOut:
                session->timeOut(fmt(
                    "the build did not finish within %d seconds",
                    session->limits().maxBuildDuration.count()
                ));
                break;
            case SupervisedOutcome::Cancelled:
                session->fail(FailureKind::Cancelled, entry.cancelReason);
                break;
            }
        }

        raiseAlerts(*session);

        if (res.volume) {
            co_await releaseVolume(*session, *res.volume);
        }

        if (res.artifacts && session->state() != SessionState::Succeeded) {
            try {
                deletePath(dirOf(res.artifacts->module));
            } catch (Error & e) {
                printError("removing artifacts of session '%s': %s", token, e.msg());
            }
        }
    } else {
        session->fail(FailureKind::Cancelled, entry.cancelReason);
    }

    try {
        persist(*session);
    } catch (Error & e) {
        printError("writing the record of session '%s': %s", token, e.msg());
    }
    notify(*session);

    slot.reset();
    auto finish = std::move(entry.finish);
    active.erase(token);
    finish->fulfill();
}

kj::Promise<Result<void>> Orchestrator::execute(BuildSession & session, SessionResources & res)
try {
    auto inkforgeAsyncTaskContext = [&]() -> std::optional<std::string> {
        return fmt("build session '%s'", session.token());
    };

    auto & request = session.request();
    auto & limits = session.limits();

    persist(session);

    res.volume = volumes.plan(request.token);
    session.setVolumeRecord(res.volume->toJSON());
    persist(session);

    auto provisioned = co_await volumes.provision(*res.volume, limits.volumeSize);
    session.setVolumeRecord(res.volume->toJSON());
    persist(session);
    if (provisioned.has_error()) {
        throw BuildFailure(
            FailureKind::VolumeProvisionFailure, "%s", describeFailure(provisioned.error())
        );
    }

    res.sandbox = runtime.launch(
        *res.volume,
        settings.toolchainImage,
        {
            {"BUILD_SESSION_TOKEN", request.token},
            {"SOURCE_CODE_URL", request.sourceUrl},
            {"API_SERVER_URL", settings.apiServerUrl.get()},
        },
        limits,
        "inkforge-" + request.token
    );
    session.setSandboxRecord(res.sandbox->describe());
    persist(session);

    auto vars = res.sandbox->env();
    for (auto & [name, value] : stageParameters(request, settings)) {
        vars.insert_or_assign(name, value);
    }

    StageLog log(fmt("%s/logs/%s.log", settings.stateDir.get(), request.token), settings.logSizeLimit.get());

    for (auto & stage : pipeline) {
        session.advance(stage.state, stage.name);
        persist(session);
        TRY_AWAIT(runStage(session, *res.sandbox, stage, vars, log, [&] {
            consecutiveSandboxFailures = 0;
            session.setSandboxRecord(res.sandbox->describe());
            persist(session);
        }));
    }

    res.artifacts = collectArtifacts(
        res.volume->mountPoint,
        fmt("%s/%s", settings.artifactsDir.get(), request.token),
        ArtifactLimits{.moduleSize = limits.wasmSize, .metadataSize = limits.metadataSize},
        request.projectDirectory.value_or(".")
    );

    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

void Orchestrator::recordFailure(BuildSession & session, std::exception_ptr failure)
{
    auto kind = FailureKind::SandboxRuntimeFailure;
    try {
        std::rethrow_exception(failure);
    } catch (BuildFailure & e) {
        kind = e.kind;
    } catch (VolumeProvisionError &) {
        kind = FailureKind::VolumeProvisionFailure;
    } catch (SandboxRuntimeError &) {
        kind = FailureKind::SandboxRuntimeFailure;
    } catch (BaseError & e) {
        // not something a submission can cause
        logError(e.info());
    } catch (kj::Exception & e) {
        printError("session '%s': %s", session.token(), e.getDescription().cStr());
    } catch (std::exception & e) { // NOLINT(inkforge-foreign-exceptions)
        printError("session '%s': %s", session.token(), e.what());
    } catch (...) { // NOLINT(inkforge-foreign-exceptions)
        printError("session '%s': failed with an exception of unknown type", session.token());
    }
    session.fail(kind, describeFailure(failure));
}

kj::Promise<void> Orchestrator::terminateSandbox(BuildSession & session, SessionResources & res)
{
    if (!res.sandbox) {
        co_return;
    }
    auto terminated = co_await res.sandbox->terminate();
    if (terminated.has_error()) {
        logFatal(fmt(
            "session '%s': could not remove its sandbox: %s",
            session.token(),
            describeFailure(terminated.error())
        ));
    }
}

kj::Promise<void> Orchestrator::releaseVolume(BuildSession & session, VolumeHandle & volume)
{
    auto released = co_await volumes.release(volume);
    session.setVolumeRecord(volume.toJSON());
    if (released.has_error()) {
        haltAdmissions(fmt(
            "session '%s': releasing its volume failed: %s",
            session.token(),
            describeFailure(released.error())
        ));
    }
}

void Orchestrator::raiseAlerts(const BuildSession & session)
{
    auto kind = session.failure();
    if (!kind) {
        consecutiveSandboxFailures = 0;
        return;
    }

    if (*kind == FailureKind::VolumeProvisionFailure) {
        logFatal(fmt(
            "session '%s': volume provisioning failed, the host may be out of capacity: %s",
            session.token(),
            session.reason()
        ));
    }

    if (*kind == FailureKind::SandboxRuntimeFailure) {
        consecutiveSandboxFailures += 1;
        if (consecutiveSandboxFailures >= settings.sandboxFailureAlertThreshold) {
            logFatal(fmt(
                "%d consecutive sandbox failures, the last in session '%s': %s",
                consecutiveSandboxFailures,
                session.token(),
                session.reason()
            ));
        }
    }
}

void Orchestrator::haltAdmissions(const std::string & why)
{
    admissionsHalted_ = true;
    logFatal(fmt("%s; no further sessions are admitted until the builder is restarted", why));
}

void Orchestrator::persist(const BuildSession & session)
{
    records.write(session);
}

void Orchestrator::notify(const BuildSession & session)
{
    for (auto & listener : listeners) {
        try {
            listener(session);
        } catch (Error & e) {
            printError("completion listener of session '%s' failed: %s", session.token(), e.msg());
        }
    }
}

void Orchestrator::onFinished(FinishedListener listener)
{
    listeners.push_back(std::move(listener));
}

std::vector<std::shared_ptr<const BuildSession>> Orchestrator::activeSessions() const
{
    std::vector<std::shared_ptr<const BuildSession>> result;
    for (auto & [token, entry] : active) {
        result.push_back(entry.session);
    }
    return result;
}

kj::Promise<Result<void>> Orchestrator::recover()
try {
    unsigned orphans = 0;

    for (auto & session : records.list()) {
        if (active.contains(session.token())) {
            continue;
        }

        auto volume = session.volumeRecord()
            ? std::optional(VolumeHandle::fromJSON(*session.volumeRecord()))
            : std::nullopt;
        bool terminal = isTerminal(session.state());

        // terminal sessions whose volume could not be released get another try
        if (terminal && (!volume || volume->released)) {
            continue;
        }

        if (!terminal) {
            orphans += 1;
            printTaggedWarning(
                "session '%s' was %s when the builder stopped, reclaiming its resources",
                session.token(),
                showSessionState(session.state())
            );
            if (auto & sandbox = session.sandboxRecord()) {
                auto reclaimed = co_await runtime.reclaim(*sandbox);
                if (reclaimed.has_error()) {
                    logFatal(fmt(
                        "session '%s': could not reclaim its sandbox: %s",
                        session.token(),
                        describeFailure(reclaimed.error())
                    ));
                }
            }
        }

        if (volume) {
            auto released = co_await volumes.release(*volume);
            session.setVolumeRecord(volume->toJSON());
            if (released.has_error()) {
                haltAdmissions(fmt(
                    "session '%s': releasing its volume failed: %s",
                    session.token(),
                    describeFailure(released.error())
                ));
                // keep the record as it is so the next start tries again
                continue;
            }
        }

        if (!terminal) {
            session.fail(FailureKind::Cancelled, "builder restarted while the session was running");
        }
        persist(session);
        if (!terminal) {
            notify(session);
        }
    }

    if (orphans > 0) {
        notice("reclaimed the resources of %d orphaned sessions", orphans);
    }
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> Orchestrator::shutdown()
try {
    shuttingDown = true;

    auto finished = kj::heapArrayBuilder<kj::Promise<void>>(active.size());
    for (auto & [token, entry] : active) {
        finished.add(entry.finished.addBranch());
    }
    std::vector<std::string> tokens;
    for (auto & [token, entry] : active) {
        tokens.push_back(token);
    }
    for (auto & token : tokens) {
        cancel(token, "the builder is shutting down");
    }

    co_await kj::joinPromises(finished.finish());
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

}
