#pragma once
///@file

#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libbuilder/volume.hh"
#include "inkforge/libutil/async-io.hh"
#include "inkforge/libutil/cgroup.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/processes.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/types.hh"

#include <kj/async.h>
#include <filesystem>
#include <memory>

namespace inkforge {

/**
 * The sandbox could not be created, entered or cleaned up. Recorded as
 * `sandbox-runtime-failure`.
 */
MakeError(SandboxRuntimeError, Error);

struct ExitOutcome
{
    /** raw wait status */
    int status;
    /** the runtime killed the process for exceeding a resource ceiling */
    bool resourceExceeded;

    bool success() const
    {
        return statusOk(status) && !resourceExceeded;
    }
};

/**
 * An isolated execution context bound to one session. Runs at most one
 * process tree at a time; stages are spawned into it one after another.
 */
class Sandbox
{
protected:
    std::string name_;
    StringMap env_;
    Pid pid_;
    bool terminated_ = false;

    /** Parent side, before the child is created. */
    virtual void prepareSpawn() {}

    /** Parent side, right after the child was created and before it execs. */
    virtual void adoptChild() {}

    /**
     * Child side: confine the process. Runs after stdio is redirected and
     * before exec; exceptions are reported to the parent.
     */
    virtual void enterSandbox() = 0;

    virtual ProcessOptions processOptions() const;

    /** Kill whatever the stage's main process left behind. */
    virtual void reapStragglers() = 0;

    virtual bool resourceExceeded() = 0;

    /** Remove runtime state. Called once the process tree is gone. */
    virtual kj::Promise<Result<void>> destroy() = 0;

public:
    Sandbox(std::string name, StringMap env);
    virtual ~Sandbox() noexcept(false) {}

    KJ_DISALLOW_COPY_AND_MOVE(Sandbox);

    const std::string & name() const { return name_; }
    const StringMap & env() const { return env_; }

    /**
     * Start `argv` in the sandbox with stdout and stderr merged into the
     * returned stream. Resolves once the program was executed; fails with
     * `SandboxRuntimeError` if the sandbox cannot be entered or the program
     * cannot be executed.
     */
    kj::Promise<Result<std::unique_ptr<AsyncFdInputStream>>> spawn(Strings argv);

    /**
     * Wait for the spawned process to exit without blocking the event loop.
     * Everything it left running is killed before this returns.
     */
    kj::Promise<Result<ExitOutcome>> wait();

    /**
     * Force-kill the process tree and remove the sandbox without blocking the
     * event loop. Idempotent.
     */
    kj::Promise<Result<void>> terminate();

    /**
     * Enough information to reclaim the sandbox after a builder crash.
     */
    virtual JSON describe() const = 0;
};

class SandboxRuntime
{
public:
    virtual ~SandboxRuntime() = default;

    /**
     * Create a sandbox for `volume`. `env` holds the externally supplied
     * variables; the runtime adds `PATH` and `HOME`.
     */
    virtual std::unique_ptr<Sandbox> launch(
        const VolumeHandle & volume,
        const Path & image,
        StringMap env,
        const BuildLimits & limits,
        const std::string & name
    ) = 0;

    /**
     * Force-release a sandbox described by `Sandbox::describe`, no matter
     * which runtime created it.
     */
    kj::Promise<Result<void>> reclaim(JSON description);
};

/**
 * Namespaces, a cgroup and a read-only root file system. Requires root and a
 * delegated cgroup v2 hierarchy.
 */
class LinuxSandboxRuntime : public SandboxRuntime
{
    std::filesystem::path cgroupParent;
    Path sandboxesDir;
    std::string sandboxPath;

public:
    /**
     * `cgroupParent` empty means the parent of the builder's own cgroup.
     */
    LinuxSandboxRuntime(const std::string & cgroupParent, Path stateDir, std::string sandboxPath);

    std::unique_ptr<Sandbox> launch(
        const VolumeHandle & volume,
        const Path & image,
        StringMap env,
        const BuildLimits & limits,
        const std::string & name
    ) override;
};

/**
 * A process group with rlimits, running in the volume directory. No file
 * system confinement and no OOM detection; for development and tests.
 */
class ProcessSandboxRuntime : public SandboxRuntime
{
    std::string sandboxPath;

public:
    explicit ProcessSandboxRuntime(std::string sandboxPath);

    std::unique_ptr<Sandbox> launch(
        const VolumeHandle & volume,
        const Path & image,
        StringMap env,
        const BuildLimits & limits,
        const std::string & name
    ) override;
};

}
