#pragma once
///@file

#include "inkforge/libbuilder/build-error.hh"
#include "inkforge/libbuilder/build-session.hh"
#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libbuilder/sandbox.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/types.hh"

#include <kj/async.h>
#include <functional>
#include <vector>

namespace inkforge {

/**
 * One step of the build pipeline. Stages are configuration: the same
 * definitions serve every session.
 */
struct StageDefinition
{
    std::string name;
    /** the session state the stage runs in */
    SessionState state;
    /** how a non-zero exit of the stage is recorded */
    FailureKind failureKind;
    /** command line; `@NAME@` is replaced by the variable `NAME` */
    Strings argv;
    /** variables that must be set for the stage to make sense */
    Strings requiredEnv;
};

/**
 * The stages every build runs, in order. The relay and seal stages are only
 * part of it when `relay-sources` is set.
 */
std::vector<StageDefinition> defaultPipeline(const BuilderSettings & settings);

/**
 * Variables derived from the request that stages may refer to besides the
 * sandbox environment.
 */
StringMap stageParameters(const BuildRequest & request, const BuilderSettings & settings);

/**
 * Check the versions a request asks for. Throws `InvalidBuildRequest`.
 */
void validateRequestVersions(const BuildRequest & request);

/**
 * The project directory must stay inside the sources: relative, without
 * `..`, at most 64 characters of letters, digits, space and `._/-`. Throws
 * `InvalidBuildRequest`.
 */
void validateProjectDirectory(const BuildRequest & request);

/**
 * Replace every `@NAME@` in the stage's command line. Throws a
 * `sandbox-runtime-failure` if a required variable or a placeholder has no
 * value.
 */
Strings substituteArgv(const StageDefinition & stage, const StringMap & vars);

/**
 * The log file of one session, shared by all its stages. Holds at most
 * `limit` bytes; the first write that does not fit is cut off and followed
 * by a note, everything after it is dropped.
 */
class StageLog
{
    AutoCloseFD fd;
    uint64_t limit;
    uint64_t written = 0;
    bool full = false;

public:
    StageLog(const Path & path, uint64_t limit);

    void append(std::string_view data);

    bool truncated() const
    {
        return full;
    }
};

/**
 * Run `stage` in `sandbox` and wait for it. Output is appended to `log`,
 * logged, and kept in the session's log tail. Throws `BuildFailure` with the
 * stage's failure kind if it exits non-zero, or `resource-exceeded` if the
 * runtime killed it. `spawned` runs once the stage's process exists.
 */
kj::Promise<Result<void>> runStage(
    BuildSession & session,
    Sandbox & sandbox,
    const StageDefinition & stage,
    const StringMap & vars,
    StageLog & log,
    std::function<void()> spawned = {}
);

}
