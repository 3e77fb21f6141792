#pragma once
///@file

#include "inkforge/libbuilder/build-error.hh"
#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/types.hh"

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace inkforge {

/**
 * The states of a build session, in pipeline order. `Failed` and `TimedOut`
 * are exits, not steps, and sort after `Succeeded`.
 */
enum class SessionState {
    Queued,
    Provisioning,
    Unarchiving,
    Sealing,
    Building,
    NormalizingOutput,
    Succeeded,
    Failed,
    TimedOut,
};

std::string_view showSessionState(SessionState state);

std::optional<SessionState> parseSessionState(std::string_view s);

bool isTerminal(SessionState state);

/**
 * What a client asks for. Validated by the orchestrator on submission.
 */
struct BuildRequest
{
    std::string token;
    std::string sourceUrl;
    std::string cargoContractVersion;
    std::string rustToolchain;
    /**
     * Directory of the contract inside the sources, for workspaces holding
     * several contracts. Relative; unset means the root of the sources.
     */
    std::optional<std::string> projectDirectory = std::nullopt;

    JSON toJSON() const;

    /**
     * Parse a request document. A missing `rust_toolchain` falls back to
     * `defaultToolchain`; a missing, null or empty `project_directory`
     * means the root of the sources.
     */
    static BuildRequest fromJSON(const JSON & json, const std::string & defaultToolchain);
};

/**
 * The two files a successful build leaves behind, after they were copied out
 * of the volume.
 */
struct ArtifactSet
{
    Path module;
    Path metadata;
    uint64_t moduleSize = 0;
    uint64_t metadataSize = 0;
    /** base16 SHA-256 of the module */
    std::string codeHash;

    JSON toJSON() const;
    static ArtifactSet fromJSON(const JSON & json);
};

struct StageTiming
{
    std::string stage;
    SessionState state;
    std::chrono::system_clock::time_point start;
    std::optional<std::chrono::system_clock::time_point> end;
};

/**
 * The record tying a request to its progress and outcome. Only the task that
 * runs the session mutates it.
 */
class BuildSession
{
    BuildRequest request_;
    BuildLimits limits_;
    SessionState state_ = SessionState::Queued;
    std::chrono::system_clock::time_point created_;
    std::chrono::steady_clock::time_point createdSteady_;
    std::vector<StageTiming> timings_;

    size_t logCapacity_;
    std::deque<std::string> logTail_;

    std::optional<FailureKind> failure_;
    std::string reason_;
    std::optional<ArtifactSet> artifacts_;

    std::optional<JSON> volumeRecord_;
    std::optional<JSON> sandboxRecord_;

    void enter(SessionState next, std::string_view stage);

public:
    BuildSession(BuildRequest request, BuildLimits limits, size_t logCapacity);

    const BuildRequest & request() const { return request_; }
    const std::string & token() const { return request_.token; }
    const BuildLimits & limits() const { return limits_; }
    SessionState state() const { return state_; }
    std::chrono::system_clock::time_point created() const { return created_; }
    const std::vector<StageTiming> & timings() const { return timings_; }
    const std::deque<std::string> & logTail() const { return logTail_; }
    std::optional<FailureKind> failure() const { return failure_; }
    const std::string & reason() const { return reason_; }
    const std::optional<ArtifactSet> & artifacts() const { return artifacts_; }

    /**
     * The stage currently running, or the last one that ran.
     */
    std::optional<std::string> currentStage() const;

    /**
     * Move to `next`, starting `stage`. Staying in the same state starts a new
     * stage within it. Throws `InvalidTransition` for anything that is not a
     * forward move along the pipeline; only `Sealing` may be skipped.
     */
    void advance(SessionState next, std::string_view stage);

    void fail(FailureKind kind, std::string reason);
    void timeOut(std::string reason);

    /**
     * Finish the session. Only allowed from `NormalizingOutput`.
     */
    void succeed(ArtifactSet artifacts);

    void appendLogLine(std::string line);

    const std::optional<JSON> & volumeRecord() const { return volumeRecord_; }
    const std::optional<JSON> & sandboxRecord() const { return sandboxRecord_; }
    void setVolumeRecord(JSON record) { volumeRecord_ = std::move(record); }
    void setSandboxRecord(JSON record) { sandboxRecord_ = std::move(record); }

    JSON toJSON() const;
    static BuildSession fromJSON(const JSON & json);
};

}
