#pragma once
///@file

#include "inkforge/libutil/error.hh"

#include <optional>
#include <string_view>

namespace inkforge {

/**
 * Why a build session failed. Every per-session error is reduced to one of
 * these before it is recorded; they are the only failure information clients
 * get besides the human-readable reason.
 */
enum class FailureKind {
    DownloadFailure,
    UnpackFailure,
    UploadFailure,
    SealFailure,
    ToolchainInstallFailure,
    CompileFailure,
    ArtifactMissing,
    ArtifactTooLarge,
    ArtifactInvalid,
    ResourceExceeded,
    VolumeProvisionFailure,
    SandboxRuntimeFailure,
    Timeout,
    Cancelled,
};

/**
 * kebab-case name, as used in config files, records and results.
 */
std::string_view showFailureKind(FailureKind kind);

std::optional<FailureKind> parseFailureKind(std::string_view s);

/**
 * A failure that ends exactly one build session. Thrown by stages, the
 * artifact validator and the resource managers; caught at the session
 * boundary by the orchestrator.
 */
class BuildFailure : public Error
{
public:
    FailureKind kind;

    template<typename... Args>
    BuildFailure(FailureKind kind, const Args & ... args)
        : Error(args...), kind(kind)
    { }
};

/**
 * A build request that can never be admitted: bad token, missing source,
 * unparseable versions, or a token that is already active.
 */
MakeError(InvalidBuildRequest, Error);

/**
 * A session state change that the state machine does not allow. Always a
 * bug in the caller, never caused by a submission.
 */
MakeError(InvalidTransition, Error);

}
