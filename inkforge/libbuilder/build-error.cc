#include "inkforge/libbuilder/build-error.hh"

namespace inkforge {

static const std::pair<FailureKind, std::string_view> failureKindNames[] = {
    {FailureKind::DownloadFailure, "download-failure"},
    {FailureKind::UnpackFailure, "unpack-failure"},
    {FailureKind::UploadFailure, "upload-failure"},
    {FailureKind::SealFailure, "seal-failure"},
    {FailureKind::ToolchainInstallFailure, "toolchain-install-failure"},
    {FailureKind::CompileFailure, "compile-failure"},
    {FailureKind::ArtifactMissing, "artifact-missing"},
    {FailureKind::ArtifactTooLarge, "artifact-too-large"},
    {FailureKind::ArtifactInvalid, "artifact-invalid"},
    {FailureKind::ResourceExceeded, "resource-exceeded"},
    {FailureKind::VolumeProvisionFailure, "volume-provision-failure"},
    {FailureKind::SandboxRuntimeFailure, "sandbox-runtime-failure"},
    {FailureKind::Timeout, "timeout"},
    {FailureKind::Cancelled, "cancelled"},
};

std::string_view showFailureKind(FailureKind kind)
{
    for (auto & [k, name] : failureKindNames) {
        if (k == kind) {
            return name;
        }
    }
    throw Error("unknown failure kind %d", static_cast<int>(kind));
}

std::optional<FailureKind> parseFailureKind(std::string_view s)
{
    for (auto & [k, name] : failureKindNames) {
        if (name == s) {
            return k;
        }
    }
    return std::nullopt;
}

}
