#include "inkforge/libbuilder/build-settings.hh"
#include "inkforge/libutil/config-impl.hh"
#include "inkforge/libutil/error.hh"

namespace inkforge {

BuilderSettings builderSettings;

void BuilderSettings::validate() const
{
    if (workerCount.get() == 0) {
        throw UsageError("setting 'worker-count' must be at least 1");
    }
    if (memorySwapLimit.get() < memoryLimit.get()) {
        throw UsageError(
            "setting 'memory-swap-limit' (%s) is below 'memory-limit' (%s)",
            memorySwapLimit.to_string(),
            memoryLimit.to_string()
        );
    }
    if (maxBuildDuration.get() == 0) {
        throw UsageError("setting 'max-build-duration' must be at least 1");
    }
    if (logLines.get() == 0) {
        throw UsageError("setting 'log-lines' must be at least 1");
    }
}

BuildLimits BuilderSettings::limits() const
{
    return BuildLimits{
        .memory = memoryLimit,
        .memorySwap = memorySwapLimit,
        .volumeSize = volumeSize,
        .pids = pidsLimit,
        .maxBuildDuration = std::chrono::seconds(maxBuildDuration.get()),
        .wasmSize = wasmSizeLimit,
        .metadataSize = metadataSizeLimit,
    };
}

JSON BuildLimits::toJSON() const
{
    return {
        {"memory", memory},
        {"memory_swap", memorySwap},
        {"volume_size", volumeSize},
        {"pids", pids},
        {"max_build_duration", static_cast<uint64_t>(maxBuildDuration.count())},
        {"wasm_size", wasmSize},
        {"metadata_size", metadataSize},
    };
}

BuildLimits BuildLimits::fromJSON(const JSON & json)
{
    ensureType(json, JSON::value_t::object);
    return BuildLimits{
        .memory = getUnsigned(valueAt(json, "memory")),
        .memorySwap = getUnsigned(valueAt(json, "memory_swap")),
        .volumeSize = getUnsigned(valueAt(json, "volume_size")),
        .pids = getUnsigned(valueAt(json, "pids")),
        .maxBuildDuration = std::chrono::seconds(getUnsigned(valueAt(json, "max_build_duration"))),
        .wasmSize = getUnsigned(valueAt(json, "wasm_size")),
        .metadataSize = getUnsigned(valueAt(json, "metadata_size")),
    };
}

template<> VolumeBackend BaseSetting<VolumeBackend>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "loop") return VolumeBackend::Loop;
    else if (str == "directory") return VolumeBackend::Directory;
    else throw UsageError("option '%s' has invalid value '%s'", name, str);
}

template<> std::string BaseSetting<VolumeBackend>::to_string() const
{
    switch (value) {
    case VolumeBackend::Loop: return "loop";
    case VolumeBackend::Directory: return "directory";
    }
    throw Error("invalid volume backend %d", static_cast<int>(value));
}

template<> SandboxRuntimeKind BaseSetting<SandboxRuntimeKind>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "linux") return SandboxRuntimeKind::Linux;
    else if (str == "process") return SandboxRuntimeKind::Process;
    else throw UsageError("option '%s' has invalid value '%s'", name, str);
}

template<> std::string BaseSetting<SandboxRuntimeKind>::to_string() const
{
    switch (value) {
    case SandboxRuntimeKind::Linux: return "linux";
    case SandboxRuntimeKind::Process: return "process";
    }
    throw Error("invalid sandbox runtime %d", static_cast<int>(value));
}

template class BaseSetting<VolumeBackend>;
template class BaseSetting<SandboxRuntimeKind>;

}
