#pragma once
///@file

#include "inkforge/libutil/config.hh"
#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/types.hh"

#include <chrono>

namespace inkforge {

enum class VolumeBackend { Loop, Directory };

enum class SandboxRuntimeKind { Linux, Process };

/**
 * The resource ceilings a session runs under. Copied out of the settings when
 * the session is admitted so that a configuration reload never changes the
 * limits of a build already in flight.
 */
struct BuildLimits
{
    uint64_t memory;
    /** memory plus swap, as the sandbox runtimes expect it */
    uint64_t memorySwap;
    uint64_t volumeSize;
    uint64_t pids;
    std::chrono::seconds maxBuildDuration;
    uint64_t wasmSize;
    uint64_t metadataSize;

    JSON toJSON() const;
    static BuildLimits fromJSON(const JSON & json);
};

class BuilderSettings : public Config
{
public:
    BuilderSettings() = default;

    /**
     * Reject combinations of settings the builder cannot run with. Called
     * once after the configuration is loaded.
     */
    void validate() const;

    BuildLimits limits() const;

    PathSetting imagesPath{this, "/var/lib/inkforge/images", "images-path",
        "Directory holding the backing images and mount points of build volumes."};

    Setting<std::string> apiServerUrl{this, "http://127.0.0.1:3000", "api-server-url",
        "Base URL of the coordinating API, passed to every sandbox."};

    Setting<unsigned int> workerCount{this, 1, "worker-count",
        "Maximum number of build sessions that hold resources at the same time."};

    Setting<unsigned int> maxBuildDuration{this, 3600, "max-build-duration",
        "Wall-clock budget of a session in seconds, counted from provisioning."};

    ByteSizeSetting wasmSizeLimit{this, 5ULL << 20, "wasm-size-limit",
        "Maximum size of the compiled module."};

    ByteSizeSetting metadataSizeLimit{this, 1ULL << 20, "metadata-size-limit",
        "Maximum size of the metadata file."};

    ByteSizeSetting memoryLimit{this, 4ULL << 30, "memory-limit",
        "Memory ceiling of a sandbox."};

    ByteSizeSetting memorySwapLimit{this, 4ULL << 30, "memory-swap-limit",
        "Memory plus swap ceiling of a sandbox. Must not be below memory-limit."};

    ByteSizeSetting volumeSize{this, 8ULL << 30, "volume-size",
        "Capacity of the volume every session builds in."};

    Setting<uint64_t> pidsLimit{this, 768, "pids-limit",
        "Maximum number of tasks in a sandbox."};

    PathSetting stateDir{this, "/var/lib/inkforge/state", "state-dir",
        "Directory holding session records and stage logs."};

    PathSetting spoolDir{this, "/var/lib/inkforge/spool", "spool-dir",
        "Directory through which build requests arrive and results leave."};

    PathSetting artifactsDir{this, "/var/lib/inkforge/artifacts", "artifacts-dir",
        "Directory successful builds copy their artifacts to."};

    PathSetting toolchainImage{this, "/var/lib/inkforge/toolchain", "toolchain-image",
        "Root file system sandboxes run in. Mounted read-only."};

    Setting<VolumeBackend> volumeBackend{this, VolumeBackend::Loop, "volume-backend",
        "How build volumes are made: `loop` or `directory`."};

    Setting<SandboxRuntimeKind> sandboxRuntime{this, SandboxRuntimeKind::Linux, "sandbox-runtime",
        "How stages are isolated: `linux` or `process`."};

    Setting<std::string> sandboxPath{this,
        "/contract/.cargo/bin:/usr/local/cargo/bin:/usr/local/bin:/usr/bin:/bin",
        "sandbox-path",
        "PATH inside the sandbox."};

    Setting<std::string> cgroupParent{this, "", "cgroup-parent",
        "cgroup under which sandbox cgroups are created. Empty means the parent "
        "of the builder's own cgroup."};

    Setting<bool> relaySources{this, false, "relay-sources",
        "Upload the unpacked sources to the API and seal them before building."};

    Setting<StringSet> prebakedCargoContractVersions{this, {}, "prebaked-cargo-contract-versions",
        "cargo-contract versions present in the toolchain image."};

    Setting<std::string> defaultRustToolchain{this, "stable", "default-rust-toolchain",
        "Rust toolchain used when a request does not name one."};

    Setting<unsigned int> logLines{this, 25, "log-lines",
        "Number of stage output lines kept with a session."};

    ByteSizeSetting logSizeLimit{this, 16ULL << 20, "log-size-limit",
        "Maximum size of a session's stage log file. Output past it is dropped."};

    Setting<unsigned int> sandboxFailureAlertThreshold{this, 3, "sandbox-failure-alert-threshold",
        "Consecutive sandbox failures after which an operational alert is raised."};

    Setting<unsigned int> spoolPollInterval{this, 1000, "spool-poll-interval",
        "Milliseconds between two scans of the spool directory."};
};

/** Loaded once by `inkforge-builder`; library code takes settings by reference. */
extern BuilderSettings builderSettings;

template<> VolumeBackend BaseSetting<VolumeBackend>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<VolumeBackend>::to_string() const;
template<> SandboxRuntimeKind BaseSetting<SandboxRuntimeKind>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<SandboxRuntimeKind>::to_string() const;

extern template class BaseSetting<VolumeBackend>;
extern template class BaseSetting<SandboxRuntimeKind>;

}
