#pragma once
///@file

#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/types.hh"

#include <kj/async.h>

namespace inkforge {

MakeError(VolumeProvisionError, Error);

/**
 * Failure to unmount or detach a volume. Leaks host resources, so it is
 * escalated to the operator instead of being recorded as a session failure.
 */
MakeError(VolumeReleaseError, Error);

/**
 * The private storage of one session. Persisted in the session record so a
 * restarted builder can release it.
 */
struct VolumeHandle
{
    std::string id;
    /** backing file; for directory volumes the directory itself */
    Path image;
    Path mountPoint;
    /** loop devices the backing file was attached to */
    Strings loopDevices;
    bool released = false;

    JSON toJSON() const;
    static VolumeHandle fromJSON(const JSON & json);
};

class VolumeManager
{
protected:
    /**
     * Await `steps`. If they fail in any way, release whatever they created
     * and fail with `VolumeProvisionError`.
     */
    kj::Promise<Result<void>> provisionOrRollBack(VolumeHandle & handle, kj::Promise<Result<void>> steps);

public:
    virtual ~VolumeManager() = default;

    /**
     * Decide where the volume for `id` lives without creating anything, so
     * the location can be recorded before any resource exists.
     */
    virtual VolumeHandle plan(const std::string & id) = 0;

    /**
     * Create, format and mount a volume of `size` bytes at the planned
     * location. On failure everything created so far is removed again and a
     * `VolumeProvisionError` is returned; callers must not retry.
     */
    virtual kj::Promise<Result<void>> provision(VolumeHandle & handle, uint64_t size) = 0;

    kj::Promise<Result<VolumeHandle>> provision(const std::string & id, uint64_t size);

    /**
     * Unmount the volume and reclaim its backing store. Idempotent: every
     * step accepts that it was already done, including by a previous run of
     * the builder. Fails with `VolumeReleaseError`.
     */
    virtual kj::Promise<Result<void>> release(VolumeHandle & handle) = 0;

    /**
     * Make sure volumes can be provisioned at all. Run once at startup.
     */
    virtual kj::Promise<Result<void>> checkBackingStore() = 0;
};

/**
 * ext4 file systems in sparse files, attached to loop devices and mounted
 * below `images-path`. Requires root.
 */
class LoopVolumeManager : public VolumeManager
{
    Path imagesPath;

    kj::Promise<Result<void>> provisionSteps(VolumeHandle & handle, uint64_t size);

public:
    explicit LoopVolumeManager(Path imagesPath);

    VolumeHandle plan(const std::string & id) override;
    kj::Promise<Result<void>> provision(VolumeHandle & handle, uint64_t size) override;
    kj::Promise<Result<void>> release(VolumeHandle & handle) override;
    kj::Promise<Result<void>> checkBackingStore() override;

    using VolumeManager::provision;
};

/**
 * Plain directories below `images-path`. Capacity is not enforced; meant for
 * unprivileged development and the test suite.
 */
class DirectoryVolumeManager : public VolumeManager
{
    Path root;

public:
    explicit DirectoryVolumeManager(Path root);

    VolumeHandle plan(const std::string & id) override;
    kj::Promise<Result<void>> provision(VolumeHandle & handle, uint64_t size) override;
    kj::Promise<Result<void>> release(VolumeHandle & handle) override;
    kj::Promise<Result<void>> checkBackingStore() override;

    using VolumeManager::provision;
};

}
