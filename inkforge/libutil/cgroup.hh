#pragma once
///@file

#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/types.hh"

#include <filesystem>
#include <optional>
#include <kj/async.h>
#include <kj/common.h>

namespace inkforge {

/* This represents the part of the cgroup hierarchy the builder runs in.
 * Every process must live in a leaf of the delegated tree, so the builder
 * itself runs in a `supervisor` leaf and sandboxes are created as siblings:
 *
 *           inkforge-builder.service cgroup (delegated)
 *                         /   \
 *                        /     \
 *       inkforge-<token> cgroups   supervisor cgroup
 *                 |                   |
 *       build stage processes     inkforge-builder
 *
 * systemd's `Delegate=yes` plus `DelegateSubgroup=supervisor` arranges
 * this automatically.
 */
struct CgroupHierarchy
{
    std::filesystem::path ourCgroupPath;
    std::optional<std::filesystem::path> parentCgroupPath() const
    {
        if (ourCgroupPath.has_parent_path()) {
            return ourCgroupPath.parent_path();
        } else {
            return {};
        }
    }
};

/* Return the current process's view of the cgroup hierarchy. */
CgroupHierarchy getLocalHierarchy(std::filesystem::path const & cgroupFilesystem);

/* Return a path to the cgroupv2 filesystem path, if it exist */
std::optional<std::filesystem::path> getCgroupFS();

struct CgroupLimits
{
    uint64_t memoryMax;
    /** Swap on top of `memoryMax`, i.e. memory+swap minus memory. */
    uint64_t swapMax;
    uint64_t pidsMax;
};

/**
 * Kill everything in the cgroup at `path`, wait for it to empty, and remove it.
 * Waits on the event loop, for at most two minutes. Returns false if the
 * cgroup did not exist.
 */
kj::Promise<Result<bool>> destroyCgroup(std::string name, std::filesystem::path path);

/**
 * RAII class to hold an owned cgroup which will kill all processes under its
 * hierarchy at destruction time. Only `destroy` waits for them to be gone.
 */
class AutoDestroyCgroup
{
    /* Friendly name of this cgroup */
    std::string name_;

    /* Empty once the cgroup was destroyed. */
    std::optional<std::filesystem::path> cgroup_;

public:
    KJ_DISALLOW_COPY_AND_MOVE(AutoDestroyCgroup);

    /* Create the cgroup `name` below `parent`, enabling the memory, pids and
     * cpu controllers for the parent's children. Fails if a cgroup of the same
     * name exists already. */
    AutoDestroyCgroup(const std::filesystem::path & parent, std::string const & name);
    ~AutoDestroyCgroup();

    /* Kill all processes under its hierarchy and tear down the cgroup */
    kj::Promise<Result<void>> destroy();

    std::optional<Path> path() const
    {
        if (cgroup_) {
            return cgroup_->string();
        }
        return std::nullopt;
    }

    const std::string & name() const
    {
        return name_;
    }

    void applyLimits(const CgroupLimits & limits);

    /* Adopt a process in this cgroup. */
    void adoptProcess(int pid);

    /* Kill all processes under the control group. */
    void kill();

    /* Number of processes the kernel OOM killer killed in this cgroup. */
    uint64_t oomKillCount() const;
};
}
