#include "inkforge/libbuilder/volume.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/mount.hh"
#include "inkforge/libutil/processes.hh"
#include "inkforge/libutil/strings.hh"

#include <kj/exception.h>
#include <sys/mount.h>
#include <unistd.h>

namespace inkforge {

JSON VolumeHandle::toJSON() const
{
    return {
        {"id", id},
        {"image", image},
        {"mount_point", mountPoint},
        {"loop_devices", loopDevices},
        {"released", released},
    };
}

VolumeHandle VolumeHandle::fromJSON(const JSON & json)
{
    ensureType(json, JSON::value_t::object);
    VolumeHandle handle{
        .id = getString(valueAt(json, "id")),
        .image = getString(valueAt(json, "image")),
        .mountPoint = getString(valueAt(json, "mount_point")),
    };
    for (auto & device : ensureType(valueAt(json, "loop_devices"), JSON::value_t::array)) {
        handle.loopDevices.push_back(getString(device));
    }
    handle.released = ensureType(valueAt(json, "released"), JSON::value_t::boolean).get<bool>();
    return handle;
}

kj::Promise<Result<VolumeHandle>> VolumeManager::provision(const std::string & id, uint64_t size)
try {
    auto handle = plan(id);
    TRY_AWAIT(provision(handle, size));
    co_return handle;
} catch (...) {
    co_return result::current_exception();
}

/**
 * Run one of the volume tools and return its stdout. stderr goes to ours so
 * the tool's own diagnostics end up in the builder log.
 */
static kj::Promise<Result<std::string>> runTool(const std::string & program, Strings args)
try {
    co_return TRY_AWAIT(runProgram(program, true, std::move(args)));
} catch (...) {
    co_return result::current_exception();
}

LoopVolumeManager::LoopVolumeManager(Path imagesPath)
    : imagesPath(std::move(imagesPath))
{
}

VolumeHandle LoopVolumeManager::plan(const std::string & id)
{
    return VolumeHandle{
        .id = id,
        .image = imagesPath + "/" + id + ".img",
        .mountPoint = imagesPath + "/" + id,
    };
}

kj::Promise<Result<void>> LoopVolumeManager::provisionSteps(VolumeHandle & handle, uint64_t size)
try {
    createDirs(imagesPath);
    if (pathExists(handle.image)) {
        throw VolumeProvisionError("backing image '%s' already exists", handle.image);
    }

    TRY_AWAIT(runTool("fallocate", {"-l", std::to_string(size), handle.image}));
    TRY_AWAIT(runTool("mkfs.ext4", {"-q", "-F", handle.image}));

    auto device = trim(TRY_AWAIT(runTool("losetup", {"--find", "--show", handle.image})));
    if (device.empty()) {
        throw VolumeProvisionError("losetup did not report a loop device for '%s'", handle.image);
    }
    handle.loopDevices.push_back(device);

    createDirs(handle.mountPoint);
    if (mount(device.c_str(), handle.mountPoint.c_str(), "ext4", MS_NOSUID | MS_NODEV, nullptr) == -1) {
        throw SysError("mounting '%s' on '%s'", device, handle.mountPoint);
    }

    debug("volume '%s' mounted at '%s' from '%s'", handle.id, handle.mountPoint, device);
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> VolumeManager::provisionOrRollBack(
    VolumeHandle & handle, kj::Promise<Result<void>> steps
)
try {
    std::string failure;
    try {
        TRY_AWAIT(std::move(steps));
        co_return result::success();
    } catch (BaseError & e) {
        failure = e.msg();
    } catch (BaseException & e) {
        failure = e.what();
    } catch (kj::Exception & e) {
        failure = e.getDescription().cStr();
    }

    // leave nothing behind for a volume that never became usable
    auto rollback = co_await release(handle);
    if (rollback.has_error()) {
        try {
            rollback.value();
        } catch (BaseError & e) {
            printError("rolling back volume '%s' failed: %s", handle.id, e.msg());
        } catch (std::exception & e) { // NOLINT(inkforge-foreign-exceptions)
            printError("rolling back volume '%s' failed: %s", handle.id, e.what());
        }
    }

    throw VolumeProvisionError("provisioning volume '%s': %s", handle.id, failure);
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> LoopVolumeManager::provision(VolumeHandle & handle, uint64_t size)
{
    return provisionOrRollBack(handle, provisionSteps(handle, size));
}

kj::Promise<Result<void>> LoopVolumeManager::release(VolumeHandle & handle)
try {
    if (handle.released) {
        co_return result::success();
    }

    try {
        if (isMountPoint(handle.mountPoint)) {
            unmount(handle.mountPoint);
        }

        if (pathExists(handle.image)) {
            // every device the image is attached to, not just the ones we
            // recorded: a crash can happen between losetup and the record
            auto associated = TRY_AWAIT(runTool("losetup", {"--associated", handle.image}));
            for (auto & line : tokenizeString<Strings>(associated, "\n")) {
                auto colon = line.find(':');
                if (colon == std::string::npos) {
                    continue;
                }
                auto device = line.substr(0, colon);
                TRY_AWAIT(runTool("losetup", {"--detach", device}));
                debug("detached '%s' from volume '%s'", device, handle.id);
            }

            if (unlink(handle.image.c_str()) == -1 && errno != ENOENT) {
                throw SysError("removing backing image '%s'", handle.image);
            }
        }

        if (rmdir(handle.mountPoint.c_str()) == -1 && errno != ENOENT) {
            throw SysError("removing mount point '%s'", handle.mountPoint);
        }
    } catch (VolumeReleaseError &) {
        throw;
    } catch (Error & e) {
        throw VolumeReleaseError("releasing volume '%s': %s", handle.id, e.msg());
    }

    handle.released = true;
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> LoopVolumeManager::checkBackingStore()
try {
    if (geteuid() != 0) {
        throw Error(
            "loop volumes need root privileges; use 'volume-backend = directory' "
            "for unprivileged builds"
        );
    }

    createDirs(imagesPath);
    if (access(imagesPath.c_str(), W_OK) == -1) {
        throw SysError("images path '%s' is not writable", imagesPath);
    }

    TRY_AWAIT(runTool("fallocate", {"--version"}));
    TRY_AWAIT(runTool("mkfs.ext4", {"-V"}));
    TRY_AWAIT(runTool("losetup", {"--version"}));

    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

DirectoryVolumeManager::DirectoryVolumeManager(Path root)
    : root(std::move(root))
{
}

VolumeHandle DirectoryVolumeManager::plan(const std::string & id)
{
    auto path = root + "/" + id;
    return VolumeHandle{
        .id = id,
        .image = path,
        .mountPoint = path,
    };
}

kj::Promise<Result<void>> DirectoryVolumeManager::provision(VolumeHandle & handle, uint64_t size)
try {
    try {
        createDirs(root);
        if (mkdir(handle.mountPoint.c_str(), 0755) == -1) {
            throw SysError("creating volume directory '%s'", handle.mountPoint);
        }
    } catch (Error & e) {
        throw VolumeProvisionError("provisioning volume '%s': %s", handle.id, e.msg());
    }
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> DirectoryVolumeManager::release(VolumeHandle & handle)
try {
    if (handle.released) {
        co_return result::success();
    }
    try {
        deletePath(handle.mountPoint);
    } catch (Error & e) {
        throw VolumeReleaseError("releasing volume '%s': %s", handle.id, e.msg());
    }
    handle.released = true;
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> DirectoryVolumeManager::checkBackingStore()
try {
    createDirs(root);
    if (access(root.c_str(), W_OK) == -1) {
        throw SysError("volume directory '%s' is not writable", root);
    }
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

}
