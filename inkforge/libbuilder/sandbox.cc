#include "inkforge/libbuilder/sandbox.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/mount.hh"
#include "inkforge/libutil/signals.hh"
#include "inkforge/libutil/strings.hh"

#include <fcntl.h>
#include <linux/capability.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

extern char ** environ;

namespace inkforge {

Sandbox::Sandbox(std::string name, StringMap env)
    : name_(std::move(name))
    , env_(std::move(env))
{
}

ProcessOptions Sandbox::processOptions() const
{
    return ProcessOptions{};
}

kj::Promise<Result<std::unique_ptr<AsyncFdInputStream>>> Sandbox::spawn(Strings argv)
try {
    if (terminated_) {
        throw SandboxRuntimeError("sandbox '%s' was already terminated", name_);
    }
    if (pid_) {
        throw SandboxRuntimeError("sandbox '%s' already runs a process", name_);
    }
    if (argv.empty()) {
        throw SandboxRuntimeError("empty command for sandbox '%s'", name_);
    }

    Pipe out;
    out.create();
    // exec closes the write side, so the parent reads EOF on success and the
    // error message otherwise
    Pipe errors;
    errors.create();

    // allocating in the child is unsafe, build everything up front
    auto & program = argv.front();
    auto args = stringsToCharPtrs(argv);
    Strings envStrings;
    for (auto & [name, value] : env_) {
        envStrings.push_back(name + "=" + value);
    }
    auto envp = stringsToCharPtrs(envStrings);

    prepareSpawn();

    printMsg(lvlChatty, "sandbox '%s': running %s", name_, concatMapStringsSep(" ", argv, shellEscape));

    pid_ = startProcess([&]() {
        try {
            out.readSide.close();
            errors.readSide.close();

            AutoCloseFD null{open("/dev/null", O_RDONLY | O_CLOEXEC)};
            if (!null) {
                throw SysError("opening /dev/null");
            }
            if (dup2(null.get(), STDIN_FILENO) == -1) {
                throw SysError("dupping stdin");
            }
            if (dup2(out.writeSide.get(), STDOUT_FILENO) == -1) {
                throw SysError("dupping stdout");
            }
            if (dup2(STDOUT_FILENO, STDERR_FILENO) == -1) {
                throw SysError("dupping stderr");
            }

            enterSandbox();

            closeExtraFDs({errors.writeSide.get()});
            restoreSignals();

            // execvp searches the PATH of `environ`, which must be the sandbox's
            environ = envp.data();
            execvp(program.c_str(), args.data());
            throw SysError("executing '%s'", program);
        } catch (std::exception & e) { // NOLINT(inkforge-foreign-exceptions)
            writeFull(errors.writeSide.get(), e.what(), false);
        }
        _exit(127);
    }, processOptions());

    out.writeSide.close();
    errors.writeSide.close();

    std::optional<std::string> setupError;
    try {
        adoptChild();
    } catch (Error & e) {
        setupError = e.msg();
    }
    if (setupError) {
        TRY_AWAIT(pid_.killAsync());
        throw SandboxRuntimeError("setting up sandbox '%s': %s", name_, *setupError);
    }

    AsyncFdInputStream errorStream(std::move(errors.readSide));
    auto message = TRY_AWAIT(errorStream.drain());
    if (!message.empty()) {
        TRY_AWAIT(pid_.waitAsync());
        throw SandboxRuntimeError("starting '%s' in sandbox '%s': %s", program, name_, message);
    }

    co_return std::make_unique<AsyncFdInputStream>(std::move(out.readSide));
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<ExitOutcome>> Sandbox::wait()
try {
    if (!pid_) {
        throw SandboxRuntimeError("sandbox '%s' runs no process", name_);
    }
    auto status = TRY_AWAIT(pid_.waitAsync());
    reapStragglers();
    co_return ExitOutcome{.status = status, .resourceExceeded = resourceExceeded()};
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> Sandbox::terminate()
try {
    if (terminated_) {
        co_return result::success();
    }
    if (pid_) {
        debug("force-killing process tree of sandbox '%s'", name_);
        TRY_AWAIT(pid_.killAsync());
    }
    try {
        TRY_AWAIT(destroy());
    } catch (SandboxRuntimeError &) {
        throw;
    } catch (Error & e) {
        throw SandboxRuntimeError("removing sandbox '%s': %s", name_, e.msg());
    }
    terminated_ = true;
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

static StringMap sandboxEnvironment(StringMap env, const std::string & path, const Path & home)
{
    env["PATH"] = path;
    env["HOME"] = home;
    return env;
}

//////////////////////////////////////////////////////////////////////

class LinuxSandbox : public Sandbox
{
    std::unique_ptr<AutoDestroyCgroup> cgroup;
    Path root;
    Path image;
    Path volumeMount;
    uint64_t tmpSize;
    uint64_t oomKillsBefore = 0;
    Pipe sync;

protected:
    ProcessOptions processOptions() const override
    {
        return ProcessOptions{
            .dieWithParent = true,
            .cloneFlags = CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWIPC | CLONE_NEWUTS,
        };
    }

    void prepareSpawn() override
    {
        oomKillsBefore = cgroup->oomKillCount();
        sync.create();
    }

    void adoptChild() override
    {
        sync.readSide.close();
        // the child may only continue once every process it creates is
        // accounted to the sandbox cgroup
        cgroup->adoptProcess(pid_.get());
        writeFull(sync.writeSide.get(), "1", false);
        sync.writeSide.close();
    }

    void enterSandbox() override
    {
        sync.writeSide.close();
        char go;
        if (read(sync.readSide.get(), &go, 1) != 1) {
            throw Error("sandbox setup was aborted by the builder");
        }
        sync.readSide.close();

        if (sethostname("inkforge", 8) == -1) {
            throw SysError("setting host name");
        }

        // nothing mounted below may propagate back to the host
        if (mount(0, "/", 0, MS_PRIVATE | MS_REC, 0) == -1) {
            throw SysError("making '/' private");
        }

        bindPath(image, root, true);
        bindPath(volumeMount, root + "/contract");

        if (mount("none", (root + "/proc").c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, 0) == -1) {
            throw SysError("mounting /proc");
        }

        if (mount("none", (root + "/dev").c_str(), "tmpfs", MS_NOSUID | MS_NOEXEC, "mode=0755,size=65536") == -1) {
            throw SysError("mounting /dev");
        }
        for (auto dev : {"null", "zero", "full", "random", "urandom", "tty"}) {
            bindPath(fmt("/dev/%s", dev), fmt("%s/dev/%s", root, dev), false, true);
        }
        createDirs(root + "/dev/pts");
        if (symlink("/proc/self/fd", (root + "/dev/fd").c_str()) == -1) {
            throw SysError("creating /dev/fd");
        }
        if (symlink("/proc/self/fd/0", (root + "/dev/stdin").c_str()) == -1
            || symlink("/proc/self/fd/1", (root + "/dev/stdout").c_str()) == -1
            || symlink("/proc/self/fd/2", (root + "/dev/stderr").c_str()) == -1)
        {
            throw SysError("creating stdio links in /dev");
        }

        auto tmpOptions = fmt("mode=1777,size=%d", tmpSize);
        if (mount("none", (root + "/tmp").c_str(), "tmpfs", MS_NOSUID | MS_NODEV, tmpOptions.c_str()) == -1) {
            throw SysError("mounting /tmp");
        }

        // fetching sources needs name resolution
        if (pathExists(root + "/etc/resolv.conf")) {
            bindPath("/etc/resolv.conf", root + "/etc/resolv.conf", true, true);
        }

        if (chroot(root.c_str()) == -1) {
            throw SysError("cannot change root directory to '%s'", root);
        }
        if (chdir("/contract") == -1) {
            throw SysError("cannot change directory to '/contract'");
        }

        for (int cap = 0; cap <= CAP_LAST_CAP; cap++) {
            if (cap == CAP_DAC_OVERRIDE) {
                continue;
            }
            if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) == -1 && errno != EINVAL) {
                throw SysError("dropping capability %d", cap);
            }
        }
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
            throw SysError("setting no_new_privs");
        }
    }

    void reapStragglers() override
    {
        // the pid namespace died with its init, this only catches processes
        // that escaped into the cgroup some other way
        cgroup->kill();
    }

    bool resourceExceeded() override
    {
        return cgroup->oomKillCount() > oomKillsBefore;
    }

    kj::Promise<Result<void>> destroy() override
    try {
        TRY_AWAIT(cgroup->destroy());
        if (rmdir(root.c_str()) == -1 && errno != ENOENT) {
            throw SysError("removing sandbox root '%s'", root);
        }
        co_return result::success();
    } catch (...) {
        co_return result::current_exception();
    }

public:
    LinuxSandbox(
        std::string name,
        StringMap env,
        std::unique_ptr<AutoDestroyCgroup> cgroup,
        Path root,
        Path image,
        Path volumeMount,
        uint64_t tmpSize
    )
        : Sandbox(std::move(name), std::move(env))
        , cgroup(std::move(cgroup))
        , root(std::move(root))
        , image(std::move(image))
        , volumeMount(std::move(volumeMount))
        , tmpSize(tmpSize)
    {
    }

    JSON describe() const override
    {
        return {
            {"runtime", "linux"},
            {"name", name_},
            {"cgroup", cgroup->path().value_or("")},
            {"root", root},
        };
    }

    static kj::Promise<Result<void>> reclaim(const JSON & description)
    try {
        auto name = getString(valueAt(description, "name"));
        auto cgroup = getString(valueAt(description, "cgroup"));
        auto root = getString(valueAt(description, "root"));

        if (!cgroup.empty() && TRY_AWAIT(destroyCgroup(name, cgroup))) {
            notice("reclaimed cgroup '%s' of sandbox '%s'", cgroup, name);
        }
        if (rmdir(root.c_str()) == -1 && errno != ENOENT) {
            throw SysError("removing sandbox root '%s'", root);
        }
        co_return result::success();
    } catch (...) {
        co_return result::current_exception();
    }
};

LinuxSandboxRuntime::LinuxSandboxRuntime(
    const std::string & cgroupParent, Path stateDir, std::string sandboxPath
)
    : sandboxesDir(stateDir + "/sandboxes")
    , sandboxPath(std::move(sandboxPath))
{
    if (!cgroupParent.empty()) {
        this->cgroupParent = cgroupParent;
    } else {
        auto cgroupFS = getCgroupFS();
        if (!cgroupFS) {
            throw Error("the Linux sandbox runtime needs a cgroup v2 file system");
        }
        auto parent = getLocalHierarchy(*cgroupFS).parentCgroupPath();
        if (!parent) {
            throw Error("the builder runs in the root cgroup; set 'cgroup-parent'");
        }
        this->cgroupParent = *parent;
    }
    createDirs(sandboxesDir);
    debug("creating sandbox cgroups below '%s'", this->cgroupParent.string());
}

std::unique_ptr<Sandbox> LinuxSandboxRuntime::launch(
    const VolumeHandle & volume,
    const Path & image,
    StringMap env,
    const BuildLimits & limits,
    const std::string & name
)
{
    try {
        auto cgroup = std::make_unique<AutoDestroyCgroup>(cgroupParent, name);
        cgroup->applyLimits(CgroupLimits{
            .memoryMax = limits.memory,
            .swapMax = limits.memorySwap - limits.memory,
            .pidsMax = limits.pids,
        });

        auto root = sandboxesDir + "/" + name;
        createDirs(root);

        return std::make_unique<LinuxSandbox>(
            name,
            sandboxEnvironment(std::move(env), sandboxPath, "/contract"),
            std::move(cgroup),
            root,
            image,
            volume.mountPoint,
            limits.memory
        );
    } catch (SandboxRuntimeError &) {
        throw;
    } catch (Error & e) {
        throw SandboxRuntimeError("launching sandbox '%s': %s", name, e.msg());
    }
}

//////////////////////////////////////////////////////////////////////

class ProcessSandbox : public Sandbox
{
    Path workDir;
    BuildLimits limits;
    pid_t pgid = -1;
    std::optional<uint64_t> startTime;

protected:
    void adoptChild() override
    {
        pid_.setSeparatePG(true);
        pgid = pid_.get();
        startTime = processStartTime(pgid);
    }

    void enterSandbox() override
    {
        if (setsid() == -1) {
            throw SysError("creating a new session");
        }

        struct rlimit as = {.rlim_cur = limits.memory, .rlim_max = limits.memory};
        if (setrlimit(RLIMIT_AS, &as) == -1) {
            throw SysError("limiting address space");
        }
        struct rlimit fsize = {.rlim_cur = limits.volumeSize, .rlim_max = limits.volumeSize};
        if (setrlimit(RLIMIT_FSIZE, &fsize) == -1) {
            throw SysError("limiting file size");
        }

        if (chdir(workDir.c_str()) == -1) {
            throw SysError("cannot change directory to '%s'", workDir);
        }
    }

    void reapStragglers() override
    {
        // the group outlives its leader as long as it has members, so its id
        // cannot have been reused yet
        if (pgid != -1 && ::kill(-pgid, SIGKILL) == -1 && errno != ESRCH) {
            throw SysError("killing process group %d", pgid);
        }
    }

    bool resourceExceeded() override
    {
        return false;
    }

    kj::Promise<Result<void>> destroy() override
    try {
        reapStragglers();
        return {result::success()};
    } catch (...) {
        return {result::current_exception()};
    }

public:
    ProcessSandbox(std::string name, StringMap env, Path workDir, BuildLimits limits)
        : Sandbox(std::move(name), std::move(env))
        , workDir(std::move(workDir))
        , limits(limits)
    {
    }

    JSON describe() const override
    {
        return {
            {"runtime", "process"},
            {"name", name_},
            {"pgid", pgid},
            {"start_time", startTime ? JSON(*startTime) : JSON(nullptr)},
        };
    }

    static void reclaim(const JSON & description)
    {
        auto & name = getString(valueAt(description, "name"));
        auto & pgidJson = valueAt(description, "pgid");
        if (!pgidJson.is_number_integer() || pgidJson.get<int64_t>() <= 0) {
            // never spawned anything
            return;
        }
        pid_t pgid = pgidJson.get<pid_t>();
        auto recorded = optionalValueAt(description, "start_time");

        // a live process with the group's id that started at another time is
        // an unrelated process that reused the pid; leave it alone
        auto current = processStartTime(pgid);
        if (current && (!recorded || getUnsigned(*recorded) != *current)) {
            debug("process %d is not the leader of sandbox '%s' anymore", pgid, name);
            return;
        }

        if (::kill(-pgid, SIGKILL) == 0) {
            notice("killed leftover process group %d of sandbox '%s'", pgid, name);
        } else if (errno != ESRCH) {
            throw SysError("killing process group %d", pgid);
        }
    }
};

ProcessSandboxRuntime::ProcessSandboxRuntime(std::string sandboxPath)
    : sandboxPath(std::move(sandboxPath))
{
}

std::unique_ptr<Sandbox> ProcessSandboxRuntime::launch(
    const VolumeHandle & volume,
    const Path & image,
    StringMap env,
    const BuildLimits & limits,
    const std::string & name
)
{
    if (!pathExists(volume.mountPoint)) {
        throw SandboxRuntimeError("volume of sandbox '%s' is not mounted at '%s'", name, volume.mountPoint);
    }
    return std::make_unique<ProcessSandbox>(
        name,
        sandboxEnvironment(std::move(env), sandboxPath, volume.mountPoint),
        volume.mountPoint,
        limits
    );
}

//////////////////////////////////////////////////////////////////////

kj::Promise<Result<void>> SandboxRuntime::reclaim(JSON description)
try {
    try {
        auto runtime = getString(valueAt(description, "runtime"));
        if (runtime == "linux") {
            TRY_AWAIT(LinuxSandbox::reclaim(description));
        } else if (runtime == "process") {
            ProcessSandbox::reclaim(description);
        } else {
            throw Error("unknown sandbox runtime '%s'", runtime);
        }
    } catch (SandboxRuntimeError &) {
        throw;
    } catch (Error & e) {
        throw SandboxRuntimeError("reclaiming sandbox: %s", e.msg());
    }
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

}
