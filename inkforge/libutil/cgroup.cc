#include "inkforge/libutil/cgroup.hh"
#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/finally.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/strings.hh"

#include <array>

#include <fcntl.h>
#include <mntent.h>

namespace inkforge {

static std::map<std::string, std::string> getCgroups(const Path & cgroupFile)
{
    std::map<std::string, std::string> cgroups;

    for (auto & line : tokenizeString<std::vector<std::string>>(readFile(cgroupFile), "\n")) {
        // hierarchy-ID:controller-list:cgroup-path
        auto first = line.find(':');
        auto second = first == std::string::npos ? first : line.find(':', first + 1);
        if (second == std::string::npos)
            throw Error("invalid line '%s' in '%s'", line, cgroupFile);

        std::string name = line.substr(first + 1, second - first - 1);
        if (name.starts_with("name=")) {
            name = name.substr(5);
        }
        cgroups.insert_or_assign(name, line.substr(second + 1));
    }

    return cgroups;
}

static void killCgroup(const std::string & name, const std::filesystem::path & cgroup)
{
    auto killFile = cgroup / "cgroup.kill";
    if (pathExists(killFile))
        writeFile(killFile, "1");
    else {
        throw SysError(
            "cgroup '%s' at '%s' does not possess `cgroup.kill`; sandboxing needs kernel 5.14 or "
            "newer",
            name,
            cgroup.string()
        );
    }
}

static bool cgroupPopulated(int events, const std::filesystem::path & eventsFile)
{
    // there's only two keys today, this should be fine for a while
    std::array<char, 1024> buf = {};
    const auto got = pread(events, buf.data(), buf.size(), 0);
    if (got < 0) {
        throw SysError("reading %s", eventsFile.string());
    }
    for (const auto & line : tokenizeString<Strings>(std::string_view{buf.data(), size_t(got)}, "\n")) {
        auto tokens = tokenizeString<Strings>(line);
        if (!tokens.empty() && tokens.front() == "populated" && tokens.back() == "0") {
            return false;
        }
    }
    return true;
}

kj::Promise<Result<bool>> destroyCgroup(std::string name, std::filesystem::path aliveCgroup)
try {
    debug("destroying cgroup '%s' at '%s'", name, aliveCgroup.string());
    if (!pathExists(aliveCgroup)) {
        debug("destroying cgroup '%s' already destroyed", name);
        co_return result::success(false);
    }

    if (!pathExists(aliveCgroup / "cgroup.procs")) {
        throw Error(
            "cgroup '%s' at '%s' has an invalid cgroup hierarchy (missing `cgroup.procs`)",
            name,
            aliveCgroup.string()
        );
    }

    killCgroup(name, aliveCgroup);

    // a killed cgroup empties asynchronously. cgroup.events signals POLLPRI
    // whenever `populated` changes; the observer is edge-triggered, so a
    // change between reading the file and waiting is caught by the timer.
    {
        auto eventsFile = aliveCgroup / "cgroup.events";
        AutoCloseFD events(open(eventsFile.c_str(), O_RDONLY | O_CLOEXEC));
        if (!events) {
            throw SysError("failed to open %s", eventsFile.string());
        }

        kj::UnixEventPort::FdObserver observer(
            AIO().unixEventPort, events.get(), kj::UnixEventPort::FdObserver::OBSERVE_URGENT
        );
        auto & timer = AIO().provider.getTimer();
        const auto deadline = timer.now() + 120 * kj::SECONDS;

        while (cgroupPopulated(events.get(), eventsFile)) {
            if (timer.now() >= deadline) {
                throw Error("cgroup '%s' is still populated after being killed", name);
            }
            debug("cgroup %s isn't empty yet, waiting for a while", aliveCgroup.string());
            co_await observer.whenUrgentDataAvailable().exclusiveJoin(
                timer.afterDelay(1 * kj::SECONDS)
            );
        }
    }

    if (rmdir(aliveCgroup.c_str()) == -1 && errno != ENOENT) {
        throw SysError("deleting cgroup '%s' at '%s'", name, aliveCgroup.string());
    }

    debug("cgroup '%s' destroyed", name);
    co_return result::success(true);
} catch (...) {
    co_return result::current_exception();
}

CgroupHierarchy getLocalHierarchy(const std::filesystem::path & cgroupFilesystem)
{
    CgroupHierarchy hierarchy;

    auto ourCgroups = getCgroups("/proc/self/cgroup");
    auto ourCgroup = ourCgroups[""];

    if (ourCgroup == "") {
        throw Error("cannot determine cgroup name from '/proc/self/cgroup'");
    }

    if (ourCgroup[0] == '/') {
        ourCgroup.erase(0, 1);
    }

    auto ourCgroupPath = (cgroupFilesystem / ourCgroup).lexically_normal();

    if (!pathExists(ourCgroupPath)) {
        throw Error("expected cgroup directory '%s'", ourCgroupPath.string());
    }

    hierarchy.ourCgroupPath = ourCgroupPath;

    return hierarchy;
}

AutoDestroyCgroup::AutoDestroyCgroup(
    const std::filesystem::path & parent, std::string const & name
)
    : name_(name)
{
    auto available = tokenizeString<StringSet>(readFile(parent / "cgroup.controllers"));
    for (auto controller : {"memory", "pids"}) {
        if (!available.contains(controller)) {
            throw Error(
                "cgroup '%s' does not offer the '%s' controller", parent.string(), controller
            );
        }
    }

    std::string enable = "+memory +pids";
    if (available.contains("cpu")) {
        enable += " +cpu";
    }
    writeFile(parent / "cgroup.subtree_control", enable);

    auto path = parent / name;
    if (pathExists(path)) {
        throw Error(
            "cgroup '%s' already exists at '%s'; it belongs to a sandbox that was never reclaimed",
            name_,
            path.string()
        );
    }

    if (mkdir(path.c_str(), 0755) == -1) {
        throw SysError("creating cgroup '%s' at '%s'", name_, path.string());
    }
    cgroup_ = path;
}

kj::Promise<Result<void>> AutoDestroyCgroup::destroy()
try {
    if (!cgroup_) {
        co_return result::success();
    }

    if (!TRY_AWAIT(destroyCgroup(name_, *cgroup_))) {
        printTaggedWarning(
            "cgroup '%s' was destroyed unexpectedly (something else removed the cgroup).",
            cgroup_->string()
        );
    }
    cgroup_.reset();
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

AutoDestroyCgroup::~AutoDestroyCgroup()
{
    if (!cgroup_) {
        return;
    }
    // a destructor cannot wait for the cgroup to empty. kill it and remove
    // it if that already happened, otherwise leave it to `destroyCgroup`.
    try {
        killCgroup(name_, *cgroup_);
        if (rmdir(cgroup_->c_str()) == -1 && errno != ENOENT) {
            printTaggedWarning(
                "cgroup '%s' is still populated and was left behind", cgroup_->string()
            );
        }
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDestroyCgroup::applyLimits(const CgroupLimits & limits)
{
    if (!cgroup_) {
        throw Error("cgroup '%s' went away while applying limits", name_);
    }

    writeFile(*cgroup_ / "memory.max", std::to_string(limits.memoryMax));
    writeFile(*cgroup_ / "memory.swap.max", std::to_string(limits.swapMax));
    writeFile(*cgroup_ / "pids.max", std::to_string(limits.pidsMax));
    // kill the whole sandbox on OOM instead of leaving half a build behind
    if (pathExists(*cgroup_ / "memory.oom.group")) {
        writeFile(*cgroup_ / "memory.oom.group", "1");
    }
}

void AutoDestroyCgroup::adoptProcess(int pid)
{
    if (!cgroup_) {
        throw Error("cgroup '%s' went away while adopting process '%d'", name_, pid);
    }

    writeFile(*cgroup_ / "cgroup.procs", fmt("%d", pid));
}

void AutoDestroyCgroup::kill()
{
    if (!cgroup_) {
        /* If the cgroup already disappeared,
         * processes already got killed.
         */
        return;
    }

    killCgroup(name_, *cgroup_);
}

uint64_t AutoDestroyCgroup::oomKillCount() const
{
    if (!cgroup_) {
        return 0;
    }

    for (auto & line : tokenizeString<std::vector<std::string>>(
             readFile(*cgroup_ / "memory.events"), "\n"))
    {
        std::string_view prefix = "oom_kill ";
        if (line.starts_with(prefix)) {
            return string2Int<uint64_t>(line.substr(prefix.size())).value_or(0);
        }
    }
    return 0;
}

std::optional<std::filesystem::path> getCgroupFS()
{
    static auto res = [&]() -> std::optional<std::filesystem::path> {
        auto fp = setmntent("/proc/mounts", "r");
        if (!fp) {
            return {};
        }
        Finally delFP = [&]() { endmntent(fp); };
        while (auto ent = getmntent(fp)) {
            if (std::string_view(ent->mnt_type) == "cgroup2") {
                return {ent->mnt_dir};
            }
        }

        return {};
    }();
    return res;
}
}
