#include "inkforge/libutil/async-io.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/finally.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/processes.hh"
#include "inkforge/libutil/strings.hh"
#include "inkforge/libutil/signals.hh"

#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>

#include <sched.h>
#include <sys/mman.h>
#include <sys/poll.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace inkforge {

Pid::Pid()
{
}

Pid::Pid(Pid && other) : pid(other.pid), separatePG(other.separatePG)
{
    other.pid = -1;
}

Pid & Pid::operator=(Pid && other)
{
    Pid tmp(std::move(other));
    std::swap(pid, tmp.pid);
    std::swap(separatePG, tmp.separatePG);
    return *this;
}

Pid::~Pid() noexcept(false)
{
    if (pid != -1) kill();
}

static void sendKill(pid_t pid, bool separatePG)
{
    debug("killing process %1%", pid);

    // with a separate group, anything the child forked goes down with it
    if (::kill(separatePG ? -pid : pid, SIGKILL) != 0 && errno != ESRCH) {
        logError(SysError("killing process %d", pid).info());
    }
}

int Pid::kill()
{
    assert(pid != -1);
    sendKill(pid, separatePG);
    return wait();
}

int Pid::wait()
{
    assert(pid != -1);
    while (1) {
        int status;
        int res = waitpid(pid, &status, 0);
        if (res == pid) {
            pid = -1;
            return status;
        }
        if (errno != EINTR)
            throw SysError("cannot get exit status of PID %d", pid);
        checkInterrupt();
    }
}

kj::Promise<Result<int>> Pid::waitAsync()
try {
    assert(pid != -1);
    TRY_AWAIT(waitForExit(pid));
    co_return wait();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<int>> Pid::killAsync()
try {
    assert(pid != -1);
    sendKill(pid, separatePG);
    auto status = TRY_AWAIT(waitAsync());
    co_return status;
} catch (...) {
    co_return result::current_exception();
}

void Pid::setSeparatePG(bool separatePG)
{
    this->separatePG = separatePG;
}

kj::Promise<Result<void>> waitForExit(pid_t pid)
try {
    AutoCloseFD pidfd{static_cast<int>(syscall(SYS_pidfd_open, pid, 0))};
    if (!pidfd) {
        // already reaped by someone else, nothing left to wait for
        if (errno == ESRCH) co_return result::success();
        throw SysError("opening pidfd for process %1%", pid);
    }
    closeOnExec(pidfd.get());

    kj::UnixEventPort::FdObserver observer(
        AIO().unixEventPort, pidfd.get(), kj::UnixEventPort::FdObserver::OBSERVE_READ
    );
    // a pidfd becomes readable once the process has exited. the observer is
    // edge-triggered, so check for an exit that happened before it was created.
    while (true) {
        pollfd pfd = {.fd = pidfd.get(), .events = POLLIN};
        int res = poll(&pfd, 1, 0);
        if (res == -1) {
            if (errno == EINTR) continue;
            throw SysError("polling process %1%", pid);
        }
        if (res > 0) co_return result::success();
        co_await observer.whenBecomesReadable();
    }
} catch (...) {
    co_return result::current_exception();
}

std::optional<uint64_t> processStartTime(pid_t pid)
{
    std::string stat;
    try {
        stat = readFile(fmt("/proc/%d/stat", pid));
    } catch (SysError & e) {
        if (e.errNo == ENOENT || e.errNo == ESRCH) return std::nullopt;
        throw;
    }

    // the command name may contain spaces and parentheses, skip past its last `)`
    auto end = stat.rfind(')');
    if (end == std::string::npos)
        throw Error("malformed /proc stat line for process %1%", pid);

    // fields after the name start at field 3 (state); start time is field 22
    auto fields = tokenizeString<std::vector<std::string>>(std::string_view(stat).substr(end + 1));
    if (fields.size() < 20)
        throw Error("malformed /proc stat line for process %1%", pid);

    auto startTime = string2Int<uint64_t>(fields[19]);
    if (!startTime)
        throw Error("malformed start time '%1%' for process %2%", fields[19], pid);
    return startTime;
}

static pid_t doFork(std::function<void()> fun)
{
    pid_t pid = fork();
    if (pid != 0) return pid;
    fun();
    _exit(1);
}

static int childEntry(void * arg)
{
    auto main = static_cast<std::function<void()> *>(arg);
    (*main)();
    return 1;
}

Pid startProcess(std::function<void()> fun, const ProcessOptions & options)
{
    std::function<void()> wrapper = [&]() {
        logger = makeSimpleLogger();
        try {
            if (options.dieWithParent && prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
                throw SysError("setting death signal");
            fun();
        } catch (std::exception & e) { // NOLINT(inkforge-foreign-exceptions)
            writeLogsToStderr(std::string(e.what()) + "\n");
        } catch (...) {
            writeLogsToStderr("child process failed with an unknown exception\n");
        }
        _exit(1);
    };

    pid_t pid = -1;

    if (options.cloneFlags) {
        // the stack is freed as soon as clone() returns
        if (options.cloneFlags & CLONE_VM)
            throw Error("CLONE_VM is not supported by startProcess");

        size_t stackSize = 1 * 1024 * 1024;
        auto stack = static_cast<char *>(mmap(0, stackSize,
            PROT_WRITE | PROT_READ, MAP_PRIVATE | MAP_ANONYMOUS | MAP_STACK, -1, 0));
        if (stack == MAP_FAILED) throw SysError("allocating stack");

        Finally freeStack([&]() { munmap(stack, stackSize); });

        pid = clone(childEntry, stack + stackSize, options.cloneFlags | SIGCHLD, &wrapper);
    } else
        pid = doFork(wrapper);

    if (pid == -1) throw SysError("unable to fork");

    return Pid{pid};
}

kj::Promise<Result<std::string>>
runProgram(Path program, bool searchPath, const Strings args)
try {
    auto res = TRY_AWAIT(runProgram(RunOptions{
        .program = program, .searchPath = searchPath, .args = args
    }));

    if (!statusOk(res.first)) {
        throw ExecError(res.first, "program '%1%' %2%", program, statusToString(res.first));
    }

    co_return res.second;
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<std::pair<int, std::string>>> runProgram(RunOptions options)
try {
    checkInterrupt();

    Pipe out;
    out.create();

    Strings args_(options.args);
    args_.push_front(options.program);
    auto argv = stringsToCharPtrs(args_);

    printMsg(lvlChatty, "running command: %s", concatMapStringsSep(" ", args_, shellEscape));

    Pid pid{startProcess([&]() {
        if (dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
            throw SysError("dupping stdout");
        if (options.mergeStderrToStdout && dup2(STDOUT_FILENO, STDERR_FILENO) == -1)
            throw SysError("dupping stderr");

        restoreSignals();

        if (options.searchPath)
            execvp(options.program.c_str(), argv.data());
        else
            execv(options.program.c_str(), argv.data());

        throw SysError("executing '%1%'", options.program);
    })};

    out.writeSide.close();

    AsyncFdInputStream childStdout(std::move(out.readSide));
    std::string output;
    try {
        output = TRY_AWAIT(childStdout.drain());
    } catch (...) {
        pid.kill();
        throw;
    }

    int status = TRY_AWAIT(pid.waitAsync());
    co_return {status, std::move(output)};
} catch (...) {
    co_return result::current_exception();
}

std::string statusToString(int status)
{
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (WIFEXITED(status))
            return fmt("failed with exit code %1%", WEXITSTATUS(status));
        else if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            return fmt("failed due to signal %1% (%2%)", sig, strsignal(sig));
        }
        else
            return "died abnormally";
    } else return "succeeded";
}

bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}
