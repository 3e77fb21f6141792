#pragma once
///@file

#include "inkforge/libutil/async-io.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/types.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/file-descriptor.hh"

#include <kj/async.h>
#include <sys/types.h>
#include <unistd.h>
#include <signal.h>

#include <functional>
#include <memory>
#include <optional>

namespace inkforge {

/**
 * Owns a child process. Destroying a `Pid` that was not waited for kills
 * the child (its whole process group after `setSeparatePG(true)`) and reaps
 * it.
 */
class Pid
{
    pid_t pid = -1;
    bool separatePG = false;
public:
    Pid();
    explicit Pid(pid_t pid): pid(pid) {}
    Pid(Pid && other);
    Pid & operator=(Pid && other);
    ~Pid() noexcept(false);
    explicit operator bool() const { return pid != -1; }
    int kill();
    int wait();

    /**
     * Wait for the process to exit without blocking the event loop, then reap
     * it. Returns the raw wait status.
     */
    kj::Promise<Result<int>> waitAsync();

    /**
     * SIGKILL the process and reap it without blocking the event loop.
     */
    kj::Promise<Result<int>> killAsync();

    void setSeparatePG(bool separatePG);
    pid_t get() const { return pid; }
};

/**
 * Resolves once `pid` has exited. Does not reap the process; the exit is
 * observed through a pidfd so the promise can be raced against timers.
 */
kj::Promise<Result<void>> waitForExit(pid_t pid);

/**
 * Start time of `pid` in clock ticks since boot, as reported by the kernel.
 * Paired with the pid it identifies a process across pid reuse. Returns
 * nullopt if the process does not exist.
 */
std::optional<uint64_t> processStartTime(pid_t pid);

struct ProcessOptions
{
    /** SIGKILL the child when the builder dies */
    bool dieWithParent = true;
    /** `clone()` flags, e.g. namespaces to unshare; 0 means plain `fork()` */
    int cloneFlags = 0;
};

/**
 * Run `fun` in a child process. Exceptions escaping `fun` are printed and
 * end the child with status 1; the parent never sees them.
 */
[[nodiscard]]
Pid startProcess(std::function<void()> fun, const ProcessOptions & options = ProcessOptions());

struct RunOptions
{
    Path program;
    bool searchPath = true;
    Strings args = {};
    bool mergeStderrToStdout = false;
};

/**
 * Run a helper program to completion, collecting its stdout. Returns the
 * raw wait status with the output; a failing status is not an error here.
 */
kj::Promise<Result<std::pair<int, std::string>>> runProgram(RunOptions options);

/**
 * Like the other overload, but a non-zero exit throws `ExecError`.
 */
kj::Promise<Result<std::string>> runProgram(
    Path program,
    bool searchPath = false,
    const Strings args = Strings()
);

class ExecError : public Error
{
public:
    int status;

    template<typename... Args>
    ExecError(int status, const Args & ... args)
        : Error(args...), status(status)
    { }
};

/**
 * Describe a wait status for error messages: "failed with exit code 2",
 * "failed due to signal 9 (Killed)".
 */
std::string statusToString(int status);

bool statusOk(int status);

}
