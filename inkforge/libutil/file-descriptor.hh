#pragma once
///@file

#include "inkforge/libutil/error.hh"

#include <initializer_list>

namespace inkforge {

/**
 * Read from `fd` until EOF. Blocks; not for descriptors of the event loop.
 */
std::string readFile(int fd);

/**
 * Write all of `s`, waiting for the descriptor to become writable if it is
 * non-blocking.
 */
void writeFull(int fd, std::string_view s, bool allowInterrupts = true);

/**
 * Owns a file descriptor and closes it on destruction.
 */
class AutoCloseFD
{
    int fd;
public:
    AutoCloseFD();
    explicit AutoCloseFD(int fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD && fd);
    ~AutoCloseFD();
    AutoCloseFD & operator=(const AutoCloseFD & fd) = delete;
    AutoCloseFD & operator=(AutoCloseFD && fd) noexcept(false);
    int get() const;
    explicit operator bool() const;
    void close();
    void fsync();
    void reset() { *this = {}; }
};

/**
 * Both ends are close-on-exec.
 */
class Pipe
{
public:
    AutoCloseFD readSide, writeSide;
    void create();
    void close();
};

/**
 * In a freshly forked child: close everything but stdio and `keep`, so no
 * descriptor of the builder leaks into a sandbox.
 */
void closeExtraFDs(std::initializer_list<int> keep = {});

void closeOnExec(int fd);

enum class FdBlockingState : int {};

/**
 * Returns the previous flags for `resetBlockingState`.
 */
FdBlockingState makeNonBlocking(int fd);
void resetBlockingState(int fd, FdBlockingState prevState);

}
