#pragma once
///@file

#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/result.hh"
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/async.h>
#include <kj/common.h>
#include <optional>
#include <string>

namespace inkforge {

// not derived from kj's AsyncInputStream: we only ever read child output
// pipes, which deliver whatever is available and signal EOF by closing.
class AsyncInputStream : private kj::AsyncObject
{
public:
    virtual ~AsyncInputStream() noexcept(false) {}

    // expected to return none only on EOF or when `size = 0` was explicitly set.
    virtual kj::Promise<Result<std::optional<size_t>>> read(void * buffer, size_t size) = 0;

    kj::Promise<Result<std::string>> drain();
};

/**
 * Reads a file descriptor without blocking the event loop. The descriptor is
 * switched to non-blocking mode for the lifetime of the stream and restored
 * afterwards.
 */
class AsyncFdInputStream : public AsyncInputStream
{
    int fd;
    FdBlockingState oldState;
    AutoCloseFD ownedFd; // only for closing automatically, must equal fd if set
    kj::UnixEventPort::FdObserver observer;

public:
    struct shared_fd
    {};

    explicit AsyncFdInputStream(AutoCloseFD fd);
    AsyncFdInputStream(shared_fd, int fd);

    ~AsyncFdInputStream() noexcept(false);

    int getFD() const
    {
        return fd;
    }

    kj::Promise<Result<std::optional<size_t>>> read(void * tgt, size_t size) override;
};

}
