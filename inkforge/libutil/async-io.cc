#include "inkforge/libutil/async-io.hh"
#include "inkforge/libutil/async.hh"

#include <unistd.h>

namespace inkforge {

kj::Promise<Result<std::string>> AsyncInputStream::drain()
try {
    std::string result;
    char buf[64 * 1024];
    while (auto got = TRY_AWAIT(read(buf, sizeof(buf)))) {
        result.append(buf, *got);
    }
    co_return result;
} catch (...) {
    co_return result::current_exception();
}

AsyncFdInputStream::AsyncFdInputStream(AutoCloseFD fd) : AsyncFdInputStream(shared_fd{}, fd.get())
{
    ownedFd = std::move(fd);
}

AsyncFdInputStream::AsyncFdInputStream(shared_fd, int fd)
    : fd(fd)
    , oldState(makeNonBlocking(fd))
    , observer(AIO().unixEventPort, fd, kj::UnixEventPort::FdObserver::OBSERVE_READ)
{
}

AsyncFdInputStream::~AsyncFdInputStream() noexcept(false)
{
    try {
        resetBlockingState(fd, oldState);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

kj::Promise<Result<std::optional<size_t>>> AsyncFdInputStream::read(void * tgt, size_t size)
{
    auto got = ::read(fd, tgt, size);
    if (got > 0) {
        return {result::success(got)};
    } else if (got == 0) {
        return {result::success(std::nullopt)};
    } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return observer.whenBecomesReadable().then([=, this] { return read(tgt, size); });
    } else if (errno == EINTR) {
        return read(tgt, size);
    } else {
        return {result::failure(std::make_exception_ptr(SysError(errno, "read failed")))};
    }
}

}
