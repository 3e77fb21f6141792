#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/signals.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <sys/poll.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace inkforge {

std::string readFile(int fd)
{
    struct stat st;
    if (fstat(fd, &st) == -1) {
        throw SysError("statting file");
    }

    std::string result;
    result.reserve(std::max<off_t>(0, st.st_size));

    std::array<char, 64 * 1024> buf;
    while (true) {
        checkInterrupt();
        ssize_t rd = read(fd, buf.data(), buf.size());
        if (rd == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw SysError("reading from file");
        }
        if (rd == 0) {
            break;
        }
        result.append(buf.data(), rd);
    }
    return result;
}

void writeFull(int fd, std::string_view s, bool allowInterrupts)
{
    while (!s.empty()) {
        if (allowInterrupts) checkInterrupt();
        ssize_t res = write(fd, s.data(), s.size());
        if (res == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd = {.fd = fd, .events = POLLOUT};
                if (poll(&pfd, 1, -1) < 0) {
                    throw SysError("polling for writing to file");
                }
            } else if (errno != EINTR) {
                throw SysError("writing to file");
            }
        }
        if (res > 0)
            s.remove_prefix(res);
    }
}

AutoCloseFD::AutoCloseFD() : fd{-1} {}


AutoCloseFD::AutoCloseFD(int fd) : fd{fd} {}


AutoCloseFD::AutoCloseFD(AutoCloseFD && that) : fd{that.fd}
{
    that.fd = -1;
}


AutoCloseFD & AutoCloseFD::operator =(AutoCloseFD && that) noexcept(false)
{
    close();
    fd = that.fd;
    that.fd = -1;
    return *this;
}


AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}


int AutoCloseFD::get() const
{
    return fd;
}


void AutoCloseFD::close()
{
    if (fd != -1) {
        // the descriptor is gone even if close fails
        int old = fd;
        fd = -1;
        if (::close(old) == -1) {
            throw SysError("closing file descriptor %1%", old);
        }
    }
}

void AutoCloseFD::fsync()
{
    if (fd != -1) {
        if (::fsync(fd) == -1)
            throw SysError("fsync file descriptor %1%", fd);
    }
}


AutoCloseFD::operator bool() const
{
    return fd != -1;
}


void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) throw SysError("creating pipe");
    readSide = AutoCloseFD{fds[0]};
    writeSide = AutoCloseFD{fds[1]};
}


void Pipe::close()
{
    readSide.close();
    writeSide.close();
}


void closeExtraFDs(std::initializer_list<int> keep)
{
    auto keepFd = [&](int fd) {
        return fd <= 2 || std::find(keep.begin(), keep.end(), fd) != keep.end();
    };

    // opendir() itself allocates an fd, which is skipped below
    if (auto dir = opendir("/proc/self/fd")) {
        int dirFd = dirfd(dir);
        std::vector<int> toClose;
        while (auto entry = readdir(dir)) {
            int fd = 0;
            std::string_view name = entry->d_name;
            if (name == "." || name == "..") continue;
            for (auto c : name) fd = fd * 10 + (c - '0');
            if (fd != dirFd && !keepFd(fd)) toClose.push_back(fd);
        }
        closedir(dir);
        for (auto fd : toClose) ::close(fd);
        return;
    }

    int maxFD = 0;
    maxFD = sysconf(_SC_OPEN_MAX);
    for (int fd = 0; fd < maxFD; ++fd)
        if (!keepFd(fd))
            ::close(fd); /* ignore result */
}


void closeOnExec(int fd)
{
    int prev;
    if ((prev = fcntl(fd, F_GETFD, 0)) == -1 ||
        fcntl(fd, F_SETFD, prev | FD_CLOEXEC) == -1)
        throw SysError("setting close-on-exec flag");
}

FdBlockingState makeNonBlocking(int fd)
{
    int oldFlags = fcntl(fd, F_GETFL);
    if (oldFlags == -1)
        throw SysError("querying file descriptor flags");
    if (fcntl(fd, F_SETFL, oldFlags | O_NONBLOCK) == -1)
        throw SysError("making file descriptor non-blocking");
    return FdBlockingState(oldFlags);
}

void resetBlockingState(int fd, FdBlockingState prevState)
{
    if (fcntl(fd, F_SETFL, int(prevState)) == -1)
        throw SysError("resetting file descriptor blocking state");
}

}
