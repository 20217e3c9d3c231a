#include <ctrlc/platform/WakeupPipe.hpp>

#include <ctrlc/core/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace ctrlc::platform
{

namespace
{
[[noreturn]] void throwSysError(const char *what)
{
    throw std::system_error(errno, std::generic_category(), what);
}

void setFlagOrThrow(int fd, int getCmd, int setCmd, int flag, const char *what)
{
    const int cur = ::fcntl(fd, getCmd);
    if (cur < 0 || ::fcntl(fd, setCmd, cur | flag) < 0)
    {
        throwSysError(what);
    }
}
} // namespace

WakeupPipe::WakeupPipe(ReadMode mode)
{
    int fds[2] = {-1, -1};
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        throwSysError("WakeupPipe: pipe2 failed");
    }
#else
    if (::pipe(fds) != 0)
    {
        throwSysError("WakeupPipe: pipe failed");
    }
#endif
    readFd_ = fds[0];
    writeFd_ = fds[1];

    try
    {
#if !defined(__linux__)
        setFlagOrThrow(readFd_, F_GETFD, F_SETFD, FD_CLOEXEC, "WakeupPipe: FD_CLOEXEC failed");
        setFlagOrThrow(writeFd_, F_GETFD, F_SETFD, FD_CLOEXEC, "WakeupPipe: FD_CLOEXEC failed");
#endif
        setFlagOrThrow(writeFd_, F_GETFL, F_SETFL, O_NONBLOCK, "WakeupPipe: O_NONBLOCK failed");
        if (mode == ReadMode::NonBlocking)
        {
            setFlagOrThrow(readFd_, F_GETFL, F_SETFL, O_NONBLOCK, "WakeupPipe: O_NONBLOCK failed");
        }
    }
    catch (const std::system_error &)
    {
        ::close(readFd_);
        ::close(writeFd_);
        readFd_ = -1;
        writeFd_ = -1;
        throw;
    }

    CTRLC_LOG_DEBUG("WakeupPipe", "Created", "read_fd={} write_fd={} nonblocking_read={}", readFd_,
                    writeFd_, mode == ReadMode::NonBlocking);
}

WakeupPipe::~WakeupPipe() noexcept
{
    if (readFd_ >= 0)
    {
        ::close(readFd_);
    }
    if (writeFd_ >= 0)
    {
        ::close(writeFd_);
    }
}

unsigned char WakeupPipe::readByte()
{
    for (;;)
    {
        unsigned char byte = 0;
        const ::ssize_t n = ::read(readFd_, &byte, 1);
        if (n == 1)
        {
            return byte;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n == 0)
        {
            throw std::system_error(EPIPE, std::generic_category(), "WakeupPipe: unexpected EOF");
        }
        throwSysError("WakeupPipe: read failed");
    }
}

std::optional<unsigned char> WakeupPipe::drain() noexcept
{
    std::optional<unsigned char> last;
    unsigned char buf[64];

    for (;;)
    {
        const ::ssize_t n = ::read(readFd_, buf, sizeof(buf));
        if (n > 0)
        {
            last = buf[n - 1];
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            break;
        }
        if (n == 0)
        {
            CTRLC_LOG_WARN("WakeupPipe", "DrainEof", "fd={}", readFd_);
            break;
        }

        CTRLC_LOG_ERROR("WakeupPipe", "DrainFailed", "fd={} errno={} msg='{}'", readFd_, errno,
                        std::strerror(errno));
        break;
    }
    return last;
}

} // namespace ctrlc::platform
