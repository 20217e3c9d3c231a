#include <ctrlc/event/EpollReactor.hpp>

#include <ctrlc/core/Logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <unistd.h>

namespace ctrlc::event
{

EpollReactor::EpollReactor(std::size_t maxEvents)
    : epollFd_(::epoll_create1(EPOLL_CLOEXEC)), raw_(maxEvents == 0 ? 1 : maxEvents)
{
    if (epollFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(), "EpollReactor: epoll_create1 failed");
    }
}

EpollReactor::~EpollReactor() noexcept
{
    if (epollFd_ >= 0)
    {
        ::close(epollFd_);
    }
}

bool EpollReactor::control(int op, int fd, std::uint32_t events) noexcept
{
    ::epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;

    if (::epoll_ctl(epollFd_, op, fd, op == EPOLL_CTL_DEL ? nullptr : &ev) == 0)
    {
        return true;
    }

    const int err = errno;
    CTRLC_LOG_ERROR("EpollReactor", "CtlFailed", "op={} fd={} errno={} msg='{}'",
                    op == EPOLL_CTL_ADD ? "add" : "del", fd, err, std::strerror(err));
    errno = err;
    return false;
}

int EpollReactor::wait(std::span<ReadyEvent> out, int timeoutMs) noexcept
{
    const std::size_t cap = std::min(out.size(), raw_.size());
    if (cap == 0)
    {
        return 0;
    }

    const int n = ::epoll_wait(epollFd_, raw_.data(), static_cast<int>(cap), timeoutMs);
    for (int i = 0; i < n; ++i)
    {
        const auto idx = static_cast<std::size_t>(i);
        out[idx] = ReadyEvent{raw_[idx].data.fd, raw_[idx].events};
    }
    return n;
}

} // namespace ctrlc::event
