#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

#include <sys/epoll.h>

#include <ctrlc/util/NonCopyable.hpp>

namespace ctrlc::event
{

/// EventLoop 이 쓰는 epoll 래퍼. add/remove/wait 만 제공합니다.
class EpollReactor : private ctrlc::util::NonMovable
{
  public:
    enum class Event : std::uint32_t
    {
        Read = EPOLLIN,
        EdgeTriggered = EPOLLET,
    };

    struct ReadyEvent
    {
        int fd{-1};
        std::uint32_t events{0};
    };

    static constexpr std::uint32_t makeEventMask(std::initializer_list<Event> events) noexcept
    {
        std::uint32_t mask = 0;
        for (auto e : events)
        {
            mask |= static_cast<std::uint32_t>(e);
        }
        return mask;
    }

    /// @param maxEvents wait() 한 번에 받을 최대 이벤트 수
    /// @throws std::system_error epoll_create1 실패
    explicit EpollReactor(std::size_t maxEvents);
    ~EpollReactor() noexcept;

    bool add(int fd, std::uint32_t events) noexcept { return control(EPOLL_CTL_ADD, fd, events); }
    bool remove(int fd) noexcept { return control(EPOLL_CTL_DEL, fd, 0); }

    /// 최대 min(out.size(), maxEvents) 개의 이벤트를 기다려 채웁니다. 실패 시 -1 (errno 유지).
    int wait(std::span<ReadyEvent> out, int timeoutMs) noexcept;

  private:
    bool control(int op, int fd, std::uint32_t events) noexcept;

    int epollFd_{-1};
    std::vector<::epoll_event> raw_;
};

} // namespace ctrlc::event
