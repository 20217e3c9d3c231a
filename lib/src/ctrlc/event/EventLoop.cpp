#include <ctrlc/event/EventLoop.hpp>

#include <ctrlc/core/Logger.hpp>
#include <ctrlc/core/ThreadContext.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <system_error>
#include <utility>

#include <sys/eventfd.h>
#include <unistd.h>

namespace ctrlc::event
{

namespace
{
template <typename Fn>
void runGuarded(const char *evt, Fn &&fn) noexcept
{
    try
    {
        fn();
    }
    catch (const std::exception &e)
    {
        CTRLC_LOG_ERROR("EventLoop", evt, "what='{}'", e.what());
    }
}
} // namespace

EventLoop::EventLoop(int maxEpollEvents, int pollTimeoutMs)
    : reactor_(static_cast<std::size_t>(maxEpollEvents > 0 ? maxEpollEvents
                                                           : core::defaults::kMaxEpollEvents)),
      pollTimeoutMs_(pollTimeoutMs)
{
    readyEvents_.resize(static_cast<std::size_t>(
        maxEpollEvents > 0 ? maxEpollEvents : core::defaults::kMaxEpollEvents));

    wakeupFd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeupFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(), "EventLoop: eventfd failed");
    }

    // wakeup fd 는 fdContexts_ 밖에서 runOnce() 가 직접 처리한다.
    if (!reactor_.add(wakeupFd_, EpollReactor::makeEventMask({EpollReactor::Event::Read,
                                                              EpollReactor::Event::EdgeTriggered})))
    {
        const int err = errno;
        ::close(wakeupFd_);
        throw std::system_error(err, std::generic_category(), "EventLoop: wakeup registration failed");
    }

    CTRLC_LOG_DEBUG("EventLoop", "Created", "max_epoll_events={} poll_timeout_ms={} wakeup_fd={}",
                    readyEvents_.size(), pollTimeoutMs_, wakeupFd_);
}

EventLoop::~EventLoop()
{
    std::map<CloseHookId, Task> hooks;
    {
        std::lock_guard<std::mutex> lock(hookMutex_);
        hooks.swap(closeHooks_);
    }
    if (!hooks.empty())
    {
        CTRLC_LOG_DEBUG("EventLoop", "RunningCloseHooks", "count={}", hooks.size());
    }
    for (auto &[id, hook] : hooks)
    {
        runGuarded("CloseHookException", hook);
    }

    ::close(wakeupFd_);
}

void EventLoop::bindToCurrentThread() noexcept
{
    if (ownerBound_.load(std::memory_order_acquire))
    {
        assertInOwnerThread_("bindToCurrentThread");
        return;
    }

    ownerThread_ = std::this_thread::get_id();
    ownerBound_.store(true, std::memory_order_release);

    if (core::ttag() == "main")
    {
        core::ThreadContext::setCurrentThreadTag("loop");
    }
    CTRLC_LOG_DEBUG("EventLoop", "Bound", "tid={}", core::tid());
}

bool EventLoop::isInOwnerThread() const noexcept
{
    return ownerBound_.load(std::memory_order_acquire) &&
           std::this_thread::get_id() == ownerThread_;
}

void EventLoop::assertInOwnerThread_(const char *apiName) const noexcept
{
    if (!isInOwnerThread())
    {
        CTRLC_LOG_FATAL("EventLoop", "ApiWrongThread", "api='{}' bound={} tid={}", apiName,
                        ownerBound_.load(), core::tid());
        std::abort();
    }
}

void EventLoop::wake_() noexcept
{
    const std::uint64_t one = 1;
    ::ssize_t n = 0;
    do
    {
        n = ::write(wakeupFd_, &one, sizeof(one));
    } while (n < 0 && errno == EINTR);

    // EAGAIN: 카운터가 포화 상태. 이미 깨어날 예정이다.
    if (n < 0 && errno != EAGAIN)
    {
        CTRLC_LOG_ERROR("EventLoop", "WakeupWriteFailed", "errno={} msg='{}'", errno,
                        std::strerror(errno));
    }
}

void EventLoop::drainWakeup_() noexcept
{
    std::uint64_t value = 0;
    while (::read(wakeupFd_, &value, sizeof(value)) == static_cast<::ssize_t>(sizeof(value)) ||
           errno == EINTR)
    {
    }
}

bool EventLoop::addFd(int fd, std::uint32_t events, IFdHandler *handler) noexcept
{
    assertInOwnerThread_("addFd");

    if (fd < 0 || !handler)
    {
        errno = fd < 0 ? EBADF : EINVAL;
        CTRLC_LOG_ERROR("EventLoop", "AddFdRejected", "fd={} handler={}", fd, handler != nullptr);
        return false;
    }
    if (fdContexts_.count(fd) != 0)
    {
        errno = EEXIST;
        CTRLC_LOG_ERROR("EventLoop", "AddFdDuplicate", "fd={}", fd);
        return false;
    }
    if (!reactor_.add(fd, events))
    {
        return false;
    }

    FdContext ctx{fd, handler, handler->fdTag(), handler->fdDebugId(), events};
    fdContexts_.emplace(fd, ctx);

    CTRLC_LOG_DEBUG("EventLoop", "FdRegistered", "fd={} tag={} id={} events=0x{:x}", fd, ctx.tag,
                    ctx.debugId, events);
    return true;
}

bool EventLoop::removeFd(int fd) noexcept
{
    assertInOwnerThread_("removeFd");

    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        errno = ENOENT;
        CTRLC_LOG_WARN("EventLoop", "RemoveFdUnknown", "fd={}", fd);
        return false;
    }

    CTRLC_LOG_DEBUG("EventLoop", "FdUnregistered", "fd={} tag={} id={}", fd, it->second.tag,
                    it->second.debugId);
    fdContexts_.erase(it);
    return reactor_.remove(fd);
}

void EventLoop::post(Task task)
{
    taskQueue_.push(std::move(task));
    if (!isInOwnerThread())
    {
        wake_();
    }
}

EventLoop::CloseHookId EventLoop::addCloseHook(Task hook)
{
    std::lock_guard<std::mutex> lock(hookMutex_);
    const CloseHookId id = nextHookId_++;
    closeHooks_.emplace(id, std::move(hook));
    return id;
}

bool EventLoop::removeCloseHook(CloseHookId id) noexcept
{
    std::lock_guard<std::mutex> lock(hookMutex_);
    return closeHooks_.erase(id) != 0;
}

void EventLoop::stop() noexcept
{
    stopRequested_.store(true, std::memory_order_release);
    if (!isInOwnerThread())
    {
        wake_();
    }
}

void EventLoop::drainTasks_() noexcept
{
    // 실행 중 post 된 task 도 같은 drain 에서 처리한다.
    while (taskQueue_.popAll(runnable_) > 0)
    {
        while (!runnable_.empty())
        {
            Task task = std::move(runnable_.front());
            runnable_.pop_front();
            if (task)
            {
                runGuarded("TaskException", task);
            }
        }
    }
}

void EventLoop::runOnce() noexcept
{
    bindToCurrentThread();

    drainTasks_();
    if (stopRequested())
    {
        return;
    }

    const int n = reactor_.wait(readyEvents_, pollTimeoutMs_);
    if (n < 0 && errno != EINTR)
    {
        CTRLC_LOG_WARN("EventLoop", "PollError", "errno={} msg='{}'", errno, std::strerror(errno));
    }

    for (int i = 0; i < n; ++i)
    {
        const auto &ev = readyEvents_[static_cast<std::size_t>(i)];
        if (ev.fd == wakeupFd_)
        {
            drainWakeup_();
            continue;
        }

        // 같은 배치의 앞선 핸들러가 이 fd 를 내렸을 수 있다.
        auto it = fdContexts_.find(ev.fd);
        if (it == fdContexts_.end())
        {
            CTRLC_LOG_TRACE("EventLoop", "StaleEvent", "fd={} events=0x{:x}", ev.fd, ev.events);
            continue;
        }

        IFdHandler *handler = it->second.handler;
        runGuarded("HandlerException", [&] { handler->handleEvent(*this, ev); });
    }

    drainTasks_();
}

void EventLoop::run() noexcept
{
    bindToCurrentThread();

    CTRLC_LOG_DEBUG("EventLoop", "RunStarted");
    while (!stopRequested())
    {
        runOnce();
    }
    CTRLC_LOG_DEBUG("EventLoop", "RunStopped");
}

} // namespace ctrlc::event
