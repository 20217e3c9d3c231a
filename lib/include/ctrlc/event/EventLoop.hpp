#pragma once

#include <ctrlc/core/Defaults.hpp>
#include <ctrlc/core/TaskQueue.hpp>
#include <ctrlc/event/EpollReactor.hpp>
#include <ctrlc/event/FdContext.hpp>
#include <ctrlc/event/FdHandler.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ctrlc::event
{

/// 단일 스레드 협력 스케줄링 루프입니다. (epoll + eventfd wakeup + task queue)
///
/// ===== 스레딩 규약 =====
/// - 처음 run()/runOnce()/bindToCurrentThread() 를 호출한 스레드가 owner 가 됩니다.
/// - addFd/removeFd 와 모든 IFdHandler::handleEvent 는 owner 스레드에서만 실행됩니다.
///   다른 스레드에서 호출하면 FATAL 로그 후 abort 합니다.
/// - post()/stop()/addCloseHook()/removeCloseHook() 은 아무 스레드에서나 호출할 수 있습니다.
///
/// AsyncBridge 의 태스크는 이 루프 위에서 fd 핸들러 + posted task 로 표현됩니다.
class EventLoop : private ctrlc::util::NonMovable
{
  public:
    using Task = core::TaskQueue::Task;
    using CloseHookId = std::uint64_t;

    /// @param pollTimeoutMs epoll_wait 타임아웃. -1 이면 이벤트/wakeup 이 올 때까지 무한 대기.
    /// @throws std::system_error epoll/eventfd 생성 실패
    explicit EventLoop(int maxEpollEvents = core::defaults::kMaxEpollEvents,
                       int pollTimeoutMs = core::defaults::kPollTimeoutMs);

    /// 남아 있는 close hook 을 등록 순서대로 실행한 뒤 자원을 닫습니다.
    /// 실행되지 않은 posted task 는 실행 없이 버려집니다.
    ~EventLoop();

    void bindToCurrentThread() noexcept;
    [[nodiscard]] bool isInOwnerThread() const noexcept;

    bool addFd(int fd, std::uint32_t events, IFdHandler *handler) noexcept;
    bool removeFd(int fd) noexcept;

    void post(Task task);

    /// 루프가 소멸될 때 한 번 실행할 정리 작업을 등록합니다.
    ///
    /// hook 은 소멸자를 호출한 스레드에서 실행되며, 그 시점에는 addFd/removeFd 를 부르면 안 됩니다.
    CloseHookId addCloseHook(Task hook);

    /// 아직 실행되지 않은 hook 을 해제합니다. 이미 해제됐거나 실행 중이면 false.
    bool removeCloseHook(CloseHookId id) noexcept;

    /// 쌓인 task 를 실행하고, epoll 이벤트를 한 번 기다려 디스패치한 뒤, 다시 task 를 실행합니다.
    void runOnce() noexcept;

    /// stop() 이 호출될 때까지 runOnce() 를 반복합니다.
    void run() noexcept;

    /// run() 을 끝내도록 요청합니다. 다른 스레드에서 호출하면 wakeup 으로 루프를 깨웁니다.
    void stop() noexcept;

    [[nodiscard]] bool stopRequested() const noexcept
    {
        return stopRequested_.load(std::memory_order_acquire);
    }

    /// 등록된 fd 수. wakeup eventfd 는 세지 않습니다. (테스트/디버깅용)
    [[nodiscard]] std::size_t registeredFdCount() const noexcept { return fdContexts_.size(); }

  private:
    void assertInOwnerThread_(const char *apiName) const noexcept;
    void drainTasks_() noexcept;
    void wake_() noexcept;
    void drainWakeup_() noexcept;

    EpollReactor reactor_;
    core::TaskQueue taskQueue_;
    int pollTimeoutMs_;
    int wakeupFd_{-1};

    std::vector<EpollReactor::ReadyEvent> readyEvents_;
    std::deque<Task> runnable_;
    std::unordered_map<int, FdContext> fdContexts_;

    std::atomic_bool ownerBound_{false};
    std::thread::id ownerThread_{};
    std::atomic_bool stopRequested_{false};

    std::mutex hookMutex_;
    std::map<CloseHookId, Task> closeHooks_;
    CloseHookId nextHookId_{1};
};

} // namespace ctrlc::event
