#pragma once

#include <cstddef>
#include <deque>
#include <functional>

#include <ctrlc/util/NonCopyable.hpp>
#include <ctrlc/util/SpinLock.hpp>

namespace ctrlc::core
{

/// EventLoop 로 넘기는 작업 큐입니다. (MPSC: 아무 스레드나 push, loop 스레드만 pop)
class TaskQueue : private ctrlc::util::NonMovable
{
  public:
    using Task = std::function<void()>;

    TaskQueue() = default;

    void push(Task &&task);

    bool tryPop(Task &outTask);

    /// 현재 쌓인 작업을 한 번에 꺼냅니다. 꺼내는 도중 push 된 작업은 다음 호출 몫입니다.
    std::size_t popAll(std::deque<Task> &out);

    [[nodiscard]] bool empty();

  private:
    ctrlc::util::SpinLock lock_;
    std::deque<Task> queue_;
};

} // namespace ctrlc::core
