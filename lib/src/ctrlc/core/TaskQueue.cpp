#include <ctrlc/core/TaskQueue.hpp>

namespace ctrlc::core
{

void TaskQueue::push(Task &&task)
{
    ctrlc::util::SpinLockGuard guard(lock_);
    queue_.push_back(std::move(task));
}

bool TaskQueue::tryPop(Task &outTask)
{
    ctrlc::util::SpinLockGuard guard(lock_);

    if (queue_.empty())
    {
        return false;
    }

    outTask = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::size_t TaskQueue::popAll(std::deque<Task> &out)
{
    std::deque<Task> taken;
    {
        // 스핀 구간에서는 swap 만 한다. Task 소멸/실행은 락 밖에서.
        ctrlc::util::SpinLockGuard guard(lock_);
        taken.swap(queue_);
    }

    const std::size_t n = taken.size();
    for (auto &task : taken)
    {
        out.push_back(std::move(task));
    }
    return n;
}

bool TaskQueue::empty()
{
    ctrlc::util::SpinLockGuard guard(lock_);
    return queue_.empty();
}

} // namespace ctrlc::core
