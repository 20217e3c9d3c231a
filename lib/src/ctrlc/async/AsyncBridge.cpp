#include <ctrlc/async/AsyncBridge.hpp>

#include <ctrlc/async/SignalStream.hpp>
#include <ctrlc/core/Logger.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <system_error>

namespace ctrlc::async
{

/// 태스크 하나의 공유 상태입니다. (태스크, 핸들, completion 이 공동 소유)
class AsyncTaskState
{
  public:
    AsyncTaskState() : future_(promise_.get_future().share()) {}

    [[nodiscard]] std::shared_future<void> future() const { return future_; }

    void markFired(SignalKind kind) noexcept
    {
        firedBy_.store(static_cast<int>(kind), std::memory_order_release);
    }

    [[nodiscard]] std::optional<SignalKind> firedBy() const noexcept
    {
        const int v = firedBy_.load(std::memory_order_acquire);
        if (v < 0)
        {
            return std::nullopt;
        }
        return static_cast<SignalKind>(v);
    }

    void finish() noexcept
    {
        if (settled_.exchange(true, std::memory_order_acq_rel))
        {
            CTRLC_LOG_WARN("AsyncBridge", "CompletionIgnored", "reason=AlreadySettled");
            return;
        }
        promise_.set_value();
    }

    void fail(std::exception_ptr error) noexcept
    {
        if (settled_.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }
        promise_.set_exception(std::move(error));
    }

  private:
    std::promise<void> promise_;
    std::shared_future<void> future_;
    std::atomic<bool> settled_{false};
    std::atomic<int> firedBy_{-1};
};

namespace
{

std::atomic<std::uint64_t> g_nextTaskId{1};

/// 신호 소스들을 race 시키고, 이긴 쪽에서 handler 를 한 번 호출하는 태스크입니다.
///
/// 수명: start() 부터 발화(또는 설치 실패)까지 self_ 로 스스로를 붙잡고 있습니다.
/// 발화하지 않은 채 루프가 먼저 소멸하면 close hook 에서 구독을 풀고
/// broken_promise 로 상태를 닫은 뒤 self_ 를 놓습니다.
class InterruptTask final : public std::enable_shared_from_this<InterruptTask>
{
  public:
    InterruptTask(ctrlc::event::EventLoop &loop, std::vector<SignalKind> kinds,
                  AsyncHandler handler, std::shared_ptr<AsyncTaskState> state)
        : loop_(loop), kinds_(std::move(kinds)), handler_(std::move(handler)),
          state_(std::move(state)), id_(g_nextTaskId.fetch_add(1, std::memory_order_relaxed))
    {
    }

    void start()
    {
        hookId_ = loop_.addCloseHook([weak = weak_from_this()]() {
            if (auto task = weak.lock())
            {
                task->abandon();
            }
        });
        self_ = shared_from_this();
        loop_.post([task = self_]() { task->arm(); });
    }

  private:
    void arm() noexcept
    {
        const auto mask = ctrlc::event::EpollReactor::makeEventMask({
            ctrlc::event::EpollReactor::Event::Read,
        });

        try
        {
            for (const auto kind : kinds_)
            {
                auto stream = std::make_shared<SignalStream>(
                    kind, [this](SignalKind fired) { onFired(fired); });

                if (!loop_.addFd(stream->fd(), mask, stream.get()))
                {
                    throw std::system_error(errno, std::generic_category(),
                                            "AsyncBridge: EventLoop::addFd failed");
                }
                streams_.push_back(std::move(stream));
            }
        }
        catch (const std::exception &e)
        {
            CTRLC_LOG_ERROR("AsyncBridge", "InstallFailed",
                            "task={} what='{}' msg='Critical system error while waiting for Ctrl-C'",
                            id_, e.what());
            finished_ = true;
            (void)loop_.removeCloseHook(hookId_);
            disarm();
            state_->finish();
            release();
            return;
        }

        CTRLC_LOG_INFO("AsyncBridge", "Armed", "task={} sources={}", id_, streams_.size());
    }

    void onFired(SignalKind kind) noexcept
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;
        (void)loop_.removeCloseHook(hookId_);

        // 진 소스들은 drain 하지도, 다시 arm 하지도 않고 그냥 내린다.
        disarm();
        state_->markFired(kind);

        CTRLC_LOG_INFO("AsyncBridge", "Fired", "task={} signal={}", id_, signalName(kind));

        try
        {
            handler_(AsyncCompletion(state_));
        }
        catch (...)
        {
            // 핸들러 실패는 태스크 실패로 핸들에 전달된다. (join() 에서 다시 던짐)
            CTRLC_LOG_ERROR("AsyncBridge", "HandlerFailed", "task={}", id_);
            state_->fail(std::current_exception());
        }

        release();
    }

    /// 루프 소멸자에서 호출됩니다. 루프는 더 이상 돌지 않으므로 removeFd/post 없이 정리한다.
    void abandon() noexcept
    {
        if (finished_)
        {
            return;
        }
        finished_ = true;

        // SignalStream 소멸자가 구독 해제 후 pipe 를 닫는다.
        streams_.clear();

        CTRLC_LOG_WARN("AsyncBridge", "Abandoned", "task={} reason=LoopDestroyed", id_);
        state_->fail(std::make_exception_ptr(std::future_error(std::future_errc::broken_promise)));
        self_.reset();
    }

    void disarm() noexcept
    {
        for (const auto &stream : streams_)
        {
            (void)loop_.removeFd(stream->fd());
        }

        // 지금 이 호출이 stream->handleEvent() 안일 수 있으므로 소멸은 다음 task 로 미룬다.
        if (!streams_.empty())
        {
            loop_.post([doomed = std::move(streams_)]() mutable { doomed.clear(); });
            streams_.clear();
        }
    }

    void release() noexcept
    {
        if (self_)
        {
            loop_.post([task = std::move(self_)]() mutable { task.reset(); });
        }
    }

    ctrlc::event::EventLoop &loop_;
    std::vector<SignalKind> kinds_;
    AsyncHandler handler_;
    std::shared_ptr<AsyncTaskState> state_;
    std::uint64_t id_;

    std::vector<std::shared_ptr<SignalStream>> streams_;
    std::shared_ptr<InterruptTask> self_;
    ctrlc::event::EventLoop::CloseHookId hookId_{0};
    bool finished_{false};
};

} // namespace

void AsyncCompletion::operator()() const noexcept
{
    if (state_)
    {
        state_->finish();
    }
}

AsyncTaskHandle::AsyncTaskHandle(std::shared_ptr<AsyncTaskState> state)
    : state_(std::move(state)), done_(state_ ? state_->future() : std::shared_future<void>{})
{
}

bool AsyncTaskHandle::isFinished() const noexcept
{
    if (!done_.valid())
    {
        return false;
    }
    return done_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void AsyncTaskHandle::join() const
{
    if (!done_.valid())
    {
        throw std::future_error(std::future_errc::no_state);
    }
    done_.get();
}

std::optional<SignalKind> AsyncTaskHandle::firedBy() const noexcept
{
    return state_ ? state_->firedBy() : std::nullopt;
}

std::vector<SignalKind> racedSignals()
{
    std::vector<SignalKind> kinds{SignalKind::Interrupt};
#if defined(CTRLC_ENABLE_TERMINATION)
    kinds.push_back(SignalKind::Terminate);
    kinds.push_back(SignalKind::Hangup);
#endif
    return kinds;
}

AsyncTaskHandle setAsyncHandler(ctrlc::event::EventLoop &loop, AsyncHandler handler)
{
    return detail::spawnInterruptTask(loop, racedSignals(), std::move(handler));
}

namespace detail
{

AsyncTaskHandle spawnInterruptTask(ctrlc::event::EventLoop &loop, std::vector<SignalKind> kinds,
                                   AsyncHandler handler)
{
    if (!handler)
    {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "setAsyncHandler: empty handler");
    }

    auto state = std::make_shared<AsyncTaskState>();
    auto task = std::make_shared<InterruptTask>(loop, std::move(kinds), std::move(handler), state);
    task->start();

    return AsyncTaskHandle(std::move(state));
}

} // namespace detail

} // namespace ctrlc::async
