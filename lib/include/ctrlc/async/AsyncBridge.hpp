#pragma once

#include <ctrlc/SignalKind.hpp>
#include <ctrlc/event/EventLoop.hpp>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace ctrlc::async
{

class AsyncTaskState;

/// 비동기 핸들러가 끝났음을 알리는 completion 입니다.
///
/// - 복사 가능하며 아무 스레드에서나 호출할 수 있습니다.
/// - 첫 호출만 효력이 있고, 이후 호출은 무시됩니다.
class AsyncCompletion
{
  public:
    explicit AsyncCompletion(std::shared_ptr<AsyncTaskState> state) noexcept
        : state_(std::move(state))
    {
    }

    void operator()() const noexcept;

  private:
    std::shared_ptr<AsyncTaskState> state_;
};

/// 비동기 사용자 핸들러. 첫 인터럽트에서 EventLoop 스레드로 정확히 한 번 호출됩니다.
/// 작업을 마치면 (지금이든 나중이든) 전달받은 completion 을 호출해야 태스크가 끝납니다.
using AsyncHandler = std::function<void(AsyncCompletion)>;

/// setAsyncHandler 가 돌려주는 태스크 핸들입니다.
///
/// - 핸들을 버려도 태스크는 루프 위에서 계속 기다립니다. (호출자가 결과를 안 볼 뿐)
/// - 루프가 소멸하면 아직 발화하지 않은 태스크는 신호 구독을 풀고 실패로 끝납니다.
/// - join() 은 루프 스레드가 아닌 곳에서만 호출하세요. (루프 스레드에서 부르면 데드락)
class AsyncTaskHandle
{
  public:
    AsyncTaskHandle() = default;
    explicit AsyncTaskHandle(std::shared_ptr<AsyncTaskState> state);

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    /// 태스크가 끝났는가 (정상 완료, 설치 실패로 종료, 핸들러 예외 모두 포함)
    [[nodiscard]] bool isFinished() const noexcept;

    /// 태스크가 끝날 때까지 블록합니다. 핸들러가 던진 예외는 여기서 다시 던져집니다.
    /// 발화 전에 loop 가 소멸했으면 std::future_error(broken_promise) 를 던집니다.
    void join() const;

    /// race 에서 이긴 신호. 아직 발화하지 않았거나 설치 실패로 끝났으면 nullopt.
    [[nodiscard]] std::optional<SignalKind> firedBy() const noexcept;

  private:
    std::shared_ptr<AsyncTaskState> state_;
    std::shared_future<void> done_;
};

/// 이 빌드에서 async 태스크가 race 시키는 신호 목록입니다.
///
/// 항상 Interrupt. CTRLC_ENABLE_TERMINATION 빌드에서는 Terminate, Hangup 추가.
[[nodiscard]] std::vector<SignalKind> racedSignals();

/// loop 위에 인터럽트 대기 태스크를 하나 만듭니다.
///
/// - 첫 인터럽트(또는 termination 빌드의 SIGTERM/SIGHUP)에서 handler 를 정확히 한 번 호출하고,
///   completion 이 호출되면 태스크가 끝납니다. 다시 arm 하지 않습니다.
/// - 신호 소스 설치에 실패하면 ERROR 로그(기본 stderr)를 남기고 handler 없이 끝납니다.
///   프로세스에는 영향이 없습니다.
///
/// 주의: setHandler() 와 달리 프로세스 단위 단일 등록을 보장하지 않습니다.
/// 여러 번 호출하면 서로 독립된 태스크가 각각 자기 handler 를 발화합니다.
///
/// 아무 스레드에서나 호출할 수 있습니다. 실제 설치는 loop 스레드에서 일어납니다.
AsyncTaskHandle setAsyncHandler(ctrlc::event::EventLoop &loop, AsyncHandler handler);

namespace detail
{
/// race 대상 신호를 직접 지정하는 버전. (테스트용)
AsyncTaskHandle spawnInterruptTask(ctrlc::event::EventLoop &loop, std::vector<SignalKind> kinds,
                                   AsyncHandler handler);
} // namespace detail

} // namespace ctrlc::async
