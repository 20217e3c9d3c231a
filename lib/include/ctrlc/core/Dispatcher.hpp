#pragma once

#include <ctrlc/platform/SignalSource.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <thread>

namespace ctrlc::core
{

/// 동기 사용자 핸들러. true 를 반환하면 "완료" -> dispatch 스레드 종료.
using Handler = std::function<bool()>;

/// dispatch 스레드에 대한 join 가능한 핸들입니다.
///
/// - 호출자가 소유합니다. 라이브러리는 내부에서 절대 join 하지 않습니다.
/// - join() 은 핸들러가 true 를 반환해 루프가 끝날 때까지 블록합니다.
/// - join 하지 않은 채 소멸되면 스레드는 detach 됩니다. (std::thread 처럼 terminate 하지 않음)
class DispatchHandle : private ctrlc::util::NonCopyable
{
  public:
    DispatchHandle() noexcept = default;
    explicit DispatchHandle(std::thread thread) noexcept : thread_(std::move(thread)) {}
    ~DispatchHandle();

    DispatchHandle(DispatchHandle &&) noexcept = default;
    DispatchHandle &operator=(DispatchHandle &&other) noexcept;

    [[nodiscard]] bool joinable() const noexcept { return thread_.joinable(); }
    [[nodiscard]] std::thread::id id() const noexcept { return thread_.get_id(); }

    /// 스레드가 끝날 때까지 기다립니다. joinable 이 아니면 std::system_error.
    void join();

    void detach();

  private:
    std::thread thread_;
};

/// dispatch 스레드를 하나 띄웁니다.
///
/// 루프: source->wait() -> handler() -> true 면 종료, false 면 반복.
///
/// - source 는 이미 install 된 상태여야 합니다. 스레드가 공동 소유합니다.
/// - handler 는 이 스레드 하나에서만, 한 번에 하나씩 호출됩니다. (재진입 없음)
/// - handler 에서 던진 예외는 잡지 않습니다. (std::terminate)
/// - wait() 실패는 복구 불가로 보고 FATAL 로그 후 std::abort() 합니다.
/// - 스레드 생성 실패는 std::system_error.
[[nodiscard]] DispatchHandle startDispatchThread(std::shared_ptr<platform::ISignalSource> source,
                                                 Handler handler);

} // namespace ctrlc::core
