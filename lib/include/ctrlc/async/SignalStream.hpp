#pragma once

#include <ctrlc/SignalKind.hpp>
#include <ctrlc/event/FdHandler.hpp>
#include <ctrlc/platform/Trampoline.hpp>
#include <ctrlc/platform/WakeupPipe.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <cstdint>
#include <functional>

namespace ctrlc::async
{

/// 한 종류의 신호를 EventLoop 에서 읽을 수 있는 fd 로 바꾼 스트림입니다. ("react" 계층)
///
/// - 생성 시 non-blocking self-pipe 를 만들고 Trampoline 에 구독, trampoline 을 설치합니다.
///   (async 경로는 항상 overwrite. 이미 설치돼 있으면 그대로 공유)
/// - fd 가 readable 이 되면 pipe 를 비우고 listener 를 호출합니다.
/// - 소멸 시 구독을 먼저 해제하고 pipe 를 닫습니다. EventLoop 등록 해제는 소유자 책임입니다.
class SignalStream final : public ctrlc::event::IFdHandler, private ctrlc::util::NonMovable
{
  public:
    using Listener = std::function<void(SignalKind)>;

    /// @throws std::system_error pipe/sigaction 실패, ctrlc::Error 구독 테이블 가득 참
    SignalStream(SignalKind kind, Listener listener);
    ~SignalStream() noexcept override;

    [[nodiscard]] SignalKind kind() const noexcept { return kind_; }
    [[nodiscard]] int fd() const noexcept { return pipe_.readFd(); }

    [[nodiscard]] const char *fdTag() const noexcept override { return "signal-stream"; }
    [[nodiscard]] std::uint64_t fdDebugId() const noexcept override
    {
        return static_cast<std::uint64_t>(signo_);
    }

    void handleEvent(ctrlc::event::EventLoop &loop,
                     const ctrlc::event::EpollReactor::ReadyEvent &ev) override;

  private:
    SignalKind kind_;
    int signo_{0};
    Listener listener_;
    platform::WakeupPipe pipe_;
    platform::Trampoline::SlotId slot_{};
};

} // namespace ctrlc::async
