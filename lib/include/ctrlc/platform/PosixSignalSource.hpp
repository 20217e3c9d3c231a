#pragma once

#include <ctrlc/platform/SignalSource.hpp>
#include <ctrlc/platform/Trampoline.hpp>
#include <ctrlc/platform/WakeupPipe.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <memory>
#include <vector>

namespace ctrlc::platform
{

/// Unix 계열 ISignalSource 구현입니다.
///
/// install(): self-pipe 를 만들고 write end 를 감시 신호마다 Trampoline 에 구독시킨 뒤
///            sigaction 으로 trampoline 을 설치합니다.
/// wait()   : read end 에서 1바이트(신호 번호)를 블로킹 read 합니다.
///
/// 신호가 handler 실행 중에 여러 번 오면 pipe 에 바이트가 쌓이고, 이후 wait() 마다 하나씩
/// 소비됩니다. pipe 가 가득 차면 그 이상은 합쳐집니다.
class PosixSignalSource final : public ISignalSource, private ctrlc::util::NonMovable
{
  public:
    explicit PosixSignalSource(std::vector<SignalKind> kinds);
    ~PosixSignalSource() noexcept override;

    [[nodiscard]] PlatformCapabilities capabilities() const noexcept override;

    /// 실패하면 이 호출로 적용된 구독/설치를 모두 되돌리고 예외를 다시 던집니다.
    void install(bool overwrite) override;

    /// 이 source 가 새로 설치한 sigaction 을 원래대로 돌리고, 구독을 풀고 pipe 를 닫습니다.
    void uninstall() noexcept override;

    SignalKind wait() override;

  private:
    std::vector<SignalKind> kinds_;
    std::unique_ptr<WakeupPipe> pipe_;
    std::vector<Trampoline::SlotId> slots_;
    std::vector<int> newlyInstalled_; // install() 이 SIG_DFL 등에서 trampoline 으로 바꾼 신호

    void releaseSlots_() noexcept;
};

} // namespace ctrlc::platform
