#pragma once

#include <ctrlc/SignalKind.hpp>

#include <memory>
#include <vector>

namespace ctrlc::platform
{

/// 플랫폼별 인터럽트 전달 모델의 차이를 기술합니다.
///
/// 호출 지점에서 #ifdef 로 분기하지 않고 이 값을 보고 판단합니다.
struct PlatformCapabilities
{
    /// install(overwrite=false) 가 기존 핸들러 존재 시 실패할 수 있는가 (Unix: true)
    bool enforcesOverwrite{false};

    /// OS 가 여러 핸들러를 쌓아서 차례로 호출하는가 (Windows console: true)
    bool stacksHandlers{false};

    /// wait() 가 어떤 종류가 왔는지 구분해 돌려주는가
    bool distinguishesKinds{false};
};

/// OS 인터럽트 전달을 "스레드 블로킹 wait" 로 바꿔 주는 플랫폼 추상화입니다.
///
/// - install() 은 인스턴스당 한 번만 호출합니다. (InitGuard 가 프로세스 단위로 보장)
/// - wait() 는 전용 스레드에서 무한 루프로 반복 호출해도 안전해야 합니다.
/// - 두 함수 모두 OS 호출 실패 시 std::system_error 를 던집니다.
class ISignalSource
{
  public:
    virtual ~ISignalSource() = default;

    [[nodiscard]] virtual PlatformCapabilities capabilities() const noexcept = 0;

    virtual void install(bool overwrite) = 0;

    /// install() 이 적용한 것을 되돌립니다. dispatch 스레드를 띄우지 못했을 때만 호출됩니다.
    virtual void uninstall() noexcept {}

    /// 다음 인터럽트가 올 때까지 블록하고, 발생한 종류를 반환합니다.
    virtual SignalKind wait() = 0;
};

/// 현재 빌드 설정에서 감시하는 신호 목록입니다.
///
/// - 항상 Interrupt
/// - Unix + CTRLC_ENABLE_TERMINATION: Terminate, Hangup 추가
/// - Windows: Break 추가 (CTRL_BREAK 도 Ctrl-C 와 같은 의미로 취급)
[[nodiscard]] std::vector<SignalKind> watchedSignals();

/// 현재 플랫폼의 ISignalSource 구현을 만듭니다. (install 은 호출자가 한다)
[[nodiscard]] std::unique_ptr<ISignalSource> makePlatformSignalSource(std::vector<SignalKind> kinds);

} // namespace ctrlc::platform
