#pragma once

#include <ctrlc/platform/SignalSource.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <atomic>
#include <vector>

#include <windows.h>

namespace ctrlc::platform
{

/// Windows console-control ISignalSource 구현입니다.
///
/// - SetConsoleCtrlHandler 로 routine 을 등록하고, routine 은 semaphore 를 release 합니다.
/// - Windows 는 routine 을 스택으로 쌓아 last-registered-first-called 로 호출하므로
///   overwrite 를 강제할 방법이 없습니다. install(overwrite) 의 인자는 무시됩니다.
/// - routine 은 OS 가 만든 별도 스레드에서 돌기 때문에 POSIX 시그널 컨텍스트 같은 제약은 없지만,
///   여기서도 "arm" 만 하고 실제 로직은 wait() 이후에 수행합니다.
/// - OS 콜백에 user data 가 없으므로 프로세스 안에서 동시에 하나만 install 할 수 있습니다.
class ConsoleSignalSource final : public ISignalSource, private ctrlc::util::NonMovable
{
  public:
    explicit ConsoleSignalSource(std::vector<SignalKind> kinds);
    ~ConsoleSignalSource() noexcept override;

    [[nodiscard]] PlatformCapabilities capabilities() const noexcept override;

    void install(bool overwrite) override;
    void uninstall() noexcept override;
    SignalKind wait() override;

  private:
    static BOOL WINAPI consoleRoutine(DWORD ctrlType);

    [[nodiscard]] bool watches(SignalKind kind) const noexcept;

    std::vector<SignalKind> kinds_;
    HANDLE semaphore_{nullptr};
    std::atomic<int> lastKind_{static_cast<int>(SignalKind::Interrupt)};
    bool installed_{false};
};

} // namespace ctrlc::platform
