#pragma once

#include <cstddef>

namespace ctrlc::platform
{

/// 프로세스 전역 POSIX 시그널 trampoline 입니다. ("arm" 계층)
///
/// ===== 역할 분리 =====
/// - arm   : 시그널 컨텍스트에서 실행. 구독된 fd 들에 신호 번호 1바이트를 write(2) 하는 것이 전부.
/// - react : 일반 스레드 컨텍스트에서 실행. 구독자가 pipe 를 read 해서 깨어난 뒤 모든 로직 수행.
///
/// ===== 시그널 컨텍스트 규약 =====
/// - 로그, malloc/new, mutex, iostream 금지.
/// - 구독 테이블은 고정 크기 배열 + lock-free std::atomic<int> 로만 읽는다.
/// - 테이블 변경(subscribe/unsubscribe)과 sigaction 설치는 mutex 아래, 일반 스레드에서만 한다.
///
/// 동기 경로(PosixSignalSource)와 async 경로(SignalStream)가 같은 trampoline 을 공유합니다.
/// 한 신호에 대한 sigaction 은 프로세스 수명 동안 최대 한 번 설치됩니다.
class Trampoline
{
  public:
    using SlotId = std::size_t;

    static constexpr std::size_t kMaxSubscribers = 32;

    Trampoline() = delete;

    /// signo 발생 시 writeFd 에 1바이트를 쓰도록 구독합니다.
    ///
    /// - writeFd 는 non-blocking 이어야 합니다. (pipe 가 가득 차면 그 wakeup 은 합쳐진다)
    /// - 테이블이 가득 차면 ctrlc::Error(Errc::TooManySubscribers) 를 던집니다.
    static SlotId subscribe(int signo, int writeFd);

    /// 구독을 해제합니다. 다른 스레드에서 실행 중인 trampoline 이 끝날 때까지 기다린 뒤 반환하므로,
    /// 반환 후에는 어떤 시그널도 이 fd 에 쓰지 않습니다. fd 는 호출자가 이 호출 이후에 close 합니다.
    ///
    /// 시그널 핸들러 안에서 호출하면 안 됩니다.
    static void unsubscribe(SlotId slot) noexcept;

    /// signo 에 trampoline 을 sigaction(SA_RESTART) 으로 설치합니다.
    ///
    /// - 이미 이 trampoline 이 설치되어 있으면 아무것도 하지 않고 false.
    /// - 새로 설치했으면 true. (호출자가 실패 시 rollback 할 수 있도록)
    /// - overwrite=false 이고 기존 disposition 이 SIG_DFL 이 아니면 기존 것을 복구하고
    ///   ctrlc::Error(Errc::MultipleHandlers) 를 던집니다.
    /// - sigaction 실패는 std::system_error.
    static bool install(int signo, bool overwrite);

    /// install() 이 true 를 반환한 신호를 원래 disposition 으로 되돌립니다. (rollback 전용, best-effort)
    static void uninstall(int signo) noexcept;

    [[nodiscard]] static bool isInstalled(int signo) noexcept;

    /// 현재 signo 를 구독 중인 슬롯 수 (테스트/디버깅용)
    [[nodiscard]] static std::size_t subscriberCount(int signo) noexcept;
};

} // namespace ctrlc::platform
