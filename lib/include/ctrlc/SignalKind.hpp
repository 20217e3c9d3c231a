#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ctrlc
{

/// 어떤 인터럽트 조건이 발생했는지를 나타냅니다.
///
/// - Unix   : Interrupt=SIGINT, Terminate=SIGTERM, Hangup=SIGHUP
/// - Windows: Interrupt=CTRL_C_EVENT, Break=CTRL_BREAK_EVENT
/// 모든 플랫폼에 모든 값이 존재하는 것은 아닙니다.
enum class SignalKind : std::uint8_t
{
    Interrupt = 0,
    Terminate,
    Hangup,
    Break,
};

[[nodiscard]] std::string_view signalName(SignalKind kind) noexcept;

/// SignalKind 에 대응하는 OS 신호 번호. 해당 플랫폼에 없는 종류면 nullopt.
[[nodiscard]] std::optional<int> nativeSignal(SignalKind kind) noexcept;

/// OS 신호 번호 -> SignalKind. 감시 대상이 아닌 번호면 nullopt.
[[nodiscard]] std::optional<SignalKind> signalKindFromNative(int signo) noexcept;

} // namespace ctrlc
