#include <ctrlc/SignalKind.hpp>

#if defined(_WIN32)
#include <windows.h> // CTRL_C_EVENT, CTRL_BREAK_EVENT
#else
#include <signal.h>
#endif

namespace ctrlc
{

std::string_view signalName(SignalKind kind) noexcept
{
    switch (kind)
    {
    case SignalKind::Interrupt:
        return "SIGINT";
    case SignalKind::Terminate:
        return "SIGTERM";
    case SignalKind::Hangup:
        return "SIGHUP";
    case SignalKind::Break:
        return "CTRL_BREAK";
    }
    return "UNKNOWN";
}

std::optional<int> nativeSignal(SignalKind kind) noexcept
{
#if defined(_WIN32)
    switch (kind)
    {
    case SignalKind::Interrupt:
        return static_cast<int>(CTRL_C_EVENT);
    case SignalKind::Break:
        return static_cast<int>(CTRL_BREAK_EVENT);
    default:
        return std::nullopt;
    }
#else
    switch (kind)
    {
    case SignalKind::Interrupt:
        return SIGINT;
    case SignalKind::Terminate:
        return SIGTERM;
    case SignalKind::Hangup:
        return SIGHUP;
    default:
        return std::nullopt;
    }
#endif
}

std::optional<SignalKind> signalKindFromNative(int signo) noexcept
{
#if defined(_WIN32)
    switch (signo)
    {
    case CTRL_C_EVENT:
        return SignalKind::Interrupt;
    case CTRL_BREAK_EVENT:
        return SignalKind::Break;
    default:
        return std::nullopt;
    }
#else
    switch (signo)
    {
    case SIGINT:
        return SignalKind::Interrupt;
    case SIGTERM:
        return SignalKind::Terminate;
    case SIGHUP:
        return SignalKind::Hangup;
    default:
        return std::nullopt;
    }
#endif
}

} // namespace ctrlc
