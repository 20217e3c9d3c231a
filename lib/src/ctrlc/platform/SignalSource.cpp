#include <ctrlc/platform/SignalSource.hpp>

#if defined(_WIN32)
#include <ctrlc/platform/ConsoleSignalSource.hpp>
#else
#include <ctrlc/platform/PosixSignalSource.hpp>
#endif

namespace ctrlc::platform
{

std::vector<SignalKind> watchedSignals()
{
    std::vector<SignalKind> kinds{SignalKind::Interrupt};
#if defined(_WIN32)
    kinds.push_back(SignalKind::Break);
#elif defined(CTRLC_ENABLE_TERMINATION)
    kinds.push_back(SignalKind::Terminate);
    kinds.push_back(SignalKind::Hangup);
#endif
    return kinds;
}

std::unique_ptr<ISignalSource> makePlatformSignalSource(std::vector<SignalKind> kinds)
{
#if defined(_WIN32)
    return std::make_unique<ConsoleSignalSource>(std::move(kinds));
#else
    return std::make_unique<PosixSignalSource>(std::move(kinds));
#endif
}

} // namespace ctrlc::platform
