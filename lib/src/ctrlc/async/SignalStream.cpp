#include <ctrlc/async/SignalStream.hpp>

#include <ctrlc/core/Logger.hpp>

#include <cerrno>
#include <string>
#include <system_error>

namespace ctrlc::async
{

namespace
{
int nativeOrThrow(SignalKind kind)
{
    const auto signo = nativeSignal(kind);
    if (!signo)
    {
        throw std::system_error(EINVAL, std::generic_category(),
                                "SignalStream: unsupported signal kind " +
                                    std::string(signalName(kind)));
    }
    return *signo;
}
} // namespace

SignalStream::SignalStream(SignalKind kind, Listener listener)
    : kind_(kind), signo_(nativeOrThrow(kind)), listener_(std::move(listener)),
      pipe_(platform::WakeupPipe::ReadMode::NonBlocking)
{
    slot_ = platform::Trampoline::subscribe(signo_, pipe_.writeFd());
    try
    {
        (void)platform::Trampoline::install(signo_, /*overwrite=*/true);
    }
    catch (const std::system_error &)
    {
        platform::Trampoline::unsubscribe(slot_);
        throw;
    }
}

SignalStream::~SignalStream() noexcept
{
    // 구독 해제가 pipe close 보다 먼저여야 trampoline 이 닫힌 fd 에 쓰지 않는다.
    platform::Trampoline::unsubscribe(slot_);
}

void SignalStream::handleEvent(ctrlc::event::EventLoop &loop,
                               const ctrlc::event::EpollReactor::ReadyEvent &ev)
{
    (void)loop;

    if (ev.events & (EPOLLERR | EPOLLHUP))
    {
        CTRLC_LOG_WARN("SignalStream", "FdError", "signal={} fd={} events=0x{:x}",
                       signalName(kind_), ev.fd, ev.events);
    }

    if (!pipe_.drain())
    {
        return;
    }

    if (listener_)
    {
        listener_(kind_);
    }
}

} // namespace ctrlc::async
