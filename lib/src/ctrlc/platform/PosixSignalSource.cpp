#include <ctrlc/platform/PosixSignalSource.hpp>

#include <ctrlc/core/Logger.hpp>

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ctrlc::platform
{

PosixSignalSource::PosixSignalSource(std::vector<SignalKind> kinds) : kinds_(std::move(kinds)) {}

PosixSignalSource::~PosixSignalSource() noexcept
{
    // disposition 은 프로세스 수명 동안 유지한다. 구독만 풀고 pipe 를 닫는다.
    releaseSlots_();
}

PlatformCapabilities PosixSignalSource::capabilities() const noexcept
{
    return PlatformCapabilities{
        .enforcesOverwrite = true,
        .stacksHandlers = false,
        .distinguishesKinds = true,
    };
}

void PosixSignalSource::releaseSlots_() noexcept
{
    for (const auto slot : slots_)
    {
        Trampoline::unsubscribe(slot);
    }
    slots_.clear();
}

void PosixSignalSource::install(bool overwrite)
{
    if (pipe_)
    {
        throw std::logic_error("PosixSignalSource: install called twice");
    }

    pipe_ = std::make_unique<WakeupPipe>(WakeupPipe::ReadMode::Blocking);

    // 중간 실패나 이후 uninstall() 을 위해 새로 설치한 신호를 기록한다.
    try
    {
        for (const auto kind : kinds_)
        {
            const auto signo = nativeSignal(kind);
            if (!signo)
            {
                throw std::system_error(EINVAL, std::generic_category(),
                                        "PosixSignalSource: unsupported signal kind " +
                                            std::string(signalName(kind)));
            }

            // 구독을 먼저: 설치 직후 들어오는 신호도 놓치지 않는다.
            slots_.push_back(Trampoline::subscribe(*signo, pipe_->writeFd()));

            if (Trampoline::install(*signo, overwrite))
            {
                newlyInstalled_.push_back(*signo);
            }
        }
    }
    catch (...)
    {
        uninstall();
        throw;
    }

    CTRLC_LOG_INFO("Platform", "SourceInstalled", "kinds={} read_fd={} overwrite={}",
                   kinds_.size(), pipe_->readFd(), overwrite);
}

void PosixSignalSource::uninstall() noexcept
{
    for (const int signo : newlyInstalled_)
    {
        Trampoline::uninstall(signo);
    }
    newlyInstalled_.clear();
    releaseSlots_();
    pipe_.reset();
}

SignalKind PosixSignalSource::wait()
{
    if (!pipe_)
    {
        throw std::system_error(EBADF, std::generic_category(),
                                "PosixSignalSource: wait before install");
    }

    for (;;)
    {
        const unsigned char signo = pipe_->readByte();
        if (const auto kind = signalKindFromNative(signo))
        {
            return *kind;
        }
        CTRLC_LOG_WARN("Platform", "UnknownWakeup", "byte={}", static_cast<int>(signo));
    }
}

} // namespace ctrlc::platform
