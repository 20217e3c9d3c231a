#include <ctrlc/platform/ConsoleSignalSource.hpp>

#include <ctrlc/core/Logger.hpp>

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <system_error>

namespace ctrlc::platform
{

namespace
{
std::atomic<ConsoleSignalSource *> g_active{nullptr};

[[noreturn]] void throwLastError(const char *what)
{
    throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(), what);
}
} // namespace

ConsoleSignalSource::ConsoleSignalSource(std::vector<SignalKind> kinds) : kinds_(std::move(kinds))
{
}

ConsoleSignalSource::~ConsoleSignalSource() noexcept
{
    uninstall();
}

void ConsoleSignalSource::uninstall() noexcept
{
    if (installed_)
    {
        (void)::SetConsoleCtrlHandler(&ConsoleSignalSource::consoleRoutine, FALSE);
        ConsoleSignalSource *expected = this;
        (void)g_active.compare_exchange_strong(expected, nullptr);
        installed_ = false;
    }
    if (semaphore_)
    {
        ::CloseHandle(semaphore_);
        semaphore_ = nullptr;
    }
}

PlatformCapabilities ConsoleSignalSource::capabilities() const noexcept
{
    return PlatformCapabilities{
        .enforcesOverwrite = false,
        .stacksHandlers = true,
        .distinguishesKinds = true,
    };
}

bool ConsoleSignalSource::watches(SignalKind kind) const noexcept
{
    return std::find(kinds_.begin(), kinds_.end(), kind) != kinds_.end();
}

void ConsoleSignalSource::install(bool overwrite)
{
    (void)overwrite;

    if (installed_)
    {
        throw std::logic_error("ConsoleSignalSource: install called twice");
    }

    semaphore_ = ::CreateSemaphoreW(nullptr, 0, LONG_MAX, nullptr);
    if (!semaphore_)
    {
        throwLastError("ConsoleSignalSource: CreateSemaphoreW failed");
    }

    ConsoleSignalSource *expected = nullptr;
    if (!g_active.compare_exchange_strong(expected, this))
    {
        throw std::logic_error("ConsoleSignalSource: another source is already active");
    }

    if (!::SetConsoleCtrlHandler(&ConsoleSignalSource::consoleRoutine, TRUE))
    {
        g_active.store(nullptr);
        throwLastError("ConsoleSignalSource: SetConsoleCtrlHandler failed");
    }

    installed_ = true;
    CTRLC_LOG_INFO("Platform", "SourceInstalled", "kinds={} model=ConsoleCtrl", kinds_.size());
}

SignalKind ConsoleSignalSource::wait()
{
    if (!semaphore_)
    {
        throw std::system_error(ERROR_INVALID_HANDLE, std::system_category(),
                                "ConsoleSignalSource: wait before install");
    }

    const DWORD rc = ::WaitForSingleObject(semaphore_, INFINITE);
    if (rc != WAIT_OBJECT_0)
    {
        throwLastError("ConsoleSignalSource: WaitForSingleObject failed");
    }
    return static_cast<SignalKind>(lastKind_.load(std::memory_order_acquire));
}

BOOL WINAPI ConsoleSignalSource::consoleRoutine(DWORD ctrlType)
{
    ConsoleSignalSource *self = g_active.load(std::memory_order_acquire);
    if (!self)
    {
        return FALSE;
    }

    const auto kind = signalKindFromNative(static_cast<int>(ctrlType));
    if (!kind || !self->watches(*kind))
    {
        // 다음 routine(기본 처리 포함)이 받도록 넘긴다.
        return FALSE;
    }

    self->lastKind_.store(static_cast<int>(*kind), std::memory_order_release);
    return ::ReleaseSemaphore(self->semaphore_, 1, nullptr) ? TRUE : FALSE;
}

} // namespace ctrlc::platform
