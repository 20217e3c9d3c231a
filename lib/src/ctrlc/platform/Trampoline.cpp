#include <ctrlc/platform/Trampoline.hpp>

#include <ctrlc/Error.hpp>
#include <ctrlc/core/Logger.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace ctrlc::platform
{

namespace
{

// 시그널 핸들러에서 읽는 값은 lock-free atomic 이어야 async-signal-safe 하다.
static_assert(std::atomic<int>::is_always_lock_free, "trampoline needs lock-free atomic<int>");

struct Slot
{
    std::atomic<int> signo{0}; // 0 = 비어 있음
    std::atomic<int> fd{-1};
};

struct InstalledAction
{
    bool installed{false};
    struct sigaction oldAction{};
};

constexpr int kMaxSignal = 65; // Linux NSIG

std::array<Slot, Trampoline::kMaxSubscribers> g_slots{};
std::array<InstalledAction, kMaxSignal> g_installed{};
std::mutex g_tableMutex;

// 슬롯을 훑는 중인 trampoline 호출 수. unsubscribe 는 이것이 0 이 될 때까지 기다린다.
std::atomic<int> g_inFlight{0};

bool isValidSignal(int signo) noexcept
{
    return signo > 0 && signo < kMaxSignal;
}

bool hasForeignDisposition(const struct sigaction &old) noexcept
{
    if ((old.sa_flags & SA_SIGINFO) != 0)
    {
        return old.sa_sigaction != nullptr;
    }
    // SIG_IGN 도 "누군가 이미 정한 disposition" 으로 본다.
    return old.sa_handler != SIG_DFL;
}

extern "C" void ctrlcTrampoline(int signo)
{
    // 절대 금지: 로그, malloc/new, mutex, format, iostream
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signo);

    g_inFlight.fetch_add(1, std::memory_order_seq_cst);
    for (auto &slot : g_slots)
    {
        if (slot.signo.load(std::memory_order_acquire) != signo)
        {
            continue;
        }
        const int fd = slot.fd.load(std::memory_order_acquire);
        if (fd < 0)
        {
            continue;
        }

        ::ssize_t n = 0;
        do
        {
            n = ::write(fd, &byte, 1);
        } while (n < 0 && errno == EINTR);
        // EAGAIN: pipe 가 가득 참 -> 읽는 쪽이 이미 깨어날 것이므로 이 wakeup 은 합쳐진다.
    }
    g_inFlight.fetch_sub(1, std::memory_order_seq_cst);

    errno = savedErrno;
}

} // namespace

Trampoline::SlotId Trampoline::subscribe(int signo, int writeFd)
{
    if (!isValidSignal(signo) || writeFd < 0)
    {
        throw std::system_error(EINVAL, std::generic_category(),
                                "Trampoline: invalid signal or fd");
    }

    std::lock_guard<std::mutex> lock(g_tableMutex);

    for (SlotId i = 0; i < g_slots.size(); ++i)
    {
        auto &slot = g_slots[i];
        if (slot.signo.load(std::memory_order_relaxed) != 0)
        {
            continue;
        }
        // fd 를 먼저 채우고 signo 를 release 로 publish 한다.
        slot.fd.store(writeFd, std::memory_order_relaxed);
        slot.signo.store(signo, std::memory_order_release);

        CTRLC_LOG_DEBUG("Trampoline", "Subscribed", "signo={} fd={} slot={}", signo, writeFd, i);
        return i;
    }

    CTRLC_LOG_ERROR("Trampoline", "SubscribeFailed", "reason=TableFull signo={} max={}", signo,
                    kMaxSubscribers);
    throw Error(Errc::TooManySubscribers,
                "Trampoline: no free slot for signal " + std::to_string(signo));
}

void Trampoline::unsubscribe(SlotId slot) noexcept
{
    if (slot >= g_slots.size())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(g_tableMutex);

    auto &s = g_slots[slot];
    const int signo = s.signo.exchange(0, std::memory_order_seq_cst);
    const int fd = s.fd.exchange(-1, std::memory_order_seq_cst);

    // 슬롯을 비우기 전에 fd 를 읽어 간 trampoline 이 write 를 끝낼 때까지 기다린다.
    // 이후 호출은 빈 슬롯만 보므로 반환 뒤 호출자가 fd 를 닫아도 된다.
    while (g_inFlight.load(std::memory_order_seq_cst) != 0)
    {
        std::this_thread::yield();
    }

    if (signo != 0)
    {
        CTRLC_LOG_DEBUG("Trampoline", "Unsubscribed", "signo={} fd={} slot={}", signo, fd, slot);
    }
}

bool Trampoline::install(int signo, bool overwrite)
{
    if (!isValidSignal(signo))
    {
        throw std::system_error(EINVAL, std::generic_category(), "Trampoline: invalid signal");
    }

    std::lock_guard<std::mutex> lock(g_tableMutex);

    auto &entry = g_installed[static_cast<std::size_t>(signo)];
    if (entry.installed)
    {
        return false;
    }

    struct sigaction sa{};
    sa.sa_handler = &ctrlcTrampoline;
    ::sigemptyset(&sa.sa_mask);
    // SA_RESTART: 사용자 코드의 read/write 가 Ctrl-C 때문에 EINTR 로 깨지지 않게 한다.
    sa.sa_flags = SA_RESTART;

    struct sigaction old{};
    if (::sigaction(signo, &sa, &old) != 0)
    {
        throw std::system_error(errno, std::generic_category(), "Trampoline: sigaction failed");
    }

    if (!overwrite && hasForeignDisposition(old))
    {
        (void)::sigaction(signo, &old, nullptr);
        CTRLC_LOG_WARN("Platform", "InstallRejected", "signo={} reason=ForeignDisposition", signo);
        throw Error(Errc::MultipleHandlers,
                    "Trampoline: signal " + std::to_string(signo) + " already has a handler");
    }

    entry.oldAction = old;
    entry.installed = true;

    CTRLC_LOG_INFO("Platform", "Installed", "signo={} overwrite={} replaced_foreign={}", signo,
                   overwrite, hasForeignDisposition(old));
    return true;
}

void Trampoline::uninstall(int signo) noexcept
{
    if (!isValidSignal(signo))
    {
        return;
    }

    std::lock_guard<std::mutex> lock(g_tableMutex);

    auto &entry = g_installed[static_cast<std::size_t>(signo)];
    if (!entry.installed)
    {
        return;
    }

    (void)::sigaction(signo, &entry.oldAction, nullptr);
    entry.installed = false;

    CTRLC_LOG_INFO("Platform", "Uninstalled", "signo={}", signo);
}

bool Trampoline::isInstalled(int signo) noexcept
{
    if (!isValidSignal(signo))
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(g_tableMutex);
    return g_installed[static_cast<std::size_t>(signo)].installed;
}

std::size_t Trampoline::subscriberCount(int signo) noexcept
{
    std::size_t count = 0;
    for (const auto &slot : g_slots)
    {
        if (slot.signo.load(std::memory_order_acquire) == signo)
        {
            ++count;
        }
    }
    return count;
}

} // namespace ctrlc::platform
