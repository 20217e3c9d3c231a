#include <ctrlc/Ctrlc.hpp>
#include <ctrlc/core/ProcessContext.hpp>

#include <atomic>
#include <csignal>
#include <iostream>

#include <signal.h>

using ctrlc::Errc;
using ctrlc::core::RegistrationState;

namespace
{

volatile std::sig_atomic_t g_foreignHits = 0;

extern "C" void foreignHandler(int)
{
    g_foreignHits = g_foreignHits + 1;
}

RegistrationState processState()
{
    return ctrlc::core::ProcessContext::instance().initGuard().state();
}

bool currentHandlerIsForeign()
{
    struct sigaction cur{};
    ::sigaction(SIGINT, nullptr, &cur);
    return (cur.sa_flags & SA_SIGINFO) == 0 && cur.sa_handler == &foreignHandler;
}

/// 다른 핸들러가 있으면 trySetHandler 는 MultipleHandlers 로 실패하고 아무것도 바꾸지 않습니다.
/// 이후 setHandler 는 그 핸들러를 덮어쓰고 성공합니다.
bool test_try_set_handler_respects_foreign_handler()
{
    struct sigaction sa{};
    sa.sa_handler = &foreignHandler;
    ::sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGINT, &sa, nullptr) != 0)
    {
        std::cerr << "[try] could not install foreign handler\n";
        return false;
    }

    try
    {
        auto handle = ctrlc::trySetHandler([] { return true; });
        std::cerr << "[try] trySetHandler succeeded over a foreign handler\n";
        return false;
    }
    catch (const ctrlc::Error &e)
    {
        if (e.code() != Errc::MultipleHandlers)
        {
            std::cerr << "[try] unexpected code: " << e.code().message() << "\n";
            return false;
        }
    }

    if (processState() != RegistrationState::Uninitialized || !currentHandlerIsForeign())
    {
        std::cerr << "[try] failed registration left side effects\n";
        return false;
    }

    std::raise(SIGINT);
    if (g_foreignHits != 1)
    {
        std::cerr << "[try] foreign handler no longer receives SIGINT\n";
        return false;
    }

    std::atomic<int> calls{0};
    ctrlc::DispatchHandle handle = ctrlc::setHandler([&] {
        calls.fetch_add(1);
        return true;
    });

    if (processState() != RegistrationState::Initialized || currentHandlerIsForeign())
    {
        std::cerr << "[try] setHandler did not take over SIGINT\n";
        return false;
    }

    std::raise(SIGINT);
    handle.join();

    if (calls.load() != 1 || g_foreignHits != 1)
    {
        std::cerr << "[try] calls=" << calls.load() << " foreignHits=" << g_foreignHits << "\n";
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_try_set_handler_respects_foreign_handler();

    if (!ok)
    {
        std::cerr << "TrySetHandler tests FAILED\n";
        return 1;
    }

    std::cout << "TrySetHandler tests PASSED\n";
    return 0;
}
