#include <ctrlc/Error.hpp>
#include <ctrlc/core/InitGuard.hpp>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using ctrlc::Errc;
using ctrlc::core::InitGuard;
using ctrlc::core::RegistrationState;

namespace
{

/// 여러 스레드가 동시에 등록해도 closure 는 최대 한 번, 성공도 정확히 한 번이어야 합니다.
bool test_concurrent_register_once()
{
    InitGuard guard;

    constexpr int kThreads = 8;
    std::atomic<int> closureRuns{0};
    std::atomic<int> successes{0};
    std::atomic<int> rejected{0};
    std::atomic<int> unexpected{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&]() {
            while (!go.load(std::memory_order_acquire))
            {
                std::this_thread::yield();
            }
            try
            {
                const int v = guard.registerOnce(true, [&](bool) {
                    closureRuns.fetch_add(1, std::memory_order_relaxed);
                    return 42;
                });
                if (v == 42)
                {
                    successes.fetch_add(1, std::memory_order_relaxed);
                }
            }
            catch (const ctrlc::Error &e)
            {
                if (e.code() == Errc::AlreadyRegistered)
                    rejected.fetch_add(1, std::memory_order_relaxed);
                else
                    unexpected.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    go.store(true, std::memory_order_release);
    for (auto &t : threads)
    {
        t.join();
    }

    if (closureRuns.load() != 1 || successes.load() != 1 || rejected.load() != kThreads - 1 ||
        unexpected.load() != 0)
    {
        std::cerr << "[concurrent] closureRuns=" << closureRuns.load()
                  << " successes=" << successes.load() << " rejected=" << rejected.load()
                  << " unexpected=" << unexpected.load() << "\n";
        return false;
    }
    if (guard.state() != RegistrationState::Initialized)
    {
        std::cerr << "[concurrent] state is not Initialized\n";
        return false;
    }
    return true;
}

/// 성공 이후의 호출은 overwrite 값과 무관하게 closure 를 돌리지 않고 AlreadyRegistered 입니다.
bool test_second_call_rejected()
{
    InitGuard guard;
    (void)guard.registerOnce(true, [](bool) { return 0; });

    for (const bool overwrite : {true, false})
    {
        bool ran = false;
        try
        {
            (void)guard.registerOnce(overwrite, [&](bool) {
                ran = true;
                return 0;
            });
            std::cerr << "[second] registerOnce(overwrite=" << overwrite << ") did not throw\n";
            return false;
        }
        catch (const ctrlc::Error &e)
        {
            if (e.code() != Errc::AlreadyRegistered)
            {
                std::cerr << "[second] unexpected code: " << e.code().message() << "\n";
                return false;
            }
        }
        if (ran)
        {
            std::cerr << "[second] closure ran after registration\n";
            return false;
        }
    }
    return true;
}

/// closure 가 실패하면 같은 예외가 전파되고 상태는 Uninitialized 로 돌아가 재시도할 수 있습니다.
bool test_failure_allows_retry()
{
    InitGuard guard;
    bool seenOverwrite = true;

    try
    {
        (void)guard.registerOnce(false, [&](bool overwrite) -> int {
            seenOverwrite = overwrite;
            throw ctrlc::Error(Errc::MultipleHandlers);
        });
        std::cerr << "[retry] failing closure did not throw\n";
        return false;
    }
    catch (const ctrlc::Error &e)
    {
        if (e.code() != Errc::MultipleHandlers)
        {
            std::cerr << "[retry] wrong error propagated: " << e.code().message() << "\n";
            return false;
        }
    }

    if (seenOverwrite)
    {
        std::cerr << "[retry] overwrite flag not forwarded to closure\n";
        return false;
    }
    if (guard.state() != RegistrationState::Uninitialized)
    {
        std::cerr << "[retry] state after failure: " << ctrlc::core::registrationStateName(guard.state())
                  << "\n";
        return false;
    }

    try
    {
        (void)guard.registerOnce(true, [](bool) { return 1; });
    }
    catch (const std::exception &e)
    {
        std::cerr << "[retry] retry failed: " << e.what() << "\n";
        return false;
    }
    return guard.state() == RegistrationState::Initialized;
}

/// tryTransition 은 기대한 from 상태일 때만 전이합니다.
bool test_try_transition()
{
    InitGuard guard;
    if (guard.tryTransition(RegistrationState::Initializing, RegistrationState::Initialized))
    {
        std::cerr << "[transition] transitioned from wrong state\n";
        return false;
    }
    if (!guard.tryTransition(RegistrationState::Uninitialized, RegistrationState::Initializing))
    {
        std::cerr << "[transition] Uninitialized -> Initializing failed\n";
        return false;
    }
    return guard.state() == RegistrationState::Initializing;
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_concurrent_register_once();
    ok = ok && test_second_call_rejected();
    ok = ok && test_failure_allows_retry();
    ok = ok && test_try_transition();

    if (!ok)
    {
        std::cerr << "InitGuard tests FAILED\n";
        return 1;
    }

    std::cout << "InitGuard tests PASSED\n";
    return 0;
}
