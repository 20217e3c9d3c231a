#include <ctrlc/SignalKind.hpp>
#include <ctrlc/core/Dispatcher.hpp>
#include <ctrlc/platform/SignalSource.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

using ctrlc::SignalKind;
using ctrlc::core::DispatchHandle;
using ctrlc::core::startDispatchThread;

namespace
{

/// 테스트가 원하는 시점에 인터럽트를 흘려 넣는 ISignalSource 입니다.
class FakeSignalSource final : public ctrlc::platform::ISignalSource
{
  public:
    ctrlc::platform::PlatformCapabilities capabilities() const noexcept override
    {
        return {.enforcesOverwrite = false, .stacksHandlers = false, .distinguishesKinds = true};
    }

    void install(bool) override {}

    SignalKind wait() override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !pending_.empty(); });
        const SignalKind kind = pending_.front();
        pending_.pop_front();
        ++consumed_;
        return kind;
    }

    void fire(SignalKind kind)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(kind);
        }
        cv_.notify_one();
    }

    int consumed()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return consumed_;
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SignalKind> pending_;
    int consumed_{0};
};

/// false 를 N 번 반환한 뒤 true 를 반환하면 핸들러는 정확히 N+1 번 호출되고 스레드가 끝납니다.
/// 이후에 들어온 인터럽트는 아무도 읽지 않습니다.
bool test_stops_after_true()
{
    constexpr int kFalseReturns = 3;

    auto source = std::make_shared<FakeSignalSource>();
    std::atomic<int> calls{0};

    DispatchHandle handle = startDispatchThread(source, [&]() {
        return calls.fetch_add(1, std::memory_order_acq_rel) + 1 > kFalseReturns;
    });

    for (int i = 0; i < kFalseReturns + 1; ++i)
    {
        source->fire(SignalKind::Interrupt);
    }
    handle.join();

    if (calls.load() != kFalseReturns + 1)
    {
        std::cerr << "[stop] calls=" << calls.load() << " expected=" << kFalseReturns + 1 << "\n";
        return false;
    }

    source->fire(SignalKind::Interrupt);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    if (calls.load() != kFalseReturns + 1 || source->consumed() != kFalseReturns + 1)
    {
        std::cerr << "[stop] handler or wait ran after completion: calls=" << calls.load()
                  << " consumed=" << source->consumed() << "\n";
        return false;
    }
    return true;
}

/// 인터럽트가 몰려와도 핸들러는 한 번에 하나씩만 실행됩니다.
bool test_handler_is_serialized()
{
    constexpr int kBurst = 16;

    auto source = std::make_shared<FakeSignalSource>();
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    std::atomic<int> calls{0};

    DispatchHandle handle = startDispatchThread(source, [&]() {
        const int now = inFlight.fetch_add(1, std::memory_order_acq_rel) + 1;
        int seen = maxInFlight.load(std::memory_order_relaxed);
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        inFlight.fetch_sub(1, std::memory_order_acq_rel);
        return calls.fetch_add(1, std::memory_order_acq_rel) + 1 == kBurst;
    });

    std::thread a([&] {
        for (int i = 0; i < kBurst / 2; ++i)
            source->fire(SignalKind::Interrupt);
    });
    std::thread b([&] {
        for (int i = 0; i < kBurst / 2; ++i)
            source->fire(SignalKind::Terminate);
    });
    a.join();
    b.join();
    handle.join();

    if (maxInFlight.load() != 1 || calls.load() != kBurst)
    {
        std::cerr << "[serial] maxInFlight=" << maxInFlight.load() << " calls=" << calls.load()
                  << "\n";
        return false;
    }
    return true;
}

/// 핸들을 join 하지 않고 버리면 스레드는 detach 되어 계속 돕니다. (terminate 하지 않음)
bool test_dropped_handle_detaches()
{
    auto source = std::make_shared<FakeSignalSource>();
    std::atomic<bool> fired{false};

    {
        DispatchHandle handle = startDispatchThread(source, [&]() {
            fired.store(true, std::memory_order_release);
            return true;
        });
        if (!handle.joinable())
        {
            std::cerr << "[detach] fresh handle is not joinable\n";
            return false;
        }
    }

    source->fire(SignalKind::Interrupt);
    for (int i = 0; i < 200 && !fired.load(std::memory_order_acquire); ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (!fired.load())
    {
        std::cerr << "[detach] detached dispatch thread did not run the handler\n";
        return false;
    }
    return true;
}

bool test_rejects_null_arguments()
{
    try
    {
        (void)startDispatchThread(nullptr, [] { return true; });
        std::cerr << "[null] null source accepted\n";
        return false;
    }
    catch (const std::system_error &)
    {
    }

    try
    {
        (void)startDispatchThread(std::make_shared<FakeSignalSource>(), ctrlc::core::Handler{});
        std::cerr << "[null] empty handler accepted\n";
        return false;
    }
    catch (const std::system_error &)
    {
    }
    return true;
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_stops_after_true();
    ok = ok && test_handler_is_serialized();
    ok = ok && test_dropped_handle_detaches();
    ok = ok && test_rejects_null_arguments();

    if (!ok)
    {
        std::cerr << "Dispatcher tests FAILED\n";
        return 1;
    }

    std::cout << "Dispatcher tests PASSED\n";
    return 0;
}
