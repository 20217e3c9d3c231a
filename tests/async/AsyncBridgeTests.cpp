#include <ctrlc/SignalKind.hpp>
#include <ctrlc/async/AsyncBridge.hpp>
#include <ctrlc/event/EventLoop.hpp>
#include <ctrlc/platform/Trampoline.hpp>

#include <atomic>
#include <csignal>
#include <cstddef>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

using ctrlc::SignalKind;
using ctrlc::async::AsyncCompletion;
using ctrlc::async::AsyncTaskHandle;
using ctrlc::event::EventLoop;
namespace detail = ctrlc::async::detail;

namespace
{

constexpr int kPollMs = 20;

/// 첫 신호에서 handler 가 한 번 호출되고, 태스크가 끝난 뒤의 신호는 관측되지 않습니다.
bool test_fires_once_then_done()
{
    EventLoop loop(16, kPollMs);
    int calls = 0;

    AsyncTaskHandle task = detail::spawnInterruptTask(
        loop, {SignalKind::Interrupt, SignalKind::Terminate}, [&](AsyncCompletion done) {
            ++calls;
            done();
        });

    loop.runOnce(); // arm
    if (loop.registeredFdCount() != 2 || task.isFinished())
    {
        std::cerr << "[once] not armed: fds=" << loop.registeredFdCount() << "\n";
        return false;
    }

    std::raise(SIGTERM);
    loop.runOnce();

    if (calls != 1 || !task.isFinished() || task.firedBy() != SignalKind::Terminate)
    {
        std::cerr << "[once] calls=" << calls << " finished=" << task.isFinished() << "\n";
        return false;
    }
    task.join();

    // 태스크는 다시 arm 하지 않는다.
    std::raise(SIGINT);
    loop.runOnce();
    loop.runOnce();

    if (calls != 1 || loop.registeredFdCount() != 0 ||
        ctrlc::platform::Trampoline::subscriberCount(SIGINT) != 0)
    {
        std::cerr << "[once] late signal observed: calls=" << calls
                  << " fds=" << loop.registeredFdCount() << "\n";
        return false;
    }
    return true;
}

/// 두 소스가 같은 배치에서 동시에 준비돼도 handler 는 한 번만 호출됩니다. (승자는 어느 쪽이든 가능)
bool test_simultaneous_sources_fire_once()
{
    EventLoop loop(16, kPollMs);
    int calls = 0;

    AsyncTaskHandle task = detail::spawnInterruptTask(
        loop, {SignalKind::Interrupt, SignalKind::Terminate}, [&](AsyncCompletion done) {
            ++calls;
            done();
        });
    loop.runOnce();

    std::raise(SIGINT);
    std::raise(SIGTERM);
    loop.runOnce();
    loop.runOnce();

    const auto winner = task.firedBy();
    if (calls != 1 || !winner ||
        (*winner != SignalKind::Interrupt && *winner != SignalKind::Terminate))
    {
        std::cerr << "[race] calls=" << calls << " winner=" << (winner ? ctrlc::signalName(*winner) : "none")
                  << "\n";
        return false;
    }
    return true;
}

/// completion 을 나중에 호출할 때까지 태스크는 끝나지 않으며, 두 번째 호출은 무시됩니다.
bool test_deferred_completion()
{
    EventLoop loop(16, kPollMs);
    std::optional<AsyncCompletion> saved;

    AsyncTaskHandle task = detail::spawnInterruptTask(
        loop, {SignalKind::Interrupt}, [&](AsyncCompletion done) { saved.emplace(done); });
    loop.runOnce();

    std::raise(SIGINT);
    loop.runOnce();

    if (!saved || task.isFinished())
    {
        std::cerr << "[deferred] task finished before completion\n";
        return false;
    }

    std::thread completer([c = *saved] { c(); });
    completer.join();
    (*saved)();

    task.join();
    return task.isFinished();
}

/// handler 가 던진 예외는 태스크 실패로 기록되고 join() 에서 다시 던져집니다.
bool test_handler_exception_surfaces_on_join()
{
    EventLoop loop(16, kPollMs);

    AsyncTaskHandle task = detail::spawnInterruptTask(
        loop, {SignalKind::Interrupt},
        [](AsyncCompletion) { throw std::runtime_error("handler failed"); });
    loop.runOnce();

    std::raise(SIGINT);
    loop.runOnce();

    if (!task.isFinished())
    {
        std::cerr << "[exception] task not finished after handler threw\n";
        return false;
    }
    try
    {
        task.join();
    }
    catch (const std::runtime_error &)
    {
        return true;
    }
    std::cerr << "[exception] join did not rethrow\n";
    return false;
}

/// 신호 소스 설치가 실패하면 handler 없이 태스크가 끝납니다. 프로세스는 영향 없음.
bool test_install_failure_finishes_without_handler()
{
    EventLoop loop(16, kPollMs);
    bool called = false;

    // POSIX 에는 Break 가 없으므로 소스 생성이 실패한다.
    AsyncTaskHandle task = detail::spawnInterruptTask(
        loop, {SignalKind::Interrupt, SignalKind::Break}, [&](AsyncCompletion done) {
            called = true;
            done();
        });
    loop.runOnce();

    task.join();
    if (called || task.firedBy().has_value() || loop.registeredFdCount() != 0)
    {
        std::cerr << "[install] handler ran or fds leaked after install failure\n";
        return false;
    }
    return true;
}

/// async 경로에는 프로세스 단위 가드가 없습니다. 두 태스크가 각자 자기 handler 를 발화합니다.
bool test_independent_tasks()
{
    EventLoop loop(16, kPollMs);
    int a = 0;
    int b = 0;

    AsyncTaskHandle ta = detail::spawnInterruptTask(loop, {SignalKind::Interrupt},
                                                    [&](AsyncCompletion done) {
                                                        ++a;
                                                        done();
                                                    });
    AsyncTaskHandle tb = detail::spawnInterruptTask(loop, {SignalKind::Interrupt},
                                                    [&](AsyncCompletion done) {
                                                        ++b;
                                                        done();
                                                    });
    loop.runOnce();

    std::raise(SIGINT);
    loop.runOnce();

    if (a != 1 || b != 1 || !ta.isFinished() || !tb.isFinished())
    {
        std::cerr << "[independent] a=" << a << " b=" << b << "\n";
        return false;
    }
    return true;
}

/// 발화 전에 루프가 소멸하면 태스크는 구독을 풀고 broken_promise 로 끝납니다.
/// 구독 슬롯 수보다 많이 반복해도 테이블이 차지 않아야 합니다.
bool test_destroyed_loop_releases_task()
{
    const std::size_t baseline = ctrlc::platform::Trampoline::subscriberCount(SIGINT);
    const int rounds = static_cast<int>(ctrlc::platform::Trampoline::kMaxSubscribers) + 8;

    for (int i = 0; i < rounds; ++i)
    {
        AsyncTaskHandle task;
        {
            EventLoop loop(16, kPollMs);
            task = detail::spawnInterruptTask(loop, {SignalKind::Interrupt},
                                              [](AsyncCompletion done) { done(); });
            // 짝수: arm 된 상태로 소멸, 홀수: arm task 가 돌기 전에 소멸
            if (i % 2 == 0)
            {
                loop.runOnce();
            }
        }

        if (!task.isFinished() ||
            ctrlc::platform::Trampoline::subscriberCount(SIGINT) != baseline)
        {
            std::cerr << "[loop-gone] round=" << i << " finished=" << task.isFinished()
                      << " subscribers=" << ctrlc::platform::Trampoline::subscriberCount(SIGINT)
                      << "\n";
            return false;
        }

        try
        {
            task.join();
            std::cerr << "[loop-gone] join returned normally\n";
            return false;
        }
        catch (const std::future_error &e)
        {
            if (e.code() != std::make_error_code(std::future_errc::broken_promise))
            {
                std::cerr << "[loop-gone] unexpected error: " << e.what() << "\n";
                return false;
            }
        }
    }

    EventLoop loop(16, kPollMs);
    AsyncTaskHandle task = detail::spawnInterruptTask(loop, {SignalKind::Interrupt},
                                                      [](AsyncCompletion done) { done(); });
    loop.runOnce();
    if (loop.registeredFdCount() != 1 || task.isFinished())
    {
        std::cerr << "[loop-gone] fresh task did not arm: fds=" << loop.registeredFdCount() << "\n";
        return false;
    }
    return true;
}

bool test_empty_handler_rejected()
{
    EventLoop loop(16, kPollMs);
    try
    {
        (void)ctrlc::async::setAsyncHandler(loop, ctrlc::async::AsyncHandler{});
    }
    catch (const std::system_error &)
    {
        return true;
    }
    std::cerr << "[empty] empty async handler accepted\n";
    return false;
}

/// 루프를 다른 스레드에서 돌리고 handler 에서 루프를 멈추는 일반적인 사용 형태입니다.
bool test_set_async_handler_on_loop_thread()
{
    EventLoop loop;
    std::atomic<bool> armed{false};
    std::atomic<std::thread::id> handlerThread{};
    std::atomic<std::thread::id> loopThread{};

    AsyncTaskHandle task = ctrlc::async::setAsyncHandler(loop, [&](AsyncCompletion done) {
        handlerThread.store(std::this_thread::get_id());
        loop.stop();
        done();
    });
    // post 는 순서대로 실행되므로 이 task 가 돌았다면 arm 도 끝났다.
    loop.post([&] { armed.store(true, std::memory_order_release); });

    std::thread owner([&] {
        loopThread.store(std::this_thread::get_id());
        loop.run();
    });
    while (!armed.load(std::memory_order_acquire))
    {
        std::this_thread::yield();
    }

    std::raise(SIGINT);
    task.join();
    owner.join();

    if (handlerThread.load() != loopThread.load())
    {
        std::cerr << "[loop-thread] handler did not run on the loop thread\n";
        return false;
    }
    return task.firedBy() == SignalKind::Interrupt;
}

bool test_raced_signals()
{
    const auto kinds = ctrlc::async::racedSignals();
#if defined(CTRLC_ENABLE_TERMINATION)
    const std::vector<SignalKind> expected{SignalKind::Interrupt, SignalKind::Terminate,
                                           SignalKind::Hangup};
#else
    const std::vector<SignalKind> expected{SignalKind::Interrupt};
#endif
    if (kinds != expected)
    {
        std::cerr << "[raced] unexpected raced signal set, size=" << kinds.size() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_fires_once_then_done();
    ok = ok && test_simultaneous_sources_fire_once();
    ok = ok && test_deferred_completion();
    ok = ok && test_handler_exception_surfaces_on_join();
    ok = ok && test_install_failure_finishes_without_handler();
    ok = ok && test_independent_tasks();
    ok = ok && test_destroyed_loop_releases_task();
    ok = ok && test_empty_handler_rejected();
    ok = ok && test_set_async_handler_on_loop_thread();
    ok = ok && test_raced_signals();

    if (!ok)
    {
        std::cerr << "AsyncBridge tests FAILED\n";
        return 1;
    }

    std::cout << "AsyncBridge tests PASSED\n";
    return 0;
}
