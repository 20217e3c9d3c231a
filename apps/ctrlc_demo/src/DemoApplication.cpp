#include "DemoApplication.hpp"

#include <ctrlc/Ctrlc.hpp>
#include <ctrlc/core/Logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

namespace demo
{

DemoApplication::DemoApplication(const ctrlc::core::DemoConfig &cfg) : cfg_(cfg) {}

int DemoApplication::run()
{
    if (cfg_.mode == ctrlc::core::DemoMode::Async)
    {
        return runAsync();
    }
    return runSync();
}

int DemoApplication::runSync()
{
    std::atomic<bool> running{true};
    std::atomic<std::uint32_t> received{0};
    const std::uint32_t limit = cfg_.maxInterrupts;

    auto handler = [&running, &received, limit]() {
        const auto n = received.fetch_add(1, std::memory_order_acq_rel) + 1;
        std::cout << "Got Ctrl-C (" << n << "/" << limit << ")" << std::endl;
        if (n < limit)
        {
            return false;
        }
        running.store(false, std::memory_order_release);
        return true;
    };

    ctrlc::DispatchHandle handle =
        cfg_.strict ? ctrlc::trySetHandler(handler) : ctrlc::setHandler(handler);

    std::cout << "Waiting for Ctrl-C..." << std::endl;
    while (running.load(std::memory_order_acquire))
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    handle.join();
    std::cout << "Got it! Exiting..." << std::endl;
    return 0;
}

int DemoApplication::runAsync()
{
#if defined(CTRLC_ENABLE_ASYNC)
    ctrlc::event::EventLoop loop;

    auto task = ctrlc::async::setAsyncHandler(loop, [&loop](ctrlc::async::AsyncCompletion done) {
        std::cout << "Got Ctrl-C (async)" << std::endl;
        loop.stop();
        done();
    });

    std::cout << "Waiting for Ctrl-C (async)..." << std::endl;
    loop.run();

    task.join();
    std::cout << "Got it! Exiting..." << std::endl;
    return 0;
#else
    CTRLC_LOG_ERROR("Demo", "AsyncUnavailable", "msg='built without CTRLC_ENABLE_ASYNC'");
    return 1;
#endif
}

} // namespace demo
