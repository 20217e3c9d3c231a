#include <ctrlc/core/Dispatcher.hpp>

#include <ctrlc/core/Logger.hpp>
#include <ctrlc/core/ThreadContext.hpp>

#include <cstdint>
#include <cstdlib>
#include <system_error>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace ctrlc::core
{

namespace
{

constexpr const char *kThreadName = "ctrl-c";

void nameCurrentThread() noexcept
{
    ThreadContext::setCurrentThreadTag(kThreadName);
#if defined(__linux__)
    (void)::pthread_setname_np(::pthread_self(), kThreadName);
#endif
}

void runDispatchLoop(const std::shared_ptr<platform::ISignalSource> &source, Handler &handler)
{
    nameCurrentThread();
    CTRLC_LOG_INFO("Dispatcher", "Started");

    std::uint64_t calls = 0;
    for (;;)
    {
        SignalKind kind{};
        try
        {
            kind = source->wait();
        }
        catch (const std::system_error &e)
        {
            // wait primitive 가 깨진 dispatcher 는 안전하게 재개할 방법이 없다.
            CTRLC_LOG_FATAL("Dispatcher", "WaitFailed", "code={} what='{}'", e.code().value(),
                            e.what());
            std::abort();
        }

        ++calls;
        CTRLC_LOG_DEBUG("Dispatcher", "Wakeup", "signal={} call={}", signalName(kind), calls);

        if (handler())
        {
            break;
        }
    }

    CTRLC_LOG_INFO("Dispatcher", "Stopped", "calls={}", calls);
}

} // namespace

DispatchHandle::~DispatchHandle()
{
    if (thread_.joinable())
    {
        thread_.detach();
    }
}

DispatchHandle &DispatchHandle::operator=(DispatchHandle &&other) noexcept
{
    if (this != &other)
    {
        if (thread_.joinable())
        {
            thread_.detach();
        }
        thread_ = std::move(other.thread_);
    }
    return *this;
}

void DispatchHandle::join()
{
    thread_.join();
}

void DispatchHandle::detach()
{
    thread_.detach();
}

DispatchHandle startDispatchThread(std::shared_ptr<platform::ISignalSource> source, Handler handler)
{
    if (!source || !handler)
    {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "startDispatchThread: null source or handler");
    }

    std::thread thread([source = std::move(source), handler = std::move(handler)]() mutable {
        runDispatchLoop(source, handler);
    });

    return DispatchHandle(std::move(thread));
}

} // namespace ctrlc::core
