#include <ctrlc/core/ProcessContext.hpp>

namespace ctrlc::core
{

ProcessContext &ProcessContext::instance() noexcept
{
    // detach 된 dispatch 스레드가 종료 시점까지 돌 수 있으므로 소멸시키지 않는다.
    static ProcessContext *ctx = new ProcessContext();
    return *ctx;
}

std::shared_ptr<platform::ISignalSource> ProcessContext::signalSource() const
{
    std::lock_guard<std::mutex> lock(sourceMutex_);
    return source_;
}

void ProcessContext::adoptSignalSource(std::shared_ptr<platform::ISignalSource> source)
{
    std::lock_guard<std::mutex> lock(sourceMutex_);
    source_ = std::move(source);
}

} // namespace ctrlc::core
