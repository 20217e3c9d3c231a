#include <ctrlc/core/Logger.hpp>
#include <ctrlc/core/ThreadContext.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

namespace ctrlc::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

std::string_view logLevelName(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

namespace
{

struct Record
{
    LogLevel level{};
    std::chrono::system_clock::time_point at;
    std::string thread; // "ctrl-c tid=123"
    std::string message;
};

// "HH:MM:SS.uuuuuu | ctrl-c tid=123 | INFO  | message"
std::string formatRecord(const Record &r)
{
    using namespace std::chrono;

    const std::time_t t = system_clock::to_time_t(r.at);
    std::tm tm{};
#if defined(_WIN32)
    ::localtime_s(&tm, &t);
#else
    ::localtime_r(&t, &tm);
#endif
    const auto us = duration_cast<microseconds>(r.at.time_since_epoch()) % seconds(1);

    return std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} | {:<5} | {}\n", tm.tm_hour, tm.tm_min,
                       tm.tm_sec, static_cast<int>(us.count()), r.thread, logLevelName(r.level),
                       r.message);
}

} // namespace

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : out_(os), writer_([this] { run(); }) {}

    ~Impl() { stop(); }

    void log(LogLevel level, std::string_view msg)
    {
        if (level < minLevel())
        {
            return;
        }

        Record rec{level, std::chrono::system_clock::now(), std::format("{} tid={}", ttag(), tid()),
                   std::string(msg)};
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!closed_ && level != LogLevel::Fatal)
            {
                pending_.push_back(std::move(rec));
                lock.unlock();
                cv_.notify_one();
                return;
            }
        }

        // FATAL 은 곧 abort 가 따라오고, stop 이후에는 writer 가 없으므로 바로 쓴다.
        write(std::span<const Record>(&rec, 1));
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable() && writer_.get_id() != std::this_thread::get_id())
        {
            writer_.join();
        }
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void run()
    {
        ThreadContext::setCurrentThreadTag("logger");

        std::vector<Record> batch;
        std::unique_lock<std::mutex> lock(mutex_);
        while (true)
        {
            cv_.wait(lock, [this] { return closed_ || !pending_.empty(); });
            batch.swap(pending_);
            const bool last = closed_;

            lock.unlock();
            write(batch);
            batch.clear();
            if (last)
            {
                return;
            }
            lock.lock();
        }
    }

    void write(std::span<const Record> records)
    {
        if (records.empty())
        {
            return;
        }
        std::lock_guard<std::mutex> lock(writeMutex_);
        for (const auto &r : records)
        {
            out_ << formatRecord(r);
        }
        out_.flush();
    }

    std::ostream &out_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Record> pending_;
    bool closed_{false};
    std::mutex writeMutex_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    std::thread writer_; // 위 멤버들이 모두 초기화된 뒤 시작해야 한다.
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->log(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== 전역 인스턴스 =====

namespace
{
// detach 된 ctrl-c 스레드는 main 이 끝난 뒤에도 로그를 남길 수 있으므로
// 저장소는 정적 소멸 대상이 아니도록 leak 한다.
std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static auto *storage = new std::shared_ptr<ILogger>(std::make_shared<Logger>());
    return *storage;
}
} // namespace

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel lvl = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(lvl), std::memory_order_relaxed);
    globalLoggerStorage() = std::move(logger);
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (instance)
    {
        instance->shutdown();
    }
}

} // namespace ctrlc::core
