#pragma once

#include <ctrlc/util/NonCopyable.hpp>

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace ctrlc::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

[[nodiscard]] std::string_view logLevelName(LogLevel level) noexcept;

namespace detail
{
// 로그 필터링 최적화를 위한 전역 atomic (Logger.cpp 에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

/// 로깅 인터페이스입니다.
///
/// 주의: 어떤 구현체도 시그널 핸들러(trampoline) 안에서 호출되면 안 됩니다.
/// 로그는 항상 wait() 가 깨어난 뒤 일반 스레드 컨텍스트에서만 남깁니다.
class ILogger : private ctrlc::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // 메시지는 이미 "comp | evt | key=value..." 형태로 만들어서 넣는다.
    virtual void log(LogLevel level, std::string_view message) = 0;
};

// 기본 Logger 구현체 (ostream 기반, 비동기 writer 스레드)
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    // 잔여 로그를 모두 쓰고 writer 스레드를 join 합니다. 이후 로그는 호출 스레드에서 바로 씁니다.
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Global instance
// 전역 logger 는 프로세스 종료 시 소멸하지 않습니다. (detach 된 ctrl-c 스레드가 main 이후에도 로그를 남김)
ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
// 현재 logger 의 잔여 로그를 flush 합니다. 이후의 로그도 유실되지 않고 동기로 써집니다.
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | ctrl-c tid=123 | INFO  | comp | evt | k=v ..."
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define CTRLC_LOG_TRACE(comp, evt, ...)                                                            \
    ::ctrlc::core::slog::emit(::ctrlc::core::LogLevel::Trace, (comp), (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CTRLC_LOG_DEBUG(comp, evt, ...)                                                            \
    ::ctrlc::core::slog::emit(::ctrlc::core::LogLevel::Debug, (comp), (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CTRLC_LOG_INFO(comp, evt, ...)                                                             \
    ::ctrlc::core::slog::emit(::ctrlc::core::LogLevel::Info, (comp), (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CTRLC_LOG_WARN(comp, evt, ...)                                                             \
    ::ctrlc::core::slog::emit(::ctrlc::core::LogLevel::Warn, (comp), (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CTRLC_LOG_ERROR(comp, evt, ...)                                                            \
    ::ctrlc::core::slog::emit(::ctrlc::core::LogLevel::Error, (comp), (evt)__VA_OPT__(, ) __VA_ARGS__)
#define CTRLC_LOG_FATAL(comp, evt, ...)                                                            \
    ::ctrlc::core::slog::emit(::ctrlc::core::LogLevel::Fatal, (comp), (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace ctrlc::core
