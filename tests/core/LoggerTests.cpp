#include <ctrlc/core/Logger.hpp>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

using ctrlc::core::Logger;
using ctrlc::core::LogLevel;

namespace
{

class CountingLogger final : public ctrlc::core::ILogger
{
  public:
    [[nodiscard]] LogLevel minLevel() const noexcept override { return LogLevel::Trace; }
    void log(LogLevel, std::string_view) override { ++lines; }

    std::atomic<int> lines{0};
};

/// 레벨 필터를 통과한 메시지만 "시간 | 스레드 | 레벨 | 본문" 형태로 써집니다.
bool test_lines_are_formatted_and_filtered()
{
    std::ostringstream out;
    {
        Logger logger(out);
        logger.setMinLevel(LogLevel::Info);
        logger.log(LogLevel::Debug, "Test | Hidden");
        logger.log(LogLevel::Info, "Test | Shown | k=1");
        logger.stopAndJoin();
    }

    const std::string text = out.str();
    if (text.find("| INFO  | Test | Shown | k=1\n") == std::string::npos ||
        text.find("main tid=") == std::string::npos || text.find("Hidden") != std::string::npos)
    {
        std::cerr << "[format] unexpected output: " << text;
        return false;
    }
    return true;
}

/// writer 스레드가 멈춘 뒤의 로그는 버려지지 않고 호출 스레드에서 바로 써집니다.
bool test_log_after_stop_is_written()
{
    std::ostringstream out;
    Logger logger(out);
    logger.stopAndJoin();

    logger.log(LogLevel::Warn, "Test | Late");
    if (out.str().find("| WARN  | Test | Late") == std::string::npos)
    {
        std::cerr << "[after-stop] late line missing\n";
        return false;
    }
    return true;
}

/// FATAL 은 큐를 거치지 않으므로 stop 전에도 즉시 보입니다.
bool test_fatal_is_synchronous()
{
    std::ostringstream out;
    Logger logger(out);
    logger.log(LogLevel::Fatal, "Test | Dying");

    const bool seen = out.str().find("| FATAL | Test | Dying") != std::string::npos;
    logger.stopAndJoin();
    if (!seen)
    {
        std::cerr << "[fatal] line not written synchronously\n";
        return false;
    }
    return true;
}

// main 이 끝나고 정적 객체가 소멸하는 중에도 전역 logger 를 쓸 수 있어야 한다.
// (detach 된 ctrl-c 스레드가 종료 직전에 로그를 남기는 경우)
void logDuringStaticTeardown()
{
    auto counter = std::make_shared<CountingLogger>();
    ctrlc::core::setLogger(counter);
    CTRLC_LOG_ERROR("Test", "AfterMain", "stage={}", "atexit");

    if (counter->lines.load() != 1)
    {
        std::cerr << "[teardown] global logger lost a line during exit\n";
        std::_Exit(1);
    }
}

} // namespace

int main()
{
    // 전역 logger 를 처음 만들기 전에 등록해야 이 handler 가 그보다 나중에 실행된다.
    std::atexit(&logDuringStaticTeardown);
    CTRLC_LOG_INFO("Test", "Start");

    bool ok = true;

    ok = ok && test_lines_are_formatted_and_filtered();
    ok = ok && test_log_after_stop_is_written();
    ok = ok && test_fatal_is_synchronous();

    ctrlc::core::shutdownLogger();

    if (!ok)
    {
        std::cerr << "Logger tests FAILED\n";
        return 1;
    }

    std::cout << "Logger tests PASSED\n";
    return 0;
}
