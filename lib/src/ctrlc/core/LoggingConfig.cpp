#include <ctrlc/core/LoggingConfig.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace ctrlc::core
{
namespace
{

// 출력 스트림의 수명을 함께 쥐고 있는 Logger 래퍼. (파일 로그용)
class OwningOstreamLogger final : public ILogger
{
  public:
    OwningOstreamLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_; // os_ 보다 뒤에 선언: 먼저 파괴되어야 한다.
};

} // namespace

void applyLoggingConfig(const LoggingConfig &cfg)
{
    if (cfg.file.empty())
    {
        auto os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
        setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.level));
        return;
    }

    auto file = std::make_shared<std::ofstream>(cfg.file, std::ios::app);
    if (!file->is_open())
    {
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.file);
    }

    std::shared_ptr<std::ostream> os = file;
    setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.level));
}

} // namespace ctrlc::core
