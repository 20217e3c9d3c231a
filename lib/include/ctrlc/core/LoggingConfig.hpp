#pragma once

#include <ctrlc/core/Logger.hpp>

#include <string>

namespace ctrlc::core
{

struct LoggingConfig
{
    LogLevel level{LogLevel::Info};
    std::string file{}; // 비어 있으면 stderr(std::clog)
};

/// LoggingConfig 의 level/file 을 프로세스 전역 Logger 에 반영합니다.
///
/// @throws std::runtime_error 로그 파일을 열 수 없을 때
void applyLoggingConfig(const LoggingConfig &cfg);

} // namespace ctrlc::core
