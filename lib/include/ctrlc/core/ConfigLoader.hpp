#pragma once

#include <ctrlc/core/GlobalConfig.hpp>

#include <string>

namespace ctrlc::core
{

class ConfigLoader
{
  public:
    /// `--config <path.toml>` 가 있으면 그 파일을, 없으면 기본값을 돌려줍니다.
    /// `--help` 는 사용법을 출력하고 종료합니다.
    static GlobalConfig load(int argc, char **argv);

    /// @throws std::runtime_error 파일 없음/파싱 실패, std::invalid_argument 값 검증 실패
    static GlobalConfig loadFile(const std::string &path);
};

} // namespace ctrlc::core
