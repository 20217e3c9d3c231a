#pragma once

#include <ctrlc/core/GlobalConfig.hpp>

namespace demo
{

/// ctrlc 사용 예제. 설정의 mode 에 따라 sync/async 경로 중 하나를 보여줍니다.
class DemoApplication final
{
  public:
    explicit DemoApplication(const ctrlc::core::DemoConfig &cfg);

    /// 종료 코드를 돌려줍니다.
    int run();

  private:
    int runSync();
    int runAsync();

    ctrlc::core::DemoConfig cfg_{};
};

} // namespace demo
