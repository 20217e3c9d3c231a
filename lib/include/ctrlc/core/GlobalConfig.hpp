#pragma once

#include <ctrlc/core/Defaults.hpp>
#include <ctrlc/core/LoggingConfig.hpp>

#include <cstdint>

namespace ctrlc::core
{

enum class DemoMode
{
    Sync,  // setHandler + 플래그 폴링
    Async, // EventLoop + setAsyncHandler
};

// ctrlc_demo 전용 설정
struct DemoConfig
{
    DemoMode mode{DemoMode::Sync};

    // sync 모드: 이 횟수만큼 인터럽트를 받으면 핸들러가 true 를 돌려 디스패치를 끝낸다.
    std::uint32_t maxInterrupts{defaults::kDemoMaxInterrupts};

    // true 면 setHandler 대신 trySetHandler (기존 핸들러가 있으면 실패)
    bool strict{false};
};

// 전체 통합 설정
struct GlobalConfig
{
    LoggingConfig logging{};
    DemoConfig demo{};
};

} // namespace ctrlc::core
