#pragma once

#include <cstdint>

#include <ctrlc/event/EpollReactor.hpp>

namespace ctrlc::event {

class EventLoop;

/// EventLoop 에 등록되는 fd 의 이벤트 핸들러 인터페이스입니다.
///
/// - handleEvent() 는 EventLoop owner thread 에서만 호출됩니다.
/// - 객체 수명은 fd 가 EventLoop 에 등록되어 있는 동안 유효해야 합니다.
/// - fdTag(): "eventfd", "signal-stream" 같은 owner type 태그
/// - fdDebugId(): 추적용 숫자 (예: 신호 번호, 태스크 id). 없으면 0.
class IFdHandler {
  public:
    virtual ~IFdHandler() = default;

    [[nodiscard]] virtual const char *fdTag() const noexcept = 0;

    [[nodiscard]] virtual std::uint64_t fdDebugId() const noexcept = 0;

    virtual void handleEvent(EventLoop &loop, const EpollReactor::ReadyEvent &ev) = 0;
};

} // namespace ctrlc::event
