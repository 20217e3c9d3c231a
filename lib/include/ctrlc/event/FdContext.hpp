#pragma once

#include <cstdint> // uint64_t, uintptr_t

namespace ctrlc::event {

class IFdHandler;

/// epoll 에 등록된 fd 의 라우팅/디버깅 컨텍스트입니다.
///
/// - EventLoop(owner thread)에서만 생성/수정/삭제합니다.
/// - handler 포인터는 non-owning 이며 fd 가 등록되어 있는 동안 유효해야 합니다.
/// - 디스패치 시점에 fd 로 다시 조회하므로, 같은 배치 안에서 먼저 처리된 이벤트가
///   다른 fd 를 removeFd 했다면 그 fd 의 지연 이벤트는 무시됩니다.
///   (AsyncBridge 가 race 에서 진 stream 들을 한꺼번에 내리는 경우)
struct FdContext {
    int fd{-1};
    IFdHandler *handler{nullptr};
    const char *tag{"unknown"};
    std::uint64_t debugId{0};
    std::uint32_t registeredEvents{0};
};

} // namespace ctrlc::event
