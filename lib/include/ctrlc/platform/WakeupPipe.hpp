#pragma once

#include <ctrlc/util/NonCopyable.hpp>

#include <cstddef>
#include <optional>

namespace ctrlc::platform
{

/// trampoline 이 깨우는 self-pipe 입니다. (POSIX 전용)
///
/// - 양 끝 모두 close-on-exec.
/// - write end 는 항상 non-blocking: 시그널 컨텍스트에서 절대 블록하지 않는다.
/// - read end 는 용도에 따라 선택.
///     blocking     : dispatch 스레드가 readByte() 로 잠든다. (PosixSignalSource)
///     non-blocking : epoll edge/level 이벤트 후 drain() 으로 비운다. (SignalStream)
class WakeupPipe : private ctrlc::util::NonMovable
{
  public:
    enum class ReadMode
    {
        Blocking,
        NonBlocking,
    };

    /// 실패 시 std::system_error 를 던집니다.
    explicit WakeupPipe(ReadMode mode);
    ~WakeupPipe() noexcept;

    [[nodiscard]] int readFd() const noexcept { return readFd_; }
    [[nodiscard]] int writeFd() const noexcept { return writeFd_; }

    /// 1바이트를 읽을 때까지 블록합니다. EINTR 은 재시도합니다.
    ///
    /// - 읽은 바이트(신호 번호)를 반환합니다.
    /// - EOF/read 실패는 std::system_error.
    unsigned char readByte();

    /// non-blocking read end 를 EAGAIN 까지 비웁니다.
    ///
    /// @return 마지막으로 읽은 바이트. 아무것도 없었으면 nullopt.
    std::optional<unsigned char> drain() noexcept;

  private:
    int readFd_{-1};
    int writeFd_{-1};
};

} // namespace ctrlc::platform
