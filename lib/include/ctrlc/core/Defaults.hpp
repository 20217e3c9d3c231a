#pragma once

namespace ctrlc::core::defaults
{

// ===== EventLoop / epoll =====
inline constexpr int kMaxEpollEvents = 16;
inline constexpr int kPollTimeoutMs = -1; // 무한 대기. ctrlc 에는 타이머가 없다.

// ===== Demo app =====
inline constexpr int kDemoMaxInterrupts = 1;

} // namespace ctrlc::core::defaults
