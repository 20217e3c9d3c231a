#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall
#elif defined(_WIN32)
#include <windows.h> // GetCurrentThreadId
#endif

namespace ctrlc::core
{

/// 로그 prefix 에 찍히는 스레드 태그/tid 를 thread_local 로 보관합니다.
///
/// - 태그가 설정되지 않은 스레드는 "main" 으로 찍힙니다.
/// - dispatch 스레드는 "ctrl-c", EventLoop owner 스레드는 "loop" 를 사용합니다.
class ThreadContext
{
  public:
    static constexpr std::size_t kMaxTagLen = 15;

    // 스레드 시작점에서 1회 호출
    static void setCurrentThreadTag(std::string_view tag) noexcept
    {
        auto &buf = tagBuf_();
        const std::size_t n = tag.size() < kMaxTagLen ? tag.size() : kMaxTagLen;
        for (std::size_t i = 0; i < n; ++i)
        {
            buf[i] = tag[i];
        }
        buf[n] = '\0';
        (void)currentTid();
    }

    // syscall 매번 호출하지 않도록 thread_local 캐시
    [[nodiscard]] static long currentTid() noexcept { return cachedTid_(); }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        auto &buf = tagBuf_();
        if (buf[0] == '\0')
        {
            std::snprintf(buf.data(), buf.size(), "main");
        }
        return std::string_view{buf.data()};
    }

  private:
    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#elif defined(_WIN32)
        return static_cast<long>(::GetCurrentThreadId());
#else
        return 0;
#endif
    }

    static long &cachedTid_() noexcept
    {
        thread_local long tid = computeTid_();
        return tid;
    }

    static std::array<char, kMaxTagLen + 1> &tagBuf_() noexcept
    {
        thread_local std::array<char, kMaxTagLen + 1> buf{};
        return buf;
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}
[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentThreadTag();
}

} // namespace ctrlc::core
