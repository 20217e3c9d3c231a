#pragma once

#include <atomic>
#include <thread>

namespace ctrlc::util {

/// 매우 짧은 크리티컬 섹션용 스핀락입니다.
///
/// - EventLoop 의 TaskQueue 처럼 push/pop 한 번이 전부인 구간에서만 사용합니다.
/// - 시그널 컨텍스트(trampoline)에서는 절대 사용하지 않습니다. (데드락)
/// - kSpinsBeforeYield 만큼 돈 뒤에는 yield 로 양보합니다.
///   dispatch 스레드와 loop 스레드가 같은 코어에 몰릴 때 busy-wait 가 길어지는 것을 막습니다.
class SpinLock {
  public:
    static constexpr int kSpinsBeforeYield = 64;

    SpinLock() noexcept = default;

    SpinLock(const SpinLock &) = delete;
    SpinLock &operator=(const SpinLock &) = delete;

    void lock() noexcept {
        int spins = 0;
        while (flag_.test_and_set(std::memory_order_acquire)) {
            if (++spins >= kSpinsBeforeYield) {
                spins = 0;
                std::this_thread::yield();
            }
        }
    }

    bool try_lock() noexcept { return !flag_.test_and_set(std::memory_order_acquire); }

    void unlock() noexcept { flag_.clear(std::memory_order_release); }

  private:
    std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

/// RAII 스핀락 가드입니다.
class SpinLockGuard {
  public:
    explicit SpinLockGuard(SpinLock &lock) noexcept : lock_(lock) { lock_.lock(); }
    ~SpinLockGuard() { lock_.unlock(); }

    SpinLockGuard(const SpinLockGuard &) = delete;
    SpinLockGuard &operator=(const SpinLockGuard &) = delete;

  private:
    SpinLock &lock_;
};

} // namespace ctrlc::util
