#pragma once

#include <ctrlc/Error.hpp>
#include <ctrlc/core/Logger.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <utility>

namespace ctrlc::core
{

enum class RegistrationState : std::uint8_t
{
    Uninitialized = 0,
    Initializing,
    Initialized,
};

[[nodiscard]] std::string_view registrationStateName(RegistrationState s) noexcept;

/// "install + dispatch 스레드 spawn" 을 최대 한 번만 수행하도록 보장하는 가드입니다.
///
/// ===== 상태 전이 =====
///   Uninitialized -> Initializing -> Initialized
///                 <- (설치 실패 시 Uninitialized 로 복귀, 재시도 가능)
/// Initialized 에서 뒤로 돌아가는 전이는 없습니다. (unregister 없음)
///
/// ===== 동시성 =====
/// - fast path: acquire load 로 Initialized 를 보면 lock 없이 AlreadyRegistered.
/// - slow path: mutex 아래에서 다시 확인(double-checked) 후 closure 실행.
/// - 성공 publish 는 release store. 이후 acquire 로 Initialized 를 본 스레드는
///   설치 결과도 함께 관측한다.
///
/// 프로세스 전역 인스턴스는 ProcessContext 가 소유합니다. 테스트는 지역 인스턴스를 씁니다.
class InitGuard : private ctrlc::util::NonMovable
{
  public:
    InitGuard() = default;

    [[nodiscard]] RegistrationState state() const noexcept
    {
        return state_.load(std::memory_order_acquire);
    }

    /// installAndSpawn(overwrite) 를 최대 한 번 성공시킵니다.
    ///
    /// - 이미 Initialized 면 ctrlc::Error(Errc::AlreadyRegistered).
    /// - closure 가 던지면 상태를 Uninitialized 로 되돌리고 같은 예외를 다시 던집니다.
    template <typename Fn>
    auto registerOnce(bool overwrite, Fn &&installAndSpawn)
        -> decltype(std::forward<Fn>(installAndSpawn)(overwrite))
    {
        if (state_.load(std::memory_order_acquire) == RegistrationState::Initialized)
        {
            rejectAlreadyRegistered_("fast");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        if (!tryTransition(RegistrationState::Uninitialized, RegistrationState::Initializing))
        {
            rejectAlreadyRegistered_("locked");
        }

        try
        {
            auto handle = std::forward<Fn>(installAndSpawn)(overwrite);
            (void)tryTransition(RegistrationState::Initializing, RegistrationState::Initialized);
            CTRLC_LOG_INFO("InitGuard", "Registered", "overwrite={}", overwrite);
            return handle;
        }
        catch (...)
        {
            (void)tryTransition(RegistrationState::Initializing, RegistrationState::Uninitialized);
            CTRLC_LOG_WARN("InitGuard", "RegistrationFailed", "state=Uninitialized retry=allowed");
            throw;
        }
    }

    /// from -> to 전이를 원자적으로 시도합니다. 성공 시 true.
    ///
    /// 상태의 유일한 writer 입니다. 성공 시 release, 실패 시 acquire 순서를 가집니다.
    bool tryTransition(RegistrationState from, RegistrationState to) noexcept
    {
        return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel,
                                              std::memory_order_acquire);
    }

  private:
    [[noreturn]] void rejectAlreadyRegistered_(std::string_view path) const
    {
        CTRLC_LOG_DEBUG("InitGuard", "AlreadyRegistered", "path={} state={}", path,
                        registrationStateName(state()));
        throw Error(Errc::AlreadyRegistered);
    }

    std::atomic<RegistrationState> state_{RegistrationState::Uninitialized};
    std::mutex mutex_;
};

} // namespace ctrlc::core
