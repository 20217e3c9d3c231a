#pragma once

#include <ctrlc/core/InitGuard.hpp>
#include <ctrlc/platform/SignalSource.hpp>
#include <ctrlc/util/NonCopyable.hpp>

#include <memory>
#include <mutex>

namespace ctrlc::core
{

/// 프로세스 수명 동안 살아 있는 ctrlc 전역 상태의 단일 소유자입니다.
///
/// - 동기 경로의 InitGuard (RegistrationState)
/// - 설치된 플랫폼 ISignalSource (Initialized 이후에만 존재)
class ProcessContext : private ctrlc::util::NonMovable
{
  public:
    static ProcessContext &instance() noexcept;

    [[nodiscard]] InitGuard &initGuard() noexcept { return initGuard_; }

    [[nodiscard]] std::shared_ptr<platform::ISignalSource> signalSource() const;

    /// 설치와 dispatch 스레드 시작이 모두 성공한 source 를 보관합니다.
    void adoptSignalSource(std::shared_ptr<platform::ISignalSource> source);

  private:
    ProcessContext() = default;

    InitGuard initGuard_;

    mutable std::mutex sourceMutex_;
    std::shared_ptr<platform::ISignalSource> source_;
};

} // namespace ctrlc::core
