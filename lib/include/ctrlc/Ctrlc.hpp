#pragma once

/// Cross-platform Ctrl-C handling.
///
/// setHandler() 는 전용 dispatch 스레드("ctrl-c")를 하나 띄우고, Ctrl-C 가 올 때마다
/// 그 스레드에서 핸들러를 호출합니다. 핸들러는 프로세스당 하나만 등록할 수 있습니다.
///
///   std::atomic_bool running{true};
///   auto handle = ctrlc::setHandler([&] {
///       running.store(false);
///       return true; // 더 이상 듣지 않음
///   });
///   while (running.load()) { ... }
///   handle.join();
///
/// CTRLC_ENABLE_TERMINATION 빌드에서는 Unix 의 SIGTERM, SIGHUP 에도 같은 핸들러가 호출됩니다.
/// CTRLC_ENABLE_ASYNC 빌드에서는 EventLoop 기반의 ctrlc::async::setAsyncHandler() 를 쓸 수 있습니다.

#include <ctrlc/Error.hpp>
#include <ctrlc/SignalKind.hpp>
#include <ctrlc/core/Dispatcher.hpp>
#include <ctrlc/core/InitGuard.hpp>
#include <ctrlc/platform/SignalSource.hpp>

#if defined(CTRLC_ENABLE_ASYNC)
#include <ctrlc/async/AsyncBridge.hpp>
#endif

#include <functional>
#include <memory>

namespace ctrlc
{

using core::DispatchHandle;
using core::Handler;

/// Ctrl-C 핸들러를 등록하고 dispatch 스레드를 시작합니다.
///
/// Unix 에서는 SIGINT(와 termination 빌드의 SIGTERM/SIGHUP) 에 이미 설치된 핸들러를 덮어씁니다.
/// Windows 에서는 console routine 이 스택으로 쌓이며 last-registered-first-called 로 호출됩니다.
///
/// Unix 의 disposition 은 fork(2) 로 상속되지만 execve(2) 로는 상속되지 않습니다.
///
/// @throws ctrlc::Error(Errc::AlreadyRegistered) 이미 등록된 경우
/// @throws std::system_error OS 호출 실패
DispatchHandle setHandler(Handler handler);

/// setHandler 와 같지만, 같은 신호에 SIG_DFL 이 아닌 핸들러가 이미 있으면 (Unix 한정)
/// ctrlc::Error(Errc::MultipleHandlers) 를 던집니다. 실패해도 나중에 다시 등록할 수 있습니다.
DispatchHandle trySetHandler(Handler handler);

namespace detail
{
using SignalSourceFactory = std::function<std::shared_ptr<platform::ISignalSource>()>;
using DispatchSpawner =
    std::function<DispatchHandle(std::shared_ptr<platform::ISignalSource>, Handler)>;

/// setHandler/trySetHandler 의 본체. guard, source 생성, 스레드 시작을 주입할 수 있게 분리했습니다.
///
/// spawn 이 비어 있으면 core::startDispatchThread 를 씁니다.
/// install 뒤 spawn 이 실패하면 source->uninstall() 로 설치를 되돌리고 예외를 다시 던집니다.
DispatchHandle initAndSetHandler(core::InitGuard &guard, const SignalSourceFactory &makeSource,
                                 Handler handler, bool overwrite,
                                 const DispatchSpawner &spawn = {});
} // namespace detail

} // namespace ctrlc
