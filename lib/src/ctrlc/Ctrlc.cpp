#include <ctrlc/Ctrlc.hpp>

#include <ctrlc/core/Logger.hpp>
#include <ctrlc/core/ProcessContext.hpp>

#include <exception>
#include <system_error>

namespace ctrlc
{

namespace detail
{

DispatchHandle initAndSetHandler(core::InitGuard &guard, const SignalSourceFactory &makeSource,
                                 Handler handler, bool overwrite, const DispatchSpawner &spawn)
{
    if (!handler)
    {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "ctrlc: empty handler");
    }

    return guard.registerOnce(overwrite, [&](bool ow) {
        std::shared_ptr<platform::ISignalSource> source = makeSource();
        source->install(ow);
        try
        {
            return spawn ? spawn(source, std::move(handler))
                         : core::startDispatchThread(source, std::move(handler));
        }
        catch (const std::exception &e)
        {
            // 등록이 실패로 끝나면 disposition 도 등록 전 상태여야 재시도가 의미 있다.
            CTRLC_LOG_ERROR("Ctrlc", "SpawnFailed", "what='{}' action=Uninstall", e.what());
            source->uninstall();
            throw;
        }
    });
}

} // namespace detail

namespace
{

DispatchHandle registerProcessHandler(Handler handler, bool overwrite)
{
    auto &ctx = core::ProcessContext::instance();

    std::shared_ptr<platform::ISignalSource> created;
    DispatchHandle handle = detail::initAndSetHandler(
        ctx.initGuard(),
        [&created]() {
            created = platform::makePlatformSignalSource(platform::watchedSignals());
            return created;
        },
        std::move(handler), overwrite);

    // 설치와 spawn 이 모두 성공한 source 만 보관한다.
    ctx.adoptSignalSource(std::move(created));
    return handle;
}

} // namespace

DispatchHandle setHandler(Handler handler)
{
    return registerProcessHandler(std::move(handler), true);
}

DispatchHandle trySetHandler(Handler handler)
{
    return registerProcessHandler(std::move(handler), false);
}

} // namespace ctrlc
