#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace ctrlc
{

/// 등록 단계에서 발생하는 ctrlc 고유 오류 코드입니다.
///
/// OS 레벨 실패(sigaction, pipe, SetConsoleCtrlHandler ...)는 이 enum 이 아니라
/// std::generic_category()(errno) / std::system_category() 를 가진 std::system_error 로 던집니다.
enum class Errc : int
{
    /// 동기 핸들러가 이미 등록되어 있습니다. (setHandler/trySetHandler 두 번째 호출)
    AlreadyRegistered = 1,

    /// overwrite=false 로 설치했는데 같은 신호에 SIG_DFL 이 아닌 disposition 이 이미 있습니다.
    MultipleHandlers,

    /// trampoline 구독 테이블이 가득 찼습니다. (async 경로에서 태스크를 너무 많이 만든 경우)
    TooManySubscribers,
};

[[nodiscard]] const std::error_category &errorCategory() noexcept;

[[nodiscard]] inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), errorCategory()};
}

/// ctrlc 등록 충돌 예외입니다.
///
/// 호출자는 code() 로 종류를 구분합니다:
///   catch (const ctrlc::Error &e) { if (e.code() == ctrlc::Errc::AlreadyRegistered) ... }
class Error : public std::system_error
{
  public:
    explicit Error(Errc e) : std::system_error(make_error_code(e)) {}
    Error(Errc e, const std::string &what) : std::system_error(make_error_code(e), what) {}
};

} // namespace ctrlc

namespace std
{
template <>
struct is_error_code_enum<ctrlc::Errc> : true_type
{
};
} // namespace std
