#pragma once

namespace ctrlc::util {

/// 복사와 대입을 금지하기 위한 베이스 클래스입니다.
///
/// - 상속받는 타입은 복사 생성자 / 복사 대입 연산자가 삭제(delete)됩니다.
/// - 이동(move)은 허용됩니다. (DispatchHandle, AsyncTaskHandle 처럼 소유권을 넘기는 핸들용)
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

/// 복사/이동 모두 금지합니다.
///
/// - 프로세스 전역 상태(InitGuard, ProcessContext)나 fd 를 소유하는 객체처럼
///   "주소가 곧 정체성"인 타입에 사용합니다.
class NonMovable {
  protected:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &) = delete;
    NonMovable &operator=(const NonMovable &) = delete;
    NonMovable(NonMovable &&) = delete;
    NonMovable &operator=(NonMovable &&) = delete;
};

} // namespace ctrlc::util
