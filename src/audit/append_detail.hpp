#pragma once

// ---------------------------------------------------------------------------
// append_detail.hpp: 테스트 전용 내부 인터페이스
//
// audit_store.cpp 의 실패한 append 되돌리기 함수를 노출한다.
// audit_store.cpp 외의 프로덕션 코드는 audit_store.hpp 만 include 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>

#include <sys/types.h>

namespace detail {

// ---------------------------------------------------------------------------
// RollbackAction
//   실패한 append 뒤 파일에 대해 수행한 조치.
// ---------------------------------------------------------------------------
enum class RollbackAction : std::uint8_t {
    kNothingWritten,  // 쓴 바이트 없음, 조치 불필요
    kTruncated,       // 파일 길이 == before + written: 우리 조각만 잘라냄
    kTerminated,      // 다른 writer 가 끼어듦: 조각 뒤에 개행을 써서 손상 줄로 만듦
    kKeptComplete,    // 다른 writer 가 끼어들었고 우리 줄은 완전함: 그대로 둠
    kFailed,          // fstat / ftruncate / write 실패
};

// ---------------------------------------------------------------------------
// rollback_failed_append
//   fd        : O_APPEND 로 열린 감사 로그
//   before    : append 직전 파일 길이
//   written   : 이번 append 가 실제로 쓴 바이트 수
//   line_size : 개행 포함 레코드 줄 전체 길이
//
//   현재 길이가 before + written 과 같을 때만 잘라낸다. 그렇지 않으면
//   before 이후에 다른 writer 의 레코드가 있으므로 잘라내지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] RollbackAction rollback_failed_append(int         fd,
                                                    off_t       before,
                                                    std::size_t written,
                                                    std::size_t line_size) noexcept;

} // namespace detail
