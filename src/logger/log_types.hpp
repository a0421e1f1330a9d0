#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [의존성 방향]
// - common/types.hpp 만 include 한다 (SafetyTier, AuditErrorCode).
// - policy/, audit/ 헤더를 include 하지 않는다. 호출자가 Verdict/AuditError
//   의 필드를 복사해 채운다.
//
// [민감정보 취급 주의]
// - command 는 사용자가 실행하려던 명령어 원문이다. 비밀번호/토큰이 인자로
//   포함될 수 있으므로 진단 로그 파일 권한을 감사 로그와 같은 수준으로 둘 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // SafetyTier, AuditErrorCode

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error". 알 수 없는 값은 kInfo.
[[nodiscard]] inline LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// VerdictLog
//   명령어 한 건의 판정 이벤트.
//   tier == kBlocked 이면 warn, 그 외는 info 로 기록된다.
//   matched_rule / reason: Verdict 의 값 그대로 (kSafe 이면 비어 있음)
// ---------------------------------------------------------------------------
struct VerdictLog {
    std::string                                user{};
    std::optional<std::string>                 session_id{};
    std::string                                command{};      // 원문 명령어 (마스킹 주의)
    SafetyTier                                 tier{SafetyTier::kBlocked};
    std::optional<std::string>                 matched_rule{};
    std::optional<std::string>                 reason{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 정책 평가 소요 시간
};

// ---------------------------------------------------------------------------
// AuditFailureLog
//   감사 저장소 작업 실패 이벤트 (error 레벨).
//   operation: "append" | "query" | "statistics"
// ---------------------------------------------------------------------------
struct AuditFailureLog {
    std::string                                operation{};
    AuditErrorCode                             code{AuditErrorCode::kWriteFailed};
    std::string                                message{};
    std::string                                path{};
    std::chrono::system_clock::time_point      timestamp{};
};
