#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// 정책 엔진과 감사 저장소가 공유하는 기본 타입.
//
// [단일 정의 원칙]
// SafetyTier 는 이 파일에서만 정의한다. policy/ 와 audit/ 가 각자 등급
// 열거형을 두면 분류 결과와 기록 결과가 어긋날 수 있으므로, 두 레이어는
// 반드시 이 헤더를 include 한다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SafetyTier
//   명령어 위험 등급. 값이 클수록 심각하다 (kBlocked > kDangerous > kWarning > kSafe).
//   정수 값은 비교와 배열 인덱스로 사용되므로 순서를 바꾸지 말 것.
// ---------------------------------------------------------------------------
enum class SafetyTier : std::uint8_t {
    kSafe      = 0,
    kWarning   = 1,
    kDangerous = 2,
    kBlocked   = 3,
};

inline constexpr std::size_t kSafetyTierCount = 4;

inline constexpr std::array<SafetyTier, kSafetyTierCount> kAllSafetyTiers = {
    SafetyTier::kSafe, SafetyTier::kWarning, SafetyTier::kDangerous, SafetyTier::kBlocked,
};

// 감사 로그 safety_level 필드 값과 동일한 소문자 이름.
[[nodiscard]] constexpr std::string_view tier_name(SafetyTier tier) noexcept {
    switch (tier) {
        case SafetyTier::kSafe:      return "safe";
        case SafetyTier::kWarning:   return "warning";
        case SafetyTier::kDangerous: return "dangerous";
        case SafetyTier::kBlocked:   return "blocked";
    }
    return "blocked";
}

// 대소문자를 구분하지 않는다. 알 수 없는 이름은 std::nullopt.
[[nodiscard]] inline std::optional<SafetyTier> parse_tier(std::string_view name) noexcept {
    for (const auto tier : kAllSafetyTiers) {
        const auto expected = tier_name(tier);
        if (expected.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            const char c = (name[i] >= 'A' && name[i] <= 'Z')
                ? static_cast<char>(name[i] - 'A' + 'a')
                : name[i];
            if (c != expected[i]) {
                same = false;
                break;
            }
        }
        if (same) {
            return tier;
        }
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::size_t tier_index(SafetyTier tier) noexcept {
    return static_cast<std::size_t>(tier);
}

// 두 등급 중 더 심각한 쪽.
[[nodiscard]] constexpr SafetyTier max_tier(SafetyTier a, SafetyTier b) noexcept {
    return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

// ---------------------------------------------------------------------------
// Verdict
//   PolicyEngine::evaluate 한 번의 판정 결과 (불변 값 객체).
//   reason      : 사람이 읽을 수 있는 판정 이유. kSafe 이면 비어 있다.
//   matched_rule: 판정을 결정한 규칙 식별자 ("deny:<pattern>",
//                 "compliance:allow-list", "heuristic:<id>").
//                 kBlocked 이면 항상 채워진다 (정책 감사/조정용).
// ---------------------------------------------------------------------------
struct Verdict {
    SafetyTier                 tier{SafetyTier::kBlocked};  // 기본값 kBlocked (fail-close)
    std::optional<std::string> reason{};
    std::optional<std::string> matched_rule{};

    bool operator==(const Verdict&) const = default;
};

// ---------------------------------------------------------------------------
// AuditErrorCode
//   감사 저장소 작업 전체를 실패시키는 I/O 오류 분류.
// ---------------------------------------------------------------------------
enum class AuditErrorCode : std::uint8_t {
    kNotFound         = 0,  // 저장소 경로가 존재하지 않음 (query/statistics)
    kPermissionDenied = 1,  // 열기/쓰기 권한 없음
    kNoSpace          = 2,  // 디스크 공간 부족 (ENOSPC, EDQUOT)
    kCreateFailed     = 3,  // 상위 디렉터리 또는 파일 생성 불가
    kWriteFailed      = 4,  // 그 외 write/fsync 실패
    kReadFailed       = 5,  // 그 외 open/read 실패
};

[[nodiscard]] constexpr std::string_view audit_error_name(AuditErrorCode code) noexcept {
    switch (code) {
        case AuditErrorCode::kNotFound:         return "not_found";
        case AuditErrorCode::kPermissionDenied: return "permission_denied";
        case AuditErrorCode::kNoSpace:          return "no_space";
        case AuditErrorCode::kCreateFailed:     return "create_failed";
        case AuditErrorCode::kWriteFailed:      return "write_failed";
        case AuditErrorCode::kReadFailed:       return "read_failed";
    }
    return "read_failed";
}

// ---------------------------------------------------------------------------
// AuditError
//   std::expected<T, AuditError> 패턴과 함께 사용한다.
//   message 에는 errno 기반 원인 설명이 들어간다 (예: "Permission denied").
// ---------------------------------------------------------------------------
struct AuditError {
    AuditErrorCode        code{AuditErrorCode::kReadFailed};
    std::string           message{};
    std::filesystem::path path{};
};

// ---------------------------------------------------------------------------
// ParseError
//   감사 로그 한 줄의 역직렬화 실패. 읽기 경로에서 해당 줄만 건너뛰고
//   카운트하며, 스캔 전체를 중단하지 않는다.
// ---------------------------------------------------------------------------
struct ParseError {
    std::string message{};
    std::string context{};  // 문제 필드 또는 줄 앞부분 (로깅용)
};
