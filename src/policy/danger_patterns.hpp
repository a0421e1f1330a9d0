#pragma once

// ---------------------------------------------------------------------------
// danger_patterns.hpp
//
// 내장 위험 명령어 휴리스틱 테이블.
// 설정으로 바꿀 수 없는 불변 테이블이며, 프로그램 시작 시 한 번 상수로
// 구성된다 (constexpr). 전역 가변 상태를 두지 않는다.
//
// [탐지 범주]
// - 재귀/강제 삭제      (rm -rf, Remove-Item -Recurse -Force, del /s /q)
// - 디스크 초기화 도구   (mkfs, fdisk, dd of=/dev/..., diskpart, wipefs)
// - 실행 정책 변조      (Set-ExecutionPolicy, -ExecutionPolicy Bypass)
// - 광범위 덮어쓰기     (> /dev/sdX, > /etc/..., fork bomb)
// - 권한 상승/권한 변경, 시스템 제어, 일반 삭제, 파일 덮어쓰기 리다이렉션
//
// [오탐/미탐 트레이드오프]
// - 부분 문자열 기반이므로 "rm report-2024.txt" 처럼 "-r" 을 포함한
//   파일명도 재귀 삭제로 분류될 수 있다 (보수적, false positive 허용).
// - 변수 확장, 별칭, 인코딩(base64 | sh) 등으로 우회 가능하다 (false negative).
//   휴리스틱은 경고 등급 산정용이며 차단 정책은 deny_list 가 담당한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>

// ---------------------------------------------------------------------------
// NeedleKind
//   kToken    : 명령어를 토큰으로 나눈 뒤 토큰(경로 제거, 구두점 제거)이
//               needle 과 정확히 일치해야 한다.
//   kSubstring: 소문자화한 명령어 전체에서 부분 문자열 일치.
// ---------------------------------------------------------------------------
enum class NeedleKind : std::uint8_t {
    kToken     = 0,
    kSubstring = 1,
};

inline constexpr std::size_t kMaxNeedles = 10;

using NeedleList = std::array<std::string_view, kMaxNeedles>;  // 빈 항목 = 끝

// ---------------------------------------------------------------------------
// DangerPattern
//   한 규칙은 다음이 모두 참일 때 발동한다.
//     1. triggers 중 하나가 trigger_kind 방식으로 일치
//     2. qualifiers 가 비어 있거나, 그중 하나가 부분 문자열로 일치
//     3. excludes 중 어느 것도 부분 문자열로 일치하지 않음
//   모든 needle 은 소문자로 작성한다.
// ---------------------------------------------------------------------------
struct DangerPattern {
    std::string_view id{};
    SafetyTier       tier{SafetyTier::kWarning};
    NeedleKind       trigger_kind{NeedleKind::kSubstring};
    NeedleList       triggers{};
    NeedleList       qualifiers{};
    NeedleList       excludes{};
    std::string_view reason{};
};

// ---------------------------------------------------------------------------
// DangerMatch
//   pattern: 발동한 규칙 (정적 테이블 항목을 가리키므로 수명 문제 없음)
//   needle : 실제로 일치한 trigger 문자열 (reason 에 인용)
// ---------------------------------------------------------------------------
struct DangerMatch {
    const DangerPattern* pattern{nullptr};
    std::string_view     needle{};
};

// danger_patterns
//   선언 순서 그대로의 내장 테이블 (읽기 전용).
[[nodiscard]] std::span<const DangerPattern> danger_patterns() noexcept;

// match_danger_patterns
//   lowered_command: 이미 소문자화된 명령어 문자열.
//   가장 높은 등급의 규칙을 반환하며, 같은 등급이면 선언 순서상 먼저인
//   규칙을 반환한다. 일치 없음 → std::nullopt.
[[nodiscard]] std::optional<DangerMatch> match_danger_patterns(std::string_view lowered_command);
