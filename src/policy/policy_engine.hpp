#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// 후보 셸 명령어를 받아 안전 등급(Verdict)을 판정하는 엔진.
//
// [판정 순서: 구현 레이어에서 반드시 준수]
// 1. compliance_mode && allow_list 비어있지 않음:
//    allow 패턴 중 하나와도 부분 일치하지 않으면 kBlocked ("not in allow-list")
// 2. deny_list: 부분 일치 시 무조건 kBlocked. 1단계 통과 여부와 무관하다.
//    (allow 에 걸린 명령어라도 deny 부분 문자열을 포함하면 차단)
// 3. 내장 휴리스틱 테이블 (danger_patterns.hpp) → kDangerous / kWarning
// 4. 나머지 → kSafe
//
// [매칭 규칙]
// - 대소문자 무관 부분 문자열 매칭. 토큰 경계를 보지 않으므로
//   "format" 패턴은 "clang-format" 도 차단한다 (보수적, 의도된 동작).
// - 빈 패턴은 무시한다 (no-op). 빈 명령어는 kSafe.
//
// [상태 없음]
// PolicyEngine 은 멤버 데이터를 갖지 않는다. PolicyConfig 는 호출자가 소유하고
// evaluate() 호출 동안만 빌린다. 따라서 동기화 없이 임의 개수의 스레드에서
// 동시에 호출해도 안전하다.
//
// [fail-close]
// evaluate() 는 예외를 던지지 않는다 (noexcept). 내부 오류(메모리 부족 등)
// 발생 시 가장 보수적인 kBlocked 를 반환한다.
// ---------------------------------------------------------------------------

#include <string_view>

#include "common/types.hpp"  // SafetyTier, Verdict
#include "rule.hpp"          // PolicyConfig

// 판정 규칙 식별자 (Verdict::matched_rule)
inline constexpr std::string_view kRuleComplianceAllowList = "compliance:allow-list";
inline constexpr std::string_view kRuleDenyPrefix          = "deny:";
inline constexpr std::string_view kRuleHeuristicPrefix     = "heuristic:";
inline constexpr std::string_view kRuleInternalError       = "internal-error";

inline constexpr std::string_view kReasonNotInAllowList = "not in allow-list";

// ---------------------------------------------------------------------------
// PolicyEngine
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    PolicyEngine()  = default;
    ~PolicyEngine() = default;

    PolicyEngine(const PolicyEngine&)            = default;
    PolicyEngine& operator=(const PolicyEngine&) = default;
    PolicyEngine(PolicyEngine&&)                 = default;
    PolicyEngine& operator=(PolicyEngine&&)      = default;

    // evaluate
    //   command 를 config 기준으로 판정한다.
    //   같은 (command, config) 에 대해 항상 같은 Verdict 를 반환한다.
    [[nodiscard]] Verdict evaluate(std::string_view    command,
                                   const PolicyConfig& config) const noexcept;
};
