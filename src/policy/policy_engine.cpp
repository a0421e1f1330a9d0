// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 셸 명령어 안전 등급 판정 엔진 구현.
//
// [Fail-close 원칙]
// 1. deny_list 일치 → kBlocked (allow_list 통과 여부와 무관)
// 2. compliance_mode 에서 allow_list 불일치 → kBlocked
// 3. 내부 예외 → kBlocked ("internal-error")
//
// [deny 와 compliance 가 동시에 차단하는 경우]
// deny 판정을 반환한다. 운영자가 조정해야 할 구체적인 패턴이 reason 에
// 드러나도록 하기 위함이다.
//
// [allow_list 통과의 의미]
// allow_list 는 게이트일 뿐 화이트리스트 면제가 아니다. 통과한 명령어도
// 휴리스틱 평가를 거친다 ("git push --force" 는 allow=["git"] 이어도 kWarning).
//
// [오탐/미탐 트레이드오프]
// - 부분 문자열 매칭이므로 deny "format" 은 "git log --format=%H" 도 차단한다.
//   토큰 경계 매칭으로 완화할 수 있으나 보안 동작 변경이므로 도입하지 않는다.
// - 대소문자 변환은 ASCII 만 수행한다. 비 ASCII 문자는 원문 그대로 비교한다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"
#include "policy/danger_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// 내부 헬퍼
// ---------------------------------------------------------------------------
namespace {

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// 빈(공백만 있는) 패턴은 건너뛴다. 일치한 원본 패턴 포인터를 반환.
const std::string* find_match(const std::vector<std::string>& patterns,
                              std::string_view                lowered_command) {
    for (const auto& pattern : patterns) {
        if (is_blank(pattern)) {
            continue;
        }
        if (lowered_command.find(to_lower_ascii(pattern)) != std::string_view::npos) {
            return &pattern;
        }
    }
    return nullptr;
}

bool has_effective_pattern(const std::vector<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [](const std::string& p) { return !is_blank(p); });
}

// 로그에 남길 명령어 앞부분 (긴 명령어/heredoc 대비)
std::string_view log_prefix(std::string_view command) {
    return command.substr(0, std::min(command.size(), std::size_t{80}));
}

Verdict evaluate_impl(std::string_view command, const PolicyConfig& config) {
    if (is_blank(command)) {
        return Verdict{SafetyTier::kSafe, std::nullopt, std::nullopt};
    }

    const std::string lowered = to_lower_ascii(command);

    // Step 1: compliance allow-list 게이트
    // allow_list 에 유효 패턴이 없으면 게이트 자체가 no-op 이다.
    bool compliance_block = false;
    if (config.compliance_mode && has_effective_pattern(config.allow_list)) {
        compliance_block = (find_match(config.allow_list, lowered) == nullptr);
    }

    // Step 2: deny_list 는 항상 평가, allow 통과 여부보다 우선
    if (const auto* denied = find_match(config.deny_list, lowered)) {
        spdlog::info("policy_engine: deny pattern matched '{}', command='{}'",
                     *denied, log_prefix(command));
        return Verdict{
            SafetyTier::kBlocked,
            fmt::format("matches blocked pattern '{}'", *denied),
            fmt::format("{}{}", kRuleDenyPrefix, *denied),
        };
    }

    if (compliance_block) {
        spdlog::info("policy_engine: compliance mode, command not in allow-list, command='{}'",
                     log_prefix(command));
        return Verdict{
            SafetyTier::kBlocked,
            std::string{kReasonNotInAllowList},
            std::string{kRuleComplianceAllowList},
        };
    }

    // Step 3: 내장 휴리스틱
    if (const auto match = match_danger_patterns(lowered)) {
        const auto& pattern = *match->pattern;
        spdlog::debug("policy_engine: heuristic '{}' ({}) matched, command='{}'",
                      pattern.id, tier_name(pattern.tier), log_prefix(command));
        return Verdict{
            pattern.tier,
            fmt::format("{} (matched '{}')", pattern.reason, match->needle),
            fmt::format("{}{}", kRuleHeuristicPrefix, pattern.id),
        };
    }

    // Step 4: 일치 없음
    return Verdict{SafetyTier::kSafe, std::nullopt, std::nullopt};
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyEngine::evaluate
//
// noexcept 계약: 내부 예외는 여기서 모두 kBlocked 로 변환한다.
// ---------------------------------------------------------------------------
Verdict PolicyEngine::evaluate(std::string_view    command,
                               const PolicyConfig& config) const noexcept {
    try {
        return evaluate_impl(command, config);
    } catch (const std::exception& e) {
        try {
            spdlog::error("policy_engine: internal error, blocking (fail-close): {}", e.what());
        } catch (const std::exception&) {
            // 로깅 실패는 판정에 영향을 주지 않는다
        }
    }
    // 최후 안전망: 예외 후에는 문자열 할당도 실패할 수 있으므로 reason 은
    // 할당 실패 시 비운다.
    Verdict blocked{};
    try {
        blocked.reason       = "internal policy error";
        blocked.matched_rule = std::string{kRuleInternalError};
    } catch (const std::exception&) {
        blocked.reason.reset();
        blocked.matched_rule.reset();
    }
    return blocked;
}
