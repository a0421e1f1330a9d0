#pragma once

// ---------------------------------------------------------------------------
// audit_record.hpp
//
// 감사 저장소 값 타입 정의: AuditRecord, AuditFilter, AuditStatistics.
//
// [불변성]
// AuditRecord 는 생성 후 변경하지 않는다. 저장소는 기존 레코드를 수정/삭제하지
// 않으며, 읽기 경로는 매번 파일에서 새로 역직렬화한 사본을 돌려준다.
//
// [민감정보 취급 주의]
// natural_language_input / generated_command 는 사용자 입력 원문이다.
// 진단 로그(spdlog)에는 앞부분만 남기고 전체는 감사 로그에만 기록한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // SafetyTier, kSafetyTierCount

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// AuditRecord
//   명령어 한 건의 분류/실행 결과.
//
//   exit_code : executed == false 이거나 종료 코드를 알 수 없으면 비어 있다.
//   backend_id: 명령어를 생성한 백엔드 식별자 (예: "ollama", "plugin:git")
//   session_id: 같은 셸 세션의 레코드를 묶는 식별자
// ---------------------------------------------------------------------------
struct AuditRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::string                           user{};
    std::optional<std::string>            organization{};
    std::optional<std::string>            department{};
    std::string                           natural_language_input{};
    std::string                           generated_command{};
    bool                                  executed{false};
    std::optional<int>                    exit_code{};
    SafetyTier                            tier{SafetyTier::kSafe};
    std::string                           backend_id{};
    std::optional<std::string>            notes{};
    std::optional<std::string>            session_id{};

    bool operator==(const AuditRecord&) const = default;

    // 실행되었으나 성공 종료 코드(0)를 확인할 수 없는 레코드
    [[nodiscard]] bool failed_execution() const noexcept {
        return executed && (!exit_code.has_value() || *exit_code != 0);
    }
};

// ---------------------------------------------------------------------------
// AuditFilter
//   모든 조건은 AND. 비어 있는 조건은 적용하지 않는다.
//   user / tier / session_id : 정확 일치
//   since / until           : since <= timestamp < until
//   limit                   : 일치 레코드를 최대 limit 개까지만 반환
// ---------------------------------------------------------------------------
struct AuditFilter {
    std::optional<std::string>                           user{};
    std::optional<SafetyTier>                            tier{};
    std::optional<std::chrono::system_clock::time_point> since{};
    std::optional<std::chrono::system_clock::time_point> until{};
    std::optional<std::string>                           session_id{};
    std::optional<std::uint64_t>                         limit{};

    [[nodiscard]] bool matches(const AuditRecord& record) const noexcept {
        if (user && record.user != *user) {
            return false;
        }
        if (tier && record.tier != *tier) {
            return false;
        }
        if (since && record.timestamp < *since) {
            return false;
        }
        if (until && !(record.timestamp < *until)) {
            return false;
        }
        if (session_id && record.session_id != session_id) {
            return false;
        }
        return true;
    }
};

// ---------------------------------------------------------------------------
// AuditStatistics
//   전체 스캔 집계 결과.
//   total             : 정상 파싱된 레코드 수
//   executed          : executed == true
//   failed_executions : executed == true 이고 exit_code 가 없거나 0 이 아님
//   per_tier          : tier_index(SafetyTier) 로 인덱싱
//   skipped_lines     : 파싱 실패/미완성 줄 수 (total 에 포함되지 않음)
// ---------------------------------------------------------------------------
struct AuditStatistics {
    std::uint64_t                                total{0};
    std::uint64_t                                executed{0};
    std::uint64_t                                failed_executions{0};
    std::array<std::uint64_t, kSafetyTierCount>  per_tier{};
    std::uint64_t                                skipped_lines{0};

    [[nodiscard]] std::uint64_t count(SafetyTier tier) const noexcept {
        return per_tier[tier_index(tier)];
    }

    // kDangerous + kBlocked
    [[nodiscard]] std::uint64_t dangerous_or_blocked() const noexcept {
        return count(SafetyTier::kDangerous) + count(SafetyTier::kBlocked);
    }

    bool operator==(const AuditStatistics&) const = default;
};
