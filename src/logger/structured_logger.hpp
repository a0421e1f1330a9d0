#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 콘솔 출력은 stderr 로 보낸다. stdout 은 CLI 결과(판정, 쿼리 결과 JSON)
//   전용이다.
//
// [JSON 스키마 일관성]
// 감사 로그와 같은 키 이름(user, session_id, safety_level)을 사용한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   VerdictLog / AuditFailureLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   console   : true 이면 stderr 싱크를 함께 붙인다.
    // 예외: 로그 파일을 열 수 없으면 std::runtime_error
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path,
                              bool console = true);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_verdict
    //   판정 이벤트를 JSON 으로 기록한다. kBlocked 는 warn 레벨.
    void log_verdict(const VerdictLog& entry);

    // log_audit_failure
    //   감사 저장소 실패를 error 레벨로 기록한다.
    void log_audit_failure(const AuditFailureLog& entry);

    // 내부 진단용 spdlog 래퍼
    //   명령어 원문 등 사용자 데이터를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] std::shared_ptr<spdlog::logger> spdlog_logger() const noexcept { return logger_; }

private:
    [[nodiscard]] int to_spdlog_level(LogLevel level) const;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
