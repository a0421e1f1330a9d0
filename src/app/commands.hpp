#pragma once

// ---------------------------------------------------------------------------
// commands.hpp
//
// cmdgate 서브커맨드 실행부. main() 은 명령행 파싱과 설정/로거 초기화만
// 하고 실제 동작은 여기로 위임한다.
//
// 모든 함수는 종료 코드(kExit*)를 반환하며 예외를 던지지 않는다.
// 결과는 out 으로, 오류 메시지는 err 로 출력한다 (테스트에서 캡처 가능).
// logger 는 nullptr 허용.
// ---------------------------------------------------------------------------

#include "app/command_line.hpp"
#include "policy/rule.hpp"

#include <ostream>

class StructuredLogger;

// check: 판정 출력 (첫 줄 = 등급 이름), --record 면 감사 기록.
[[nodiscard]] int run_check(const CheckOptions& options,
                            const AppConfig&    config,
                            StructuredLogger*   logger,
                            std::ostream&       out,
                            std::ostream&       err);

// record: 감사 레코드 한 건 추가
[[nodiscard]] int run_record(const RecordOptions& options,
                             const AppConfig&     config,
                             StructuredLogger*    logger,
                             std::ostream&        out,
                             std::ostream&        err);

// query: 일치 레코드를 JSON 줄로 출력
[[nodiscard]] int run_query(const AuditFilter& filter,
                            const AppConfig&   config,
                            StructuredLogger*  logger,
                            std::ostream&      out,
                            std::ostream&      err);

// stats: 통계 출력 ("key: value" 줄)
[[nodiscard]] int run_stats(const AppConfig&  config,
                            StructuredLogger* logger,
                            std::ostream&     out,
                            std::ostream&     err);

// serve: SIGINT/SIGTERM 까지 UDS 데몬 실행
[[nodiscard]] int run_serve(const ServeOptions& options,
                            const AppConfig&    config,
                            StructuredLogger*   logger);
