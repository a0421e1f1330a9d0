#pragma once

// ---------------------------------------------------------------------------
// record_codec.hpp
//
// AuditRecord ⇄ 감사 로그 한 줄(JSON 객체) 변환.
//
// [줄 형식]
// {"timestamp":"2026-10-18T09:30:00.123456789Z","user":"alice",
//  "organization":null,"department":null,"input":"list files",
//  "generated_command":"ls -la","executed":true,"exit_code":0,
//  "safety_level":"safe","notes":null,"llm_backend":"ollama","session_id":null}
// (실제로는 한 줄. 개행 문자는 포함하지 않는다.)
//
// - 키 순서는 위와 같이 고정한다 (직렬화 결정성).
// - 선택 필드가 비어 있으면 null 로 기록한다. 읽을 때는 키 없음과 null 을
//   모두 "없음" 으로 해석한다.
// - 문자열 내부의 제어 문자와 개행은 이스케이프되므로 레코드는 항상 한 줄이다.
//
// [역직렬화]
// JSON 은 YAML flow 문법의 부분집합이므로 yaml-cpp 로 파싱한다 (설정 로더와
// 같은 파서를 공유). 객체가 아닌 줄, 필수 키 누락, 타입 불일치, 닫히지 않은
// 줄(기록 중 크래시)은 모두 ParseError 이다.
//
// [알려진 한계]
// - 잘못된 UTF-8 바이트열은 파서가 U+FFFD 로 치환할 수 있어 왕복 시 원문과
//   달라질 수 있다.
// ---------------------------------------------------------------------------

#include "audit_record.hpp"
#include "common/types.hpp"  // ParseError

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

class RecordCodec {
public:
    // serialize
    //   레코드를 개행 없는 JSON 한 줄로 직렬화한다.
    [[nodiscard]] static std::string serialize(const AuditRecord& record);

    // parse
    //   JSON 한 줄을 레코드로 역직렬화한다. 앞뒤 공백/CR 은 무시한다.
    [[nodiscard]] static std::expected<AuditRecord, ParseError> parse(std::string_view line);

    // from_node
    //   이미 파싱된 map 노드에서 레코드를 읽는다 (데몬 append 요청 본문용).
    //   timestamp 가 없고 default_timestamp 가 주어지면 그 값을 사용한다.
    [[nodiscard]] static std::expected<AuditRecord, ParseError>
    from_node(const YAML::Node& node,
              std::optional<std::chrono::system_clock::time_point> default_timestamp = std::nullopt);

    // format_timestamp
    //   ISO-8601 UTC, 나노초 9자리 고정: "YYYY-MM-DDTHH:MM:SS.fffffffffZ"
    [[nodiscard]] static std::string format_timestamp(std::chrono::system_clock::time_point tp);

    // parse_timestamp
    //   허용 형식:
    //     YYYY-MM-DD                       (UTC 자정)
    //     YYYY-MM-DDTHH:MM:SS[.f{1,}](Z|±HH:MM)
    //   소수점 이하 9자리를 넘는 부분은 버린다.
    //   날짜는 1677-09-24 .. 2262-04-09 범위만 허용한다 (나노초 시각의 표현 범위).
    [[nodiscard]] static std::optional<std::chrono::system_clock::time_point>
    parse_timestamp(std::string_view text);

    // escape_json
    //   JSON 문자열 본문 이스케이프 (따옴표 제외).
    [[nodiscard]] static std::string escape_json(std::string_view text);
};
