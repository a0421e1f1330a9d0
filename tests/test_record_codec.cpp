// ---------------------------------------------------------------------------
// test_record_codec.cpp
//
// RecordCodec 단위 테스트.
//
// [테스트 범위]
// - serialize: 키 순서, null 선택 필드, 이스케이프 (따옴표, 개행, 제어 문자)
// - parse: 정상 줄, 빈 줄, 잘린 줄, 필수 키 누락, 타입 불일치, 알 수 없는 등급
// - 타임스탬프: 나노초 자릿수, Z / +HH:MM / 날짜만, 잘못된 형식
// - serialize → parse 결과가 원본 레코드와 같음 (특수 문자 포함)
//
// [알려진 한계]
// - 잘못된 UTF-8 바이트 시퀀스의 왕복은 보장하지 않는다.
// ---------------------------------------------------------------------------

#include "audit/record_codec.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::system_clock;

// 2024-03-01T12:34:56.123456789Z
Clock::time_point sample_time() {
    const std::chrono::sys_days day{std::chrono::year{2024} / std::chrono::March / 1};
    return std::chrono::time_point_cast<Clock::duration>(
        std::chrono::sys_time<std::chrono::nanoseconds>{day} + 12h + 34min + 56s +
        std::chrono::nanoseconds{123456789});
}

AuditRecord sample_record() {
    AuditRecord record{};
    record.timestamp              = sample_time();
    record.user                   = "alice";
    record.organization           = "Acme";
    record.department             = std::nullopt;
    record.natural_language_input = "list files";
    record.generated_command      = "ls -la";
    record.executed               = true;
    record.exit_code              = 0;
    record.tier                   = SafetyTier::kSafe;
    record.backend_id             = "ollama";
    record.notes                  = std::nullopt;
    record.session_id             = "s-1";
    return record;
}

constexpr std::string_view kValidLine =
    R"({"timestamp":"2024-03-01T12:34:56.123456789Z","user":"alice","organization":"Acme",)"
    R"("department":null,"input":"list files","generated_command":"ls -la","executed":true,)"
    R"("exit_code":0,"safety_level":"safe","notes":null,"llm_backend":"ollama","session_id":"s-1"})";

}  // namespace

// ===========================================================================
// serialize
// ===========================================================================

TEST(RecordCodec, Serialize_KeyOrderAndNulls) {
    EXPECT_EQ(RecordCodec::serialize(sample_record()), kValidLine);
}

TEST(RecordCodec, Serialize_NoTrailingNewline) {
    const auto line = RecordCodec::serialize(sample_record());
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(RecordCodec, Serialize_NullExitCode) {
    auto record      = sample_record();
    record.executed  = false;
    record.exit_code = std::nullopt;
    const auto line  = RecordCodec::serialize(record);
    EXPECT_NE(line.find(R"("executed":false,"exit_code":null)"), std::string::npos);
}

TEST(RecordCodec, EscapeJson_SpecialCharacters) {
    EXPECT_EQ(RecordCodec::escape_json(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(RecordCodec::escape_json("a\\b"), "a\\\\b");
    EXPECT_EQ(RecordCodec::escape_json("line1\nline2\ttab\r"), "line1\\nline2\\ttab\\r");
    EXPECT_EQ(RecordCodec::escape_json(std::string_view{"\x01\x1f\x7f", 3}), "\\u0001\\u001f\\u007f");
    // UTF-8 은 그대로
    EXPECT_EQ(RecordCodec::escape_json("파일 목록"), "파일 목록");
}

TEST(RecordCodec, Serialize_EmbeddedNewlineStaysOnOneLine) {
    auto record              = sample_record();
    record.generated_command = "cat <<EOF\nhello\nEOF";
    const auto line          = RecordCodec::serialize(record);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

// ===========================================================================
// parse
// ===========================================================================

TEST(RecordCodec, Parse_ValidLine) {
    const auto record = RecordCodec::parse(kValidLine);
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(*record, sample_record());
}

TEST(RecordCodec, Parse_ToleratesSurroundingWhitespace) {
    const auto record = RecordCodec::parse(std::string{"  "} + std::string{kValidLine} + "\r\n");
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->user, "alice");
}

TEST(RecordCodec, Parse_RoundTripWithSpecialCharacters) {
    auto record                   = sample_record();
    record.natural_language_input = "delete \"old\" logs\\backup\n(please)";
    record.generated_command      = "find . -name '*.log' -delete\t# 정리";
    record.notes                  = "bell\x07 and del\x7f";
    record.department             = "R&D: tools";
    record.tier                   = SafetyTier::kDangerous;
    record.exit_code              = -1;

    const auto parsed = RecordCodec::parse(RecordCodec::serialize(record));
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, record);
}

TEST(RecordCodec, Parse_EmptyLine) {
    const auto record = RecordCodec::parse("   ");
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().message, "empty line");
}

TEST(RecordCodec, Parse_TruncatedLine) {
    const auto truncated = kValidLine.substr(0, kValidLine.size() / 2);
    EXPECT_FALSE(RecordCodec::parse(truncated).has_value());
}

TEST(RecordCodec, Parse_NotAnObject) {
    EXPECT_FALSE(RecordCodec::parse("[1, 2, 3]").has_value());
    EXPECT_FALSE(RecordCodec::parse("user: alice").has_value());
}

TEST(RecordCodec, Parse_MissingRequiredKey) {
    const auto record = RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","input":"x","generated_command":"ls",)"
        R"("executed":false,"safety_level":"safe","llm_backend":"cli"})");
    ASSERT_FALSE(record.has_value());
    EXPECT_NE(record.error().message.find("'user'"), std::string::npos);
}

TEST(RecordCodec, Parse_MissingOptionalKeys_Defaults) {
    const auto record = RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","user":"bob","input":"","generated_command":"ls",)"
        R"("executed":false,"safety_level":"warning","llm_backend":"cli"})");
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_FALSE(record->organization.has_value());
    EXPECT_FALSE(record->department.has_value());
    EXPECT_FALSE(record->exit_code.has_value());
    EXPECT_FALSE(record->notes.has_value());
    EXPECT_FALSE(record->session_id.has_value());
    EXPECT_EQ(record->tier, SafetyTier::kWarning);
}

TEST(RecordCodec, Parse_WrongTypes) {
    // executed 가 boolean 이 아님
    EXPECT_FALSE(RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","user":"bob","input":"","generated_command":"ls",)"
        R"("executed":5,"safety_level":"safe","llm_backend":"cli"})").has_value());
    // user 가 배열
    EXPECT_FALSE(RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","user":["bob"],"input":"","generated_command":"ls",)"
        R"("executed":false,"safety_level":"safe","llm_backend":"cli"})").has_value());
    // exit_code 가 정수가 아님
    EXPECT_FALSE(RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","user":"bob","input":"","generated_command":"ls",)"
        R"("executed":true,"exit_code":"zero","safety_level":"safe","llm_backend":"cli"})").has_value());
}

TEST(RecordCodec, Parse_UnknownSafetyLevel) {
    const auto record = RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","user":"bob","input":"","generated_command":"ls",)"
        R"("executed":false,"safety_level":"catastrophic","llm_backend":"cli"})");
    ASSERT_FALSE(record.has_value());
    EXPECT_NE(record.error().message.find("safety_level"), std::string::npos);
}

TEST(RecordCodec, Parse_SafetyLevelCaseInsensitive) {
    const auto record = RecordCodec::parse(
        R"({"timestamp":"2024-03-01T00:00:00Z","user":"bob","input":"","generated_command":"ls",)"
        R"("executed":false,"safety_level":"BLOCKED","llm_backend":"cli"})");
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->tier, SafetyTier::kBlocked);
}

TEST(RecordCodec, FromNode_DefaultTimestamp) {
    const YAML::Node node = YAML::Load(
        R"({"user":"bob","input":"","generated_command":"ls","executed":false,)"
        R"("safety_level":"safe","llm_backend":"cli"})");
    const auto now = Clock::now();

    EXPECT_FALSE(RecordCodec::from_node(node).has_value());

    const auto record = RecordCodec::from_node(node, now);
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->timestamp, now);
}

// ===========================================================================
// 타임스탬프
// ===========================================================================

TEST(RecordCodec, FormatTimestamp_NineFractionDigits) {
    EXPECT_EQ(RecordCodec::format_timestamp(sample_time()), "2024-03-01T12:34:56.123456789Z");

    const Clock::time_point epoch{};
    EXPECT_EQ(RecordCodec::format_timestamp(epoch), "1970-01-01T00:00:00.000000000Z");
}

TEST(RecordCodec, ParseTimestamp_Variants) {
    const auto base = RecordCodec::parse_timestamp("2024-03-01T12:34:56Z");
    ASSERT_TRUE(base.has_value());

    EXPECT_EQ(RecordCodec::parse_timestamp("2024-03-01T12:34:56+00:00"), base);
    EXPECT_EQ(RecordCodec::parse_timestamp("2024-03-01 12:34:56Z"), base);
    EXPECT_EQ(RecordCodec::parse_timestamp("2024-03-01T14:34:56+02:00"), base);
    EXPECT_EQ(RecordCodec::parse_timestamp("2024-03-01T07:34:56-05:00"), base);

    const auto with_fraction = RecordCodec::parse_timestamp("2024-03-01T12:34:56.5Z");
    ASSERT_TRUE(with_fraction.has_value());
    EXPECT_EQ(*with_fraction - *base, std::chrono::milliseconds{500});

    EXPECT_EQ(RecordCodec::parse_timestamp("2024-03-01T12:34:56.123456789Z"), sample_time());
}

TEST(RecordCodec, ParseTimestamp_DateOnlyIsMidnight) {
    const auto date = RecordCodec::parse_timestamp("2024-03-01");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(RecordCodec::format_timestamp(*date), "2024-03-01T00:00:00.000000000Z");
}

TEST(RecordCodec, ParseTimestamp_Invalid) {
    EXPECT_FALSE(RecordCodec::parse_timestamp("").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("2024-02-30").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("2024-03-01T25:00:00Z").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("2024-03-01T12:34:56").has_value());  // 시간대 없음
    EXPECT_FALSE(RecordCodec::parse_timestamp("2024-03-01T12:34:56.Z").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("2024-03-01T12:34:56Zjunk").has_value());
}

// 나노초 시각으로 표현할 수 없는 날짜는 과거로 감싸지지 않고 거부된다.
TEST(RecordCodec, ParseTimestamp_OutOfClockRange) {
    EXPECT_FALSE(RecordCodec::parse_timestamp("3000-01-01").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("2300-01-01T00:00:00Z").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("2262-04-10").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("1600-01-01T00:00:00Z").has_value());
    EXPECT_FALSE(RecordCodec::parse_timestamp("1677-09-23").has_value());
}

TEST(RecordCodec, ParseTimestamp_ClockRangeEdges) {
    const auto last = RecordCodec::parse_timestamp("2262-04-09T23:59:59.999999999-23:59");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(RecordCodec::format_timestamp(*last), "2262-04-10T23:58:59.999999999Z");
    EXPECT_LT(Clock::now(), *last);

    const auto first = RecordCodec::parse_timestamp("1677-09-24T00:00:00+23:59");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(RecordCodec::format_timestamp(*first), "1677-09-23T00:01:00.000000000Z");
    EXPECT_LT(*first, Clock::time_point{});
}

TEST(RecordCodec, Parse_FarFutureTimestamp_Rejected) {
    std::string line{kValidLine};
    line.replace(line.find("2024-03-01"), 10, "3000-01-01");
    const auto record = RecordCodec::parse(line);
    ASSERT_FALSE(record.has_value());
    EXPECT_NE(record.error().message.find("timestamp"), std::string::npos);
}

TEST(RecordCodec, Timestamp_FormatThenParse) {
    const auto now = std::chrono::time_point_cast<std::chrono::nanoseconds>(Clock::now());
    const auto tp  = std::chrono::time_point_cast<Clock::duration>(now);
    EXPECT_EQ(RecordCodec::parse_timestamp(RecordCodec::format_timestamp(tp)), tp);
}
