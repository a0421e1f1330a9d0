// ---------------------------------------------------------------------------
// record_codec.cpp
//
// 감사 로그 한 줄 직렬화/역직렬화 구현.
//
// [쓰기]
// 로거와 같은 방식으로 JSON 을 직접 조립한다 (ostringstream + 이스케이프).
//
// [읽기]
// yaml-cpp 로 한 줄을 파싱한 뒤 필드별로 타입을 확인한다. yaml-cpp 예외는
// 이 파일 밖으로 나가지 않고 ParseError 로 변환된다.
// ---------------------------------------------------------------------------

#include "audit/record_codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <fmt/format.h>

namespace {

using Clock = std::chrono::system_clock;

// 에러 context 용 줄 앞부분
std::string line_prefix(std::string_view line) {
    return std::string{line.substr(0, std::min(line.size(), std::size_t{64}))};
}

// system_clock(나노초)로 표현 가능한 날짜인지. 시각과 UTC 오프셋 보정분으로 양끝 2일을 뺀다.
// 허용 범위: 1677-09-24 .. 2262-04-09
bool representable(std::chrono::sys_days date) {
    using std::chrono::days;
    const auto first = std::chrono::ceil<days>(Clock::time_point::min()) + days{2};
    const auto last  = std::chrono::floor<days>(Clock::time_point::max()) - days{2};
    return date >= first && date <= last;
}

std::string_view trim(std::string_view s) {
    const auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && is_ws(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ws(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

void write_string(std::ostringstream& json, std::string_view value) {
    json << '"' << RecordCodec::escape_json(value) << '"';
}

void write_optional(std::ostringstream& json, const std::optional<std::string>& value) {
    if (value) {
        write_string(json, *value);
    } else {
        json << "null";
    }
}

// ---------------------------------------------------------------------------
// 필드 읽기 헬퍼
//   필수 필드: 키가 없거나 null 이거나 스칼라가 아니면 ParseError.
//   선택 필드: 키 없음/null → std::nullopt.
// ---------------------------------------------------------------------------
ParseError field_error(const char* key, std::string_view what) {
    return ParseError{fmt::format("field '{}' {}", key, what), key};
}

std::expected<std::string, ParseError> required_string(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::unexpected(field_error(key, "is missing"));
    }
    if (!node.IsScalar()) {
        return std::unexpected(field_error(key, "is not a string"));
    }
    return node.Scalar();
}

std::expected<std::optional<std::string>, ParseError>
optional_string(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::optional<std::string>{};
    }
    if (!node.IsScalar()) {
        return std::unexpected(field_error(key, "is not a string"));
    }
    return std::optional<std::string>{node.Scalar()};
}

std::expected<bool, ParseError> required_bool(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::unexpected(field_error(key, "is missing"));
    }
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        return std::unexpected(field_error(key, "is not a boolean"));
    }
    return value;
}

std::expected<std::optional<int>, ParseError> optional_int(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::optional<int>{};
    }
    if (!node.IsScalar()) {
        return std::unexpected(field_error(key, "is not an integer"));
    }
    const std::string& text = node.Scalar();
    int value = 0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::unexpected(field_error(key, "is not an integer"));
    }
    return std::optional<int>{value};
}

// 고정 자릿수 10진수 (부호 없음)
bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// escape_json
//   따옴표/역슬래시/제어 문자(0x00-0x1f, 0x7f)를 이스케이프한다.
//   0x80 이상 바이트(UTF-8)는 그대로 둔다.
// ---------------------------------------------------------------------------
std::string RecordCodec::escape_json(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 16);

    for (const unsigned char ch : text) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20 || ch == 0x7f) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// format_timestamp
//   1970 이전 시각도 floor 로 초/나노초를 분리하므로 나노초는 항상 0 이상이다.
// ---------------------------------------------------------------------------
std::string RecordCodec::format_timestamp(Clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto seconds     = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto nanos       = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);

    const std::time_t time_t_val = static_cast<std::time_t>(seconds.count());
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(9)
        << nanos.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// parse_timestamp
// ---------------------------------------------------------------------------
std::optional<Clock::time_point> RecordCodec::parse_timestamp(std::string_view text) {
    text = trim(text);

    // YYYY-MM-DD
    int year = 0;
    int month = 0;
    int day = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' || !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    const std::chrono::sys_days date{ymd};
    if (!representable(date)) {
        return std::nullopt;
    }

    if (text.size() == 10) {
        return Clock::time_point{date};
    }

    // THH:MM:SS
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (text.size() < 19 || (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' ||
        !read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    // [.fraction] 9자리 초과분은 버린다
    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t frac_start = pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == frac_start) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    // Z | ±HH:MM
    std::chrono::minutes offset{0};
    if (pos >= text.size()) {
        return std::nullopt;
    }
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const bool negative = (text[pos] == '-');
        int off_hour = 0;
        int off_minute = 0;
        if (!read_digits(text, pos + 1, 2, off_hour) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_digits(text, pos + 4, 2, off_minute) ||
            off_hour > 23 || off_minute > 59) {
            return std::nullopt;
        }
        offset = std::chrono::hours{off_hour} + std::chrono::minutes{off_minute};
        if (negative) {
            offset = -offset;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const auto local = std::chrono::sys_time<std::chrono::nanoseconds>{date} +
                       std::chrono::hours{hour} + std::chrono::minutes{minute} +
                       std::chrono::seconds{second} + std::chrono::nanoseconds{nanos};
    return std::chrono::time_point_cast<Clock::duration>(local - offset);
}

// ---------------------------------------------------------------------------
// serialize
// ---------------------------------------------------------------------------
std::string RecordCodec::serialize(const AuditRecord& record) {
    std::ostringstream json;
    json << R"({"timestamp":")" << format_timestamp(record.timestamp) << R"(","user":)";
    write_string(json, record.user);
    json << R"(,"organization":)";
    write_optional(json, record.organization);
    json << R"(,"department":)";
    write_optional(json, record.department);
    json << R"(,"input":)";
    write_string(json, record.natural_language_input);
    json << R"(,"generated_command":)";
    write_string(json, record.generated_command);
    json << R"(,"executed":)" << (record.executed ? "true" : "false");
    json << R"(,"exit_code":)";
    if (record.exit_code) {
        json << *record.exit_code;
    } else {
        json << "null";
    }
    json << R"(,"safety_level":")" << tier_name(record.tier) << '"';
    json << R"(,"notes":)";
    write_optional(json, record.notes);
    json << R"(,"llm_backend":)";
    write_string(json, record.backend_id);
    json << R"(,"session_id":)";
    write_optional(json, record.session_id);
    json << '}';
    return json.str();
}

// ---------------------------------------------------------------------------
// from_node
// ---------------------------------------------------------------------------
std::expected<AuditRecord, ParseError>
RecordCodec::from_node(const YAML::Node&                node,
                       std::optional<Clock::time_point> default_timestamp) {
    if (!node || !node.IsMap()) {
        return std::unexpected(ParseError{"record is not a JSON object", {}});
    }

    try {
        AuditRecord record{};

        const YAML::Node ts = node["timestamp"];
        if ((!ts || ts.IsNull()) && default_timestamp) {
            record.timestamp = *default_timestamp;
        } else {
            auto text = required_string(node, "timestamp");
            if (!text) {
                return std::unexpected(text.error());
            }
            const auto parsed = parse_timestamp(*text);
            if (!parsed) {
                return std::unexpected(field_error("timestamp", "is not an ISO-8601 UTC timestamp"));
            }
            record.timestamp = *parsed;
        }

        auto user = required_string(node, "user");
        if (!user) {
            return std::unexpected(user.error());
        }
        record.user = std::move(*user);

        auto organization = optional_string(node, "organization");
        if (!organization) {
            return std::unexpected(organization.error());
        }
        record.organization = std::move(*organization);

        auto department = optional_string(node, "department");
        if (!department) {
            return std::unexpected(department.error());
        }
        record.department = std::move(*department);

        auto input = required_string(node, "input");
        if (!input) {
            return std::unexpected(input.error());
        }
        record.natural_language_input = std::move(*input);

        auto command = required_string(node, "generated_command");
        if (!command) {
            return std::unexpected(command.error());
        }
        record.generated_command = std::move(*command);

        const auto executed = required_bool(node, "executed");
        if (!executed) {
            return std::unexpected(executed.error());
        }
        record.executed = *executed;

        const auto exit_code = optional_int(node, "exit_code");
        if (!exit_code) {
            return std::unexpected(exit_code.error());
        }
        record.exit_code = *exit_code;

        const auto level = required_string(node, "safety_level");
        if (!level) {
            return std::unexpected(level.error());
        }
        const auto tier = parse_tier(*level);
        if (!tier) {
            return std::unexpected(field_error("safety_level", "has an unknown value"));
        }
        record.tier = *tier;

        auto notes = optional_string(node, "notes");
        if (!notes) {
            return std::unexpected(notes.error());
        }
        record.notes = std::move(*notes);

        auto backend = required_string(node, "llm_backend");
        if (!backend) {
            return std::unexpected(backend.error());
        }
        record.backend_id = std::move(*backend);

        auto session = optional_string(node, "session_id");
        if (!session) {
            return std::unexpected(session.error());
        }
        record.session_id = std::move(*session);

        return record;
    } catch (const YAML::Exception& e) {
        return std::unexpected(ParseError{fmt::format("YAML error: {}", e.what()), {}});
    }
}

// ---------------------------------------------------------------------------
// parse
// ---------------------------------------------------------------------------
std::expected<AuditRecord, ParseError> RecordCodec::parse(std::string_view line) {
    const std::string_view body = trim(line);
    if (body.empty()) {
        return std::unexpected(ParseError{"empty line", {}});
    }
    // JSON 객체만 허용한다 (YAML block 문법 등은 거부)
    if (body.front() != '{' || body.back() != '}') {
        return std::unexpected(ParseError{"line is not a JSON object", line_prefix(body)});
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string{body});
    } catch (const YAML::ParserException& e) {
        return std::unexpected(ParseError{
            fmt::format("malformed JSON at col {}: {}", e.mark.column + 1, e.msg),
            line_prefix(body),
        });
    } catch (const YAML::Exception& e) {
        return std::unexpected(ParseError{fmt::format("YAML error: {}", e.what()), line_prefix(body)});
    }

    auto record = from_node(root);
    if (!record) {
        ParseError error = std::move(record.error());
        if (error.context.empty()) {
            error.context = line_prefix(body);
        }
        return std::unexpected(std::move(error));
    }
    return record;
}
