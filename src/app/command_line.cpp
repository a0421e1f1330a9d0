// ---------------------------------------------------------------------------
// command_line.cpp
//
// cmdgate 명령행 파싱 구현.
// ---------------------------------------------------------------------------

#include "app/command_line.hpp"
#include "audit/record_codec.hpp"

#include <charconv>
#include <cstdlib>
#include <vector>

#include <fmt/format.h>

namespace {

// ---------------------------------------------------------------------------
// ArgCursor
//   인자 목록을 앞에서부터 소비한다. "--opt=value" 는 옵션 이름과 값으로
//   나누어 보관한다.
// ---------------------------------------------------------------------------
class ArgCursor {
public:
    explicit ArgCursor(std::span<const std::string_view> args) : args_(args) {}

    [[nodiscard]] bool done() const noexcept { return pos_ >= args_.size(); }

    // 다음 인자를 꺼낸다. "--name=value" 면 name 만 돌려주고 value 는 보관.
    std::string_view next() {
        std::string_view arg = args_[pos_++];
        inline_value_.reset();
        if (arg.starts_with("--")) {
            const auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                inline_value_ = arg.substr(eq + 1);
                arg           = arg.substr(0, eq);
            }
        }
        return arg;
    }

    // 직전 옵션의 값 ("--opt=value" 또는 다음 인자)
    std::expected<std::string, std::string> value(std::string_view option) {
        if (inline_value_) {
            std::string v{*inline_value_};
            inline_value_.reset();
            return v;
        }
        if (done()) {
            return std::unexpected(fmt::format("option '{}' requires a value", option));
        }
        return std::string{args_[pos_++]};
    }

    // 남은 인자 전부
    std::vector<std::string_view> rest() {
        std::vector<std::string_view> out(args_.begin() + static_cast<std::ptrdiff_t>(pos_), args_.end());
        pos_ = args_.size();
        return out;
    }

private:
    std::span<const std::string_view> args_;
    std::size_t                       pos_{0};
    std::optional<std::string_view>   inline_value_{};
};

std::string join(const std::vector<std::string_view>& parts) {
    std::string out;
    for (const auto part : parts) {
        if (!out.empty()) {
            out += ' ';
        }
        out += part;
    }
    return out;
}

template <typename Int>
std::expected<Int, std::string> parse_integer(std::string_view option, const std::string& text) {
    Int value{};
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::unexpected(fmt::format("option '{}' expects an integer, got '{}'", option, text));
    }
    return value;
}

std::expected<SafetyTier, std::string> parse_tier_option(std::string_view option,
                                                         const std::string& text) {
    const auto tier = parse_tier(text);
    if (!tier) {
        return std::unexpected(fmt::format(
            "option '{}' expects one of safe|warning|dangerous|blocked, got '{}'", option, text));
    }
    return *tier;
}

std::expected<std::chrono::system_clock::time_point, std::string>
parse_time_option(std::string_view option, const std::string& text) {
    const auto tp = RecordCodec::parse_timestamp(text);
    if (!tp) {
        return std::unexpected(fmt::format(
            "option '{}' expects an ISO-8601 timestamp between 1677-09-24 and 2262-04-09 "
            "(e.g. 2026-10-18T09:30:00Z), got '{}'",
            option, text));
    }
    return *tp;
}

// 옵션 하나의 문자열 값을 target 에 저장한다. 실패 시 에러 메시지.
template <typename Target>
std::optional<std::string> take_value(ArgCursor& cursor, std::string_view option, Target& target) {
    auto value = cursor.value(option);
    if (!value) {
        return std::move(value.error());
    }
    target = std::move(*value);
    return std::nullopt;
}

std::expected<void, std::string> parse_check(ArgCursor& cursor, CheckOptions& out) {
    std::vector<std::string_view> words;
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--") {
            const auto rest = cursor.rest();
            words.insert(words.end(), rest.begin(), rest.end());
            break;
        }
        if (arg == "--record") {
            out.record = true;
        } else if (arg == "--user") {
            if (auto err = take_value(cursor, arg, out.user)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--input") {
            if (auto err = take_value(cursor, arg, out.input)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--backend") {
            if (auto err = take_value(cursor, arg, out.backend)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--session") {
            if (auto err = take_value(cursor, arg, out.session_id)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg.starts_with("--")) {
            return std::unexpected(fmt::format("unknown option '{}' for 'check'", arg));
        } else {
            words.push_back(arg);
        }
    }
    out.command = join(words);
    if (out.command.empty()) {
        return std::unexpected(std::string{"'check' requires a command after '--'"});
    }
    return {};
}

std::expected<void, std::string> parse_record(ArgCursor& cursor, RecordOptions& out) {
    bool have_command = false;
    bool have_tier    = false;
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--command") {
            if (auto err = take_value(cursor, arg, out.command)) {
                return std::unexpected(std::move(*err));
            }
            have_command = true;
        } else if (arg == "--tier") {
            std::string text;
            if (auto err = take_value(cursor, arg, text)) {
                return std::unexpected(std::move(*err));
            }
            auto tier = parse_tier_option(arg, text);
            if (!tier) {
                return std::unexpected(tier.error());
            }
            out.tier  = *tier;
            have_tier = true;
        } else if (arg == "--executed") {
            out.executed = true;
        } else if (arg == "--exit-code") {
            std::string text;
            if (auto err = take_value(cursor, arg, text)) {
                return std::unexpected(std::move(*err));
            }
            auto code = parse_integer<int>(arg, text);
            if (!code) {
                return std::unexpected(code.error());
            }
            out.exit_code = *code;
        } else if (arg == "--user") {
            if (auto err = take_value(cursor, arg, out.user)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--input") {
            if (auto err = take_value(cursor, arg, out.input)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--backend") {
            if (auto err = take_value(cursor, arg, out.backend)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--notes") {
            if (auto err = take_value(cursor, arg, out.notes)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--session") {
            if (auto err = take_value(cursor, arg, out.session_id)) {
                return std::unexpected(std::move(*err));
            }
        } else {
            return std::unexpected(fmt::format("unknown argument '{}' for 'record'", arg));
        }
    }
    if (!have_command) {
        return std::unexpected(std::string{"'record' requires --command"});
    }
    if (!have_tier) {
        return std::unexpected(std::string{"'record' requires --tier"});
    }
    // 종료 코드는 실행된 명령어에만 의미가 있다
    if (out.exit_code && !out.executed) {
        return std::unexpected(std::string{"'--exit-code' requires '--executed'"});
    }
    return {};
}

std::expected<void, std::string> parse_query(ArgCursor& cursor, AuditFilter& out) {
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--user") {
            if (auto err = take_value(cursor, arg, out.user)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--session") {
            if (auto err = take_value(cursor, arg, out.session_id)) {
                return std::unexpected(std::move(*err));
            }
        } else if (arg == "--tier") {
            std::string text;
            if (auto err = take_value(cursor, arg, text)) {
                return std::unexpected(std::move(*err));
            }
            auto tier = parse_tier_option(arg, text);
            if (!tier) {
                return std::unexpected(tier.error());
            }
            out.tier = *tier;
        } else if (arg == "--since" || arg == "--until") {
            std::string text;
            if (auto err = take_value(cursor, arg, text)) {
                return std::unexpected(std::move(*err));
            }
            auto tp = parse_time_option(arg, text);
            if (!tp) {
                return std::unexpected(tp.error());
            }
            (arg == "--since" ? out.since : out.until) = *tp;
        } else if (arg == "--limit") {
            std::string text;
            if (auto err = take_value(cursor, arg, text)) {
                return std::unexpected(std::move(*err));
            }
            auto limit = parse_integer<std::uint64_t>(arg, text);
            if (!limit) {
                return std::unexpected(limit.error());
            }
            out.limit = *limit;
        } else {
            return std::unexpected(fmt::format("unknown argument '{}' for 'query'", arg));
        }
    }
    if (out.since && out.until && !(*out.since < *out.until)) {
        return std::unexpected(std::string{"'--since' must be earlier than '--until'"});
    }
    return {};
}

std::expected<void, std::string> parse_serve(ArgCursor& cursor, ServeOptions& out) {
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--socket") {
            if (auto err = take_value(cursor, arg, out.socket_path)) {
                return std::unexpected(std::move(*err));
            }
        } else {
            return std::unexpected(fmt::format("unknown argument '{}' for 'serve'", arg));
        }
    }
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_command_line
// ---------------------------------------------------------------------------
std::expected<CommandLine, std::string>
parse_command_line(std::span<const std::string_view> args) {
    CommandLine cl{};
    ArgCursor   cursor{args};

    // 전역 옵션 (subcommand 앞)
    std::optional<std::string_view> name;
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--config") {
            auto value = cursor.value(arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            cl.config_path = std::filesystem::path{*value};
        } else if (arg == "--help" || arg == "-h") {
            cl.subcommand = Subcommand::kHelp;
            return cl;
        } else if (arg.starts_with("-")) {
            return std::unexpected(fmt::format("unknown option '{}'", arg));
        } else {
            name = arg;
            break;
        }
    }

    if (!name) {
        return std::unexpected(std::string{"missing subcommand"});
    }

    std::expected<void, std::string> parsed{};
    if (*name == "check") {
        cl.subcommand = Subcommand::kCheck;
        parsed        = parse_check(cursor, cl.check);
    } else if (*name == "record") {
        cl.subcommand = Subcommand::kRecord;
        parsed        = parse_record(cursor, cl.record);
    } else if (*name == "query") {
        cl.subcommand = Subcommand::kQuery;
        parsed        = parse_query(cursor, cl.query);
    } else if (*name == "stats") {
        cl.subcommand = Subcommand::kStats;
        if (!cursor.done()) {
            parsed = std::unexpected(std::string{"'stats' takes no arguments"});
        }
    } else if (*name == "serve") {
        cl.subcommand = Subcommand::kServe;
        parsed        = parse_serve(cursor, cl.serve);
    } else if (*name == "help") {
        cl.subcommand = Subcommand::kHelp;
    } else {
        return std::unexpected(fmt::format("unknown subcommand '{}'", *name));
    }

    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return cl;
}

std::string usage() {
    return
        "usage: cmdgate [--config PATH] <subcommand> [options]\n"
        "\n"
        "subcommands:\n"
        "  check  [--record] [--user U] [--input TEXT] [--backend B] [--session S] -- CMD...\n"
        "         classify a command; exits 3 when it is blocked\n"
        "  record --command CMD --tier safe|warning|dangerous|blocked [--executed]\n"
        "         [--exit-code N] [--input TEXT] [--backend B] [--notes N] [--session S] [--user U]\n"
        "         append one audit record\n"
        "  query  [--user U] [--tier T] [--since ISO] [--until ISO] [--session S] [--limit N]\n"
        "         print matching audit records as JSON lines\n"
        "  stats  print audit log statistics\n"
        "  serve  [--socket PATH]\n"
        "         run the local policy/audit daemon until SIGINT or SIGTERM\n"
        "\n"
        "exit codes: 0 ok, 1 I/O error, 2 usage error, 3 command blocked\n";
}

std::string resolve_user(const std::optional<std::string>& explicit_user) {
    if (explicit_user && !explicit_user->empty()) {
        return *explicit_user;
    }
    for (const char* name : {"USER", "USERNAME"}) {
        const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
        if (val != nullptr && val[0] != '\0') {
            return val;
        }
    }
    return "unknown";
}
