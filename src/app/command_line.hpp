#pragma once

// ---------------------------------------------------------------------------
// command_line.hpp
//
// cmdgate 명령행 파싱.
//
//   cmdgate [--config PATH] <subcommand> [options]
//
//   check  [--record] [--user U] [--input TEXT] [--backend B] [--session S] -- CMD...
//   record --command CMD --tier T [--executed] [--exit-code N] [--input TEXT]
//          [--backend B] [--notes N] [--session S] [--user U]
//   query  [--user U] [--tier T] [--since ISO] [--until ISO] [--session S] [--limit N]
//   stats
//   serve  [--socket PATH]
//   help
//
// 값을 받는 옵션은 "--opt value" 와 "--opt=value" 를 모두 허용한다.
// 파싱은 부작용이 없다 (환경변수/파일 접근 없음). 실패 시 사용자에게 보여줄
// 메시지를 std::unexpected 로 반환하며 호출자는 종료 코드 2 로 끝낸다.
// ---------------------------------------------------------------------------

#include "audit/audit_record.hpp"  // AuditFilter
#include "common/types.hpp"        // SafetyTier

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// 종료 코드
inline constexpr int kExitOk      = 0;
inline constexpr int kExitIoError = 1;
inline constexpr int kExitUsage   = 2;
inline constexpr int kExitBlocked = 3;

enum class Subcommand : std::uint8_t {
    kHelp   = 0,
    kCheck  = 1,
    kRecord = 2,
    kQuery  = 3,
    kStats  = 4,
    kServe  = 5,
};

struct CheckOptions {
    bool                       record{false};
    std::optional<std::string> user{};
    std::optional<std::string> input{};
    std::optional<std::string> backend{};
    std::optional<std::string> session_id{};
    std::string                command{};  // "--" 이후 인자를 공백으로 이은 값
};

struct RecordOptions {
    std::string                command{};
    SafetyTier                 tier{SafetyTier::kSafe};
    bool                       executed{false};
    std::optional<int>         exit_code{};
    std::optional<std::string> user{};
    std::optional<std::string> input{};
    std::optional<std::string> backend{};
    std::optional<std::string> notes{};
    std::optional<std::string> session_id{};
};

struct ServeOptions {
    std::optional<std::string> socket_path{};
};

// ---------------------------------------------------------------------------
// CommandLine
//   subcommand 에 해당하는 옵션 구조체만 의미가 있다.
// ---------------------------------------------------------------------------
struct CommandLine {
    std::optional<std::filesystem::path> config_path{};
    Subcommand                           subcommand{Subcommand::kHelp};
    CheckOptions                         check{};
    RecordOptions                        record{};
    AuditFilter                          query{};
    ServeOptions                         serve{};
};

// parse_command_line
//   args 는 argv[1..] (프로그램 이름 제외).
[[nodiscard]] std::expected<CommandLine, std::string>
parse_command_line(std::span<const std::string_view> args);

// usage: 도움말 텍스트
[[nodiscard]] std::string usage();

// resolve_user
//   명시 값 → $USER → $USERNAME → "unknown"
[[nodiscard]] std::string resolve_user(const std::optional<std::string>& explicit_user);
