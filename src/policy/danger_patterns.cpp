// ---------------------------------------------------------------------------
// danger_patterns.cpp
//
// 내장 위험 명령어 휴리스틱 테이블과 매칭 구현.
//
// [선언 순서 = 우선순위]
// match_danger_patterns 는 가장 높은 등급을 고르고, 같은 등급 안에서는
// 테이블의 앞 항목을 고른다. 구체적인 규칙(재귀 삭제)을 일반적인 규칙
// (일반 삭제) 보다 앞에 둔다.
//
// [토큰 정규화]
// 1. ; | & ( ) ` 를 공백으로 치환 후 공백 분리 ("ls; rm -rf x" → rm 인식)
// 2. 앞뒤 영숫자가 아닌 문자 제거 ("'rm'" → rm)
// 3. 마지막 '/' 또는 '\' 이후만 사용 ("/bin/rm" → rm)
// 4. 첫 '.' 이전만 사용 ("mkfs.ext4" → mkfs, "format.com" → format)
// ---------------------------------------------------------------------------

#include "policy/danger_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace {

constexpr std::array<DangerPattern, 15> kDangerPatterns{{
    // ── kDangerous ─────────────────────────────────────────────────────
    {
        .id           = "recursive-forced-delete",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"rm", "rmdir", "remove-item", "ri", "del", "rd", "erase", "deltree"},
        .qualifiers   = {"-r", "-recurse", "--recursive", "/s", "-force", "--force", "/q", "/f"},
        .reason       = "Recursive or forced deletion can be dangerous",
    },
    {
        .id           = "no-preserve-root",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {"--no-preserve-root"},
        .reason       = "Disables the safeguard against deleting the root directory",
    },
    {
        .id           = "disk-wipe",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"mkfs", "fdisk", "sfdisk", "parted", "wipefs", "shred", "diskpart",
                         "format", "format-volume", "clear-disk"},
        .reason       = "Disk partitioning or wipe utility can destroy data",
    },
    {
        .id           = "raw-device-write",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {"of=/dev/", "> /dev/sd", ">/dev/sd", "> /dev/nvme", ">/dev/nvme",
                         "> /dev/hd", ">/dev/hd", "> /dev/disk", ">/dev/disk"},
        .excludes     = {"of=/dev/null", "of=/dev/zero"},
        .reason       = "Writes directly to a block device",
    },
    {
        .id           = "execution-policy-tampering",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {"set-executionpolicy", "-executionpolicy bypass",
                         "-executionpolicy unrestricted", "-ep bypass", "-exec bypass"},
        .reason       = "Changes the PowerShell execution policy",
    },
    {
        .id           = "system-file-overwrite",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {"> /etc/", ">/etc/", "> /boot/", ">/boot/", "> /usr/", ">/usr/",
                         "> c:\\windows", ">c:\\windows"},
        .reason       = "Redirection overwrites a system file",
    },
    {
        .id           = "fork-bomb",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {":(){", ":() {"},
        .reason       = "Fork bomb exhausts system resources",
    },
    {
        .id           = "remote-script-execution",
        .tier         = SafetyTier::kDangerous,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {"curl ", "wget ", "invoke-webrequest", "iwr "},
        .qualifiers   = {"| sh", "|sh", "| bash", "|bash", "| iex", "|iex", "invoke-expression"},
        .reason       = "Downloads and executes a remote script",
    },

    // ── kWarning ───────────────────────────────────────────────────────
    {
        .id           = "privilege-escalation",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"sudo", "su", "doas", "runas", "pkexec"},
        .reason       = "Runs with elevated privileges",
    },
    {
        .id           = "permission-change",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"chmod", "chown", "chgrp", "icacls", "takeown", "set-acl"},
        .reason       = "Changes file permissions or ownership",
    },
    {
        .id           = "system-control",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"shutdown", "reboot", "halt", "poweroff", "restart-computer",
                         "stop-computer", "stop-service", "remove-service", "killall", "pkill"},
        .reason       = "Stops services, processes or the machine",
    },
    {
        .id           = "dynamic-invocation",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"invoke-expression", "iex", "invoke-command", "start-process", "eval"},
        .reason       = "Executes dynamically constructed code",
    },
    {
        .id           = "file-removal",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kToken,
        .triggers     = {"rm", "rmdir", "del", "rd", "erase", "remove-item", "ri", "mv",
                         "move-item", "unlink"},
        .reason       = "Command can delete or move files",
    },
    {
        .id           = "file-overwrite-redirection",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {" > "},
        .excludes     = {" >> "},
        .reason       = "File redirection (>) will overwrite existing files",
    },
    {
        .id           = "confirmation-bypass",
        .tier         = SafetyTier::kWarning,
        .trigger_kind = NeedleKind::kSubstring,
        .triggers     = {"-force", "-confirm:$false", "force=true", "--yes-i-really"},
        .reason       = "Forces the operation or suppresses confirmation",
    },
}};

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string_view normalize_token(std::string_view token) {
    while (!token.empty() && !is_alnum(token.front())) {
        token.remove_prefix(1);
    }
    while (!token.empty() && !is_alnum(token.back())) {
        token.remove_suffix(1);
    }
    const auto slash = token.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        token.remove_prefix(slash + 1);
    }
    const auto dot = token.find('.');
    if (dot != std::string_view::npos && dot > 0) {
        token = token.substr(0, dot);
    }
    return token;
}

// 명령어 토큰 목록. 반환된 string_view 는 buffer 를 가리킨다.
std::vector<std::string_view> tokenize(const std::string& buffer) {
    std::vector<std::string_view> tokens;
    std::string_view rest{buffer};
    while (!rest.empty()) {
        const auto start = rest.find_first_not_of(' ');
        if (start == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(start);
        const auto end = rest.find(' ');
        const auto raw = rest.substr(0, end);
        const auto token = normalize_token(raw);
        if (!token.empty()) {
            tokens.push_back(token);
        }
        if (end == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(end);
    }
    return tokens;
}

bool any_substring(const NeedleList& needles, std::string_view haystack) {
    return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view n) {
        return !n.empty() && haystack.find(n) != std::string_view::npos;
    });
}

bool is_empty(const NeedleList& needles) {
    return needles.front().empty();
}

}  // namespace

std::span<const DangerPattern> danger_patterns() noexcept {
    return kDangerPatterns;
}

std::optional<DangerMatch> match_danger_patterns(std::string_view lowered_command) {
    // 토큰 분리용 버퍼: 셸 구분자를 공백으로 치환한 사본
    std::string separated{lowered_command};
    std::replace_if(separated.begin(), separated.end(), [](char c) {
        return c == ';' || c == '|' || c == '&' || c == '(' || c == ')' || c == '`' ||
               c == '\t' || c == '\n' || c == '\r';
    }, ' ');
    const auto tokens = tokenize(separated);

    std::optional<DangerMatch> best;
    for (const auto& pattern : kDangerPatterns) {
        if (best && static_cast<int>(pattern.tier) <= static_cast<int>(best->pattern->tier)) {
            continue;  // 같은 등급이면 먼저 선언된 규칙 유지
        }

        std::string_view hit{};
        for (const auto needle : pattern.triggers) {
            if (needle.empty()) {
                break;
            }
            const bool matched = (pattern.trigger_kind == NeedleKind::kToken)
                ? std::find(tokens.begin(), tokens.end(), needle) != tokens.end()
                : lowered_command.find(needle) != std::string_view::npos;
            if (matched) {
                hit = needle;
                break;
            }
        }
        if (hit.empty()) {
            continue;
        }
        if (!is_empty(pattern.qualifiers) && !any_substring(pattern.qualifiers, lowered_command)) {
            continue;
        }
        if (any_substring(pattern.excludes, lowered_command)) {
            continue;
        }
        best = DangerMatch{&pattern, hit};
    }
    return best;
}
