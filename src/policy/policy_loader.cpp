// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 설정 파일을 로드하여 AppConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 타입이 맞지 않는 필드는 경고 후 기본값 유지 (ConfigError 비치명).
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [정책 필드 기본값]
// enterprise.compliance_mode  : true
// enterprise.allowed_commands : []
// enterprise.blocked_commands : ["rm -rf /", "format", "del /s /q C:\"]
// blocked_commands 키가 존재하면 (빈 목록이라도) 기본값을 대체한다.
//
// [알려진 한계]
// - "~user/..." 형태의 경로 확장은 지원하지 않는다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 sequence 가 아니면 경고 후 fallback. 스칼라가 아닌 항목은 건너뛴다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node&              node,
                                                            std::string_view                key,
                                                            const std::vector<std::string>& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsSequence()) {
        spdlog::warn("policy_loader: '{}' is not a sequence, using default", key);
        return fallback;
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        } else {
            spdlog::warn("policy_loader: non-scalar entry in '{}' ignored", key);
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, std::string_view key, bool fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("policy_loader: '{}' is not a boolean, using default {}", key, fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node&  node,
                                      std::string_view   key,
                                      const std::string& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        spdlog::warn("policy_loader: '{}' is not a scalar, using default", key);
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] std::optional<std::string> read_optional_string(const YAML::Node& node,
                                                              std::string_view  key) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        spdlog::warn("policy_loader: '{}' is not a scalar, ignoring", key);
        return std::nullopt;
    }
    return node.as<std::string>();
}

// 섹션이 map 이 아니면 경고 후 빈 노드로 취급한다.
[[nodiscard]] YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (!node || node.IsNull()) {
        return YAML::Node{};
    }
    if (!node.IsMap()) {
        spdlog::warn("policy_loader: section '{}' is not a map, using defaults", name);
        return YAML::Node{};
    }
    return node;
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.log_level = read_string(node["log_level"], "global.log_level", cfg.log_level);
    cfg.log_path  = read_string(node["log_path"],  "global.log_path",  cfg.log_path);

    if (cfg.log_level != "debug" && cfg.log_level != "info" &&
        cfg.log_level != "warn"  && cfg.log_level != "error") {
        spdlog::warn("policy_loader: global.log_level '{}' is unknown, defaulting to 'info'",
                     cfg.log_level);
        cfg.log_level = "info";
    }
    return cfg;
}

[[nodiscard]] SecurityConfig parse_security(const YAML::Node& node) {
    SecurityConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.audit_log      = read_bool(node["audit_log"], "security.audit_log", cfg.audit_log);
    cfg.audit_log_path = read_string(node["audit_log_path"], "security.audit_log_path",
                                     cfg.audit_log_path);
    return cfg;
}

[[nodiscard]] EnterpriseConfig parse_enterprise(const YAML::Node& node) {
    EnterpriseConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.organization = read_optional_string(node["organization"], "enterprise.organization");
    cfg.department   = read_optional_string(node["department"],   "enterprise.department");

    cfg.policy.compliance_mode = read_bool(node["compliance_mode"], "enterprise.compliance_mode",
                                           cfg.policy.compliance_mode);
    cfg.policy.allow_list = read_string_sequence(node["allowed_commands"],
                                                 "enterprise.allowed_commands",
                                                 cfg.policy.allow_list);
    cfg.policy.deny_list  = read_string_sequence(node["blocked_commands"],
                                                 "enterprise.blocked_commands",
                                                 cfg.policy.deny_list);
    return cfg;
}

[[nodiscard]] ServiceConfig parse_service(const YAML::Node& node) {
    ServiceConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.socket_path = read_string(node["socket_path"], "service.socket_path", cfg.socket_path);
    return cfg;
}

[[nodiscard]] std::filesystem::path home_relative(const char* leaf) {
    const char* home = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe)
    const std::filesystem::path base =
        (home != nullptr && home[0] != '\0') ? std::filesystem::path{home} : std::filesystem::path{};
    return base / ".cmdgate" / leaf;
}

void finalize_paths(AppConfig& cfg) {
    if (cfg.security.audit_log_path.empty()) {
        cfg.security.audit_log_path = PolicyLoader::default_audit_log_path().string();
    }
    cfg.security.audit_log_path = PolicyLoader::expand_home(cfg.security.audit_log_path);
    cfg.global.log_path         = PolicyLoader::expand_home(cfg.global.log_path);
    cfg.service.socket_path     = PolicyLoader::expand_home(cfg.service.socket_path);
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::parse 구현
// ---------------------------------------------------------------------------
std::expected<AppConfig, std::string> PolicyLoader::parse(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::ParserException& e) {
        // yaml-cpp 는 0-based
        return std::unexpected(fmt::format("YAML parse error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.msg));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("YAML error: {}", e.what()));
    }

    AppConfig cfg{};

    // 빈 파일은 기본값
    if (!root || root.IsNull()) {
        finalize_paths(cfg);
        return cfg;
    }
    if (!root.IsMap()) {
        return std::unexpected(std::string{"top-level YAML node is not a map"});
    }

    try {
        cfg.global     = parse_global(section(root, "global"));
        cfg.security   = parse_security(section(root, "security"));
        cfg.enterprise = parse_enterprise(section(root, "enterprise"));
        cfg.service    = parse_service(section(root, "service"));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("YAML error while reading fields: {}", e.what()));
    }

    finalize_paths(cfg);
    return cfg;
}

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<AppConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        if (ec) {
            const std::string err = fmt::format("policy_loader: cannot stat '{}': {}",
                                                config_path.string(), ec.message());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
        spdlog::info("policy_loader: config file '{}' not found, using defaults",
                     config_path.string());
        AppConfig cfg{};
        finalize_paths(cfg);
        return cfg;
    }

    std::ifstream in(config_path);
    if (!in.is_open()) {
        const std::string err = fmt::format("policy_loader: cannot open file '{}'",
                                            config_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse(buffer.str());
    if (!parsed) {
        const std::string err = fmt::format("policy_loader: '{}': {}",
                                            config_path.string(), parsed.error());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "policy_loader: loaded '{}': compliance_mode={}, allowed={}, blocked={}",
        config_path.string(),
        parsed->enterprise.policy.compliance_mode,
        parsed->enterprise.policy.allow_list.size(),
        parsed->enterprise.policy.deny_list.size()
    );
    return parsed;
}

std::filesystem::path PolicyLoader::default_config_path() {
    return home_relative("config.yaml");
}

std::filesystem::path PolicyLoader::default_audit_log_path() {
    return home_relative("audit.log");
}

std::string PolicyLoader::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;  // ~user 형태
    }
    const char* home = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe)
    if (home == nullptr || home[0] == '\0') {
        return path;
    }
    return std::string{home} + path.substr(1);
}
