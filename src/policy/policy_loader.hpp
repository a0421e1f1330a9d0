#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 설정 파일을 로드하여 AppConfig 로 변환하는 로더.
//
// [설계 원칙]
// - 파일 없음: 기본값 AppConfig 를 반환한다 (정상 경로, info 로그).
// - YAML 문법 오류 / 최상위가 map 아님: std::unexpected(error_message).
//   호출자는 기본값으로 대체하고 경고를 출력한다.
// - 필드 누락/타입 오류: 해당 필드만 기본값 유지 + 경고 로그 (ConfigError 는
//   치명적이지 않다).
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
//
// [보안 고려사항]
// - 설정 파일 전체를 로그에 출력하지 않는다 (조직 정보 등 노출 방지).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "rule.hpp"  // AppConfig

class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   config_path 의 YAML 파일을 AppConfig 로 파싱한다.
    //   security.audit_log_path 가 비어 있으면 default_audit_log_path() 로 채우고,
    //   경로 앞의 '~' 는 $HOME 으로 확장한다.
    [[nodiscard]] static std::expected<AppConfig, std::string>
    load(const std::filesystem::path& config_path);

    // parse
    //   YAML 문자열을 직접 파싱한다 (load 의 파일 읽기 이후 단계와 동일).
    [[nodiscard]] static std::expected<AppConfig, std::string>
    parse(std::string_view yaml_text);

    // default_config_path:    $HOME/.cmdgate/config.yaml
    // default_audit_log_path: $HOME/.cmdgate/audit.log
    // $HOME 이 없으면 현재 디렉터리 기준 상대 경로 (.cmdgate/...) 를 사용한다.
    [[nodiscard]] static std::filesystem::path default_config_path();
    [[nodiscard]] static std::filesystem::path default_audit_log_path();

    // expand_home
    //   "~" 또는 "~/..." 형태만 확장한다. "~user" 형태는 그대로 둔다.
    [[nodiscard]] static std::string expand_home(const std::string& path);
};
