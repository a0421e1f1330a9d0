#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 정책/애플리케이션 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 설정 파일에서 로드된다 (PolicyLoader).
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 필드 누락/타입 오류 시 로더가 이
//   기본값을 그대로 사용한다 (ConfigError 는 치명적이지 않다).
// - 판정 로직은 포함하지 않는다. PolicyEngine 은 PolicyConfig 를 호출마다
//   const-ref 로 빌려 쓰고 보관하지 않는다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PolicyConfig
//   명령어 정책 규칙.
//
//   allow_list     : compliance_mode 일 때 명령어가 최소 하나와 부분 일치해야
//                    하는 패턴 목록 (대소문자 무관 부분 문자열).
//   deny_list      : 부분 일치 시 항상 kBlocked. allow_list 통과 여부와 무관.
//   compliance_mode: true 이고 allow_list 가 비어 있지 않으면 allow-list 강제.
//
//   [빈 패턴]
//   "" 패턴은 모든 문자열과 부분 일치하므로 엔진이 무시한다 (no-op).
// ---------------------------------------------------------------------------
struct PolicyConfig {
    std::vector<std::string> allow_list{};
    std::vector<std::string> deny_list{};
    bool                     compliance_mode{false};
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   진단 로그 설정.
//   log_level: "debug"|"info"|"warn"|"error"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/cmdgate.log"};
};

// ---------------------------------------------------------------------------
// SecurityConfig
//   audit_log_path 가 비어 있으면 로더가 $HOME/.cmdgate/audit.log 로 채운다.
// ---------------------------------------------------------------------------
struct SecurityConfig {
    bool        audit_log{true};
    std::string audit_log_path{};
};

// ---------------------------------------------------------------------------
// EnterpriseConfig
//   감사 레코드에 찍히는 조직 정보와, 설정 파일의 정책 필드.
//   정책 필드 기본값: compliance_mode=true, allowed 없음,
//   blocked = {"rm -rf /", "format", "del /s /q C:\"}.
// ---------------------------------------------------------------------------
struct EnterpriseConfig {
    std::optional<std::string> organization{};
    std::optional<std::string> department{};
    PolicyConfig               policy{
        .allow_list      = {},
        .deny_list       = {"rm -rf /", "format", "del /s /q C:\\"},
        .compliance_mode = true,
    };
};

// ---------------------------------------------------------------------------
// ServiceConfig
//   cmdgate serve 데몬의 Unix Domain Socket 경로.
// ---------------------------------------------------------------------------
struct ServiceConfig {
    std::string socket_path{"/tmp/cmdgate.sock"};
};

// ---------------------------------------------------------------------------
// AppConfig
//   설정 파일 전체의 루트 구조체. PolicyLoader::load 가 반환한다.
// ---------------------------------------------------------------------------
struct AppConfig {
    GlobalConfig     global{};
    SecurityConfig   security{};
    EnterpriseConfig enterprise{};
    ServiceConfig    service{};
};
