#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 인가 규칙과 판정 결과, 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/policy.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 common/types.hpp, access_requirement.hpp 외에 의존하지 않는다.
// - 모든 멤버는 기본값을 명시한다.
// - 판정 로직은 포함하지 않는다 (LockdownEnforcer / PolicyResolver 소관).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "policy/access_requirement.hpp"

// ---------------------------------------------------------------------------
// Rule
//   (패턴, 선택적 HTTP 메서드, 접근 요구 조건) 3요소.
//   pattern 은 static-declaration 소스를 제외하면 소문자로 정규화되어 있다.
// ---------------------------------------------------------------------------
struct Rule {
    std::string               pattern{};
    std::optional<HttpMethod> http_method{};  // 비어 있으면 모든 메서드
    AccessRequirement         access{};

    [[nodiscard]] friend bool operator==(const Rule&, const Rule&) = default;
};

// ---------------------------------------------------------------------------
// RuleEntry
//   설정 파일의 {pattern, access, http_method} 원형.
//   access 는 단일 문자열이든 목록이든 로더가 목록으로 펼친다.
//   http_method 는 빈 문자열이면 미지정.
// ---------------------------------------------------------------------------
struct RuleEntry {
    std::string              pattern{};
    std::vector<std::string> access{};
    std::string              http_method{};
};

// ---------------------------------------------------------------------------
// RuleSourceKind
//   동일 구체성 규칙 간 등록 순서. 값이 작을수록 먼저 정렬된다.
// ---------------------------------------------------------------------------
enum class RuleSourceKind : std::uint8_t {
    kStaticDeclaration = 0,
    kConfigMap         = 1,
    kDynamicStore      = 2,
};

// ---------------------------------------------------------------------------
// LockdownPolicy
//   일치 규칙이 없을 때의 동작 스위치.
//   reject_if_no_rule == true 이면 reject_public_invocations 는 무시된다.
// ---------------------------------------------------------------------------
struct LockdownPolicy {
    bool reject_if_no_rule{true};
    bool reject_public_invocations{true};
};

// ---------------------------------------------------------------------------
// DecisionKind / PolicyDecision
//   요청마다 새로 만들어지는 판정 값. 오류가 아니라 호출자가 응답으로
//   렌더링하는 일급 결과다.
//   kDeniedNoRule            → 403 또는 인증 진입점 리다이렉트
//   kConfigurationErrorNoRule → 500 (규칙 누락 신호, 권한 부족과 구분)
// ---------------------------------------------------------------------------
enum class DecisionKind : std::uint8_t {
    kMatched                  = 0,
    kDeniedNoRule             = 1,
    kConfigurationErrorNoRule = 2,
};

struct PolicyDecision {
    DecisionKind      kind{DecisionKind::kDeniedNoRule};  // 기본값 거부 (fail-close)
    AccessRequirement requirement{};                      // kMatched 일 때만 의미 있음
    std::string       matched_pattern{};                  // 감사 로그용. 암묵적 허용이면 빈 문자열

    [[nodiscard]] friend bool operator==(const PolicyDecision&, const PolicyDecision&) = default;
};

// ---------------------------------------------------------------------------
// SecurityConfigType
//   primary 규칙 소스 종류. 설정당 정확히 하나.
// ---------------------------------------------------------------------------
enum class SecurityConfigType : std::uint8_t {
    kAnnotation          = 0,
    kMap                 = 1,
    kRequestmapInstances = 2,
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/urlgate.log"};
};

struct SecurityConfig {
    SecurityConfigType security_config_type{SecurityConfigType::kAnnotation};
    LockdownPolicy     lockdown{};
};

// ---------------------------------------------------------------------------
// GatewayConfig
//   PolicyLoader::load 가 반환하는 루트 구조체.
//   annotations       : 선언 수집기가 넘겨준 규칙 (Annotation 타입 전용)
//   static_rules      : 항상 적용되는 예외 규칙
//   intercept_url_map : Map 타입 전용
//   requestmap        : 동적 저장소 초기 내용 (RequestmapInstances 타입 전용)
// ---------------------------------------------------------------------------
struct GatewayConfig {
    GlobalConfig           global{};
    SecurityConfig         security{};
    std::vector<RuleEntry> annotations{};
    std::vector<RuleEntry> static_rules{};
    std::vector<RuleEntry> intercept_url_map{};
    std::vector<RuleEntry> requestmap{};
};
