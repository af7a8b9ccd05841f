#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 GatewayConfig 로 로드하고 검증한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로
//   파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 규칙 엔트리(패턴/메서드/access)는 로드 시점에 검증한다. 잘못된 규칙은
//   해석 시점이 아니라 기동 시점에 실패해야 한다.
// - primary 소스 종류는 정확히 하나. 다른 종류 전용 섹션이 함께 있으면 오류.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "policy/rule.hpp"

class PolicyLoader {
public:
    // load
    //   config_path 의 YAML 파일을 읽어 GatewayConfig 로 파싱한다.
    //   파일 없음, 파싱 오류, 스키마/검증 오류 모두 실패.
    [[nodiscard]] static std::expected<GatewayConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   YAML 문자열에서 로드한다. source_name 은 오류 메시지에만 쓰인다.
    [[nodiscard]] static std::expected<GatewayConfig, std::string>
    load_from_string(std::string_view yaml_text, std::string_view source_name = "<string>");

    // parse_security_config_type
    //   "Annotation" | "Map" | "RequestmapInstances" (대소문자 무관)
    [[nodiscard]] static std::expected<SecurityConfigType, std::string>
    parse_security_config_type(std::string_view text);
};

[[nodiscard]] std::string_view to_string(SecurityConfigType type) noexcept;
