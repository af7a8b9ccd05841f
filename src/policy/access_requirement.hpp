#pragma once

// ---------------------------------------------------------------------------
// access_requirement.hpp
//
// 규칙이 요구하는 접근 조건 표현.
//
// 두 가지 형태 중 하나만 가진다.
//   kAuthorities : 권한 토큰 집합 (역할 이름 + 예약 토큰). 하나라도 만족하면 통과.
//   kExpression  : 외부 평가기에 위임되는 불리언 표현식 문자열 1개.
//
// 예약 토큰은 동치 표현식이 정해져 있으나 코어는 번역하지 않고
// 원문 그대로 저장한다. 번역은 평가기 책임이다.
//   ANY_AUTHENTICATED_ANONYMOUS  == permitAll
//   ANY_AUTHENTICATED_REMEMBERED == isAuthenticated() or isRememberMe()
//   ANY_AUTHENTICATED_FULL       == isFullyAuthenticated()
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

inline constexpr std::string_view kAnyAuthenticatedAnonymous  = "ANY_AUTHENTICATED_ANONYMOUS";
inline constexpr std::string_view kAnyAuthenticatedRemembered = "ANY_AUTHENTICATED_REMEMBERED";
inline constexpr std::string_view kAnyAuthenticatedFull       = "ANY_AUTHENTICATED_FULL";

struct AccessRequirement {
    enum class Kind : std::uint8_t {
        kAuthorities = 0,
        kExpression  = 1,
    };

    Kind                     kind{Kind::kAuthorities};
    std::vector<std::string> authorities{};  // 정렬 + 중복 제거된 토큰 집합
    std::string              expression{};   // kExpression 일 때만 사용

    // 요구 조건 없음 (공개 접근). lockdown 해제 시 암묵적 허용에 사용.
    [[nodiscard]] bool is_unrestricted() const noexcept {
        return kind == Kind::kAuthorities && authorities.empty();
    }

    // 로그/제어 소켓 출력용 표현. 예: "[ROLE_ADMIN,ROLE_USER]", "isAuthenticated()"
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] static AccessRequirement unrestricted() { return AccessRequirement{}; }

    [[nodiscard]] friend bool operator==(const AccessRequirement&, const AccessRequirement&) = default;
};

// is_authority_token
//   [A-Za-z0-9_]+ 이면 권한 토큰, 그 외는 표현식으로 분류한다.
//   단 "permitAll", "denyAll" 은 괄호 없는 표현식이다.
[[nodiscard]] bool is_authority_token(std::string_view value) noexcept;

[[nodiscard]] bool is_reserved_token(std::string_view value) noexcept;

// make_access_requirement
//   설정에서 읽은 access 값 목록을 AccessRequirement 로 정규화한다.
//
//   - 모든 값이 토큰이면 kAuthorities (정렬 + 중복 제거)
//   - 값이 정확히 1개이고 표현식이면 kExpression
//   - 빈 목록, 빈 문자열, 토큰/표현식 혼합, 표현식 2개 이상 → kConfiguration 오류
[[nodiscard]] std::expected<AccessRequirement, PolicyError>
make_access_requirement(const std::vector<std::string>& values);

// split_config_attribute
//   저장소 행의 "ROLE_A, ROLE_B" 형식 문자열을 값 목록으로 분리한다.
//   괄호가 있으면 표현식으로 보고 분리하지 않는다 (hasAnyRole('A','B') 보호).
[[nodiscard]] std::vector<std::string> split_config_attribute(std::string_view raw);
