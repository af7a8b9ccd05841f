#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// HttpMethod
//   규칙이 한정할 수 있는 HTTP 메서드.
//   규칙의 http_method 가 비어 있으면 모든 메서드에 적용된다.
// ---------------------------------------------------------------------------
enum class HttpMethod : std::uint8_t {
    kGet     = 0,
    kPost    = 1,
    kPut     = 2,
    kDelete  = 3,
    kPatch   = 4,
    kHead    = 5,
    kOptions = 6,
    kTrace   = 7,
};

// 대소문자 무관 파싱. 알 수 없는 메서드면 std::nullopt.
[[nodiscard]] std::optional<HttpMethod> parse_http_method(std::string_view text);

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

// ---------------------------------------------------------------------------
// PolicyErrorCode
//   규칙 로드/컴파일/해석 단계에서 발생 가능한 오류 분류.
//   판정 결과(DeniedNoRule 등)는 오류가 아니므로 여기에 포함하지 않는다.
// ---------------------------------------------------------------------------
enum class PolicyErrorCode : std::uint8_t {
    kConfiguration     = 0,  // 설정 충돌 (primary source 중복, 잘못된 access 목록 등)
    kInvalidPattern    = 1,  // Ant 패턴 문법 오류
    kSourceUnavailable = 2,  // 동적 저장소 접근 불가
    kInternalError     = 3,
};

// ---------------------------------------------------------------------------
// PolicyError
//   std::expected<T, PolicyError> 패턴과 함께 사용한다.
//   context: 문제가 된 규칙/엔트리 식별 정보 (로깅용)
// ---------------------------------------------------------------------------
struct PolicyError {
    PolicyErrorCode code{PolicyErrorCode::kInternalError};
    std::string     message{};
    std::string     context{};
};

[[nodiscard]] std::string_view to_string(PolicyErrorCode code) noexcept;

// ASCII 소문자 변환 (패턴/경로 정규화용, 로케일 비의존)
[[nodiscard]] std::string to_lower_ascii(std::string_view text);
