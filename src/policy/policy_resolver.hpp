#pragma once

// ---------------------------------------------------------------------------
// policy_resolver.hpp
//
// (method, path) 요청을 캐시된 규칙 목록에 대조해 PolicyDecision 을 만드는 파사드.
//
// [fail-close 원칙]
// 1. 일치 규칙 없음 → LockdownEnforcer 판정 (기본값 kDeniedNoRule)
// 2. 규칙 소스 오류 → PolicyError 전파. 이전 스냅샷이나 빈 목록으로
//    대체하지 않는다. 허용/거부 어느 쪽으로도 조용히 넘어가지 않는다.
// 3. authorize(): 평가기가 없거나 평가 중 예외 → kDenied
//
// [first-match-wins]
// CompiledRuleSet 은 구체성 순으로 정렬되어 있으므로 최댓값을 찾지 않고
// 첫 번째 일치 규칙에서 멈춘다.
//
// [경로 정규화]
// - '?' 또는 '#' 이후는 잘라낸다.
// - 소문자 정규화된 소스의 규칙은 소문자 경로로, static-declaration 규칙은
//   원본 경로로 비교한다.
//
// [스레드 안전성]
// resolve/authorize 는 concurrent 호출 안전. 취득한 스냅샷은 호출이
// 끝날 때까지 수명이 유지된다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "policy/access_evaluator.hpp"
#include "policy/rule.hpp"
#include "policy/rule_cache.hpp"
#include "stats/stats_collector.hpp"

// ---------------------------------------------------------------------------
// AuthorizationOutcome / AuthorizationResult
//   authorize() 의 최종 결과. decision 은 판정 근거 (감사 로그용).
// ---------------------------------------------------------------------------
enum class AuthorizationOutcome : std::uint8_t {
    kGranted            = 0,
    kDenied             = 1,  // 권한 부족 또는 kDeniedNoRule
    kConfigurationError = 2,  // kConfigurationErrorNoRule
};

struct AuthorizationResult {
    AuthorizationOutcome outcome{AuthorizationOutcome::kDenied};  // 기본값 거부
    PolicyDecision       decision{};
};

// 응답 상태 코드 매핑: kMatched 200, kDeniedNoRule 403, kConfigurationErrorNoRule 500
[[nodiscard]] int http_status_for(const PolicyDecision& decision) noexcept;
[[nodiscard]] int http_status_for(const AuthorizationResult& result) noexcept;

[[nodiscard]] std::string_view to_string(DecisionKind kind) noexcept;
[[nodiscard]] std::string_view to_string(AuthorizationOutcome outcome) noexcept;

class PolicyResolver {
public:
    // cache 는 필수. evaluator/stats/logger 는 선택 (nullptr 허용).
    // cache 가 nullptr 이면 std::invalid_argument.
    explicit PolicyResolver(std::shared_ptr<RuleCache>             cache,
                            std::shared_ptr<const AccessEvaluator> evaluator = nullptr,
                            std::shared_ptr<StatsCollector>        stats     = nullptr,
                            std::shared_ptr<StructuredLogger>      logger    = nullptr);

    ~PolicyResolver() = default;

    PolicyResolver(const PolicyResolver&)            = delete;
    PolicyResolver& operator=(const PolicyResolver&) = delete;

    // resolve
    //   kMatched / kDeniedNoRule / kConfigurationErrorNoRule 은 값으로 반환한다.
    //   규칙 소스 오류만 PolicyError 로 반환한다.
    [[nodiscard]] std::expected<PolicyDecision, PolicyError>
    resolve(HttpMethod method, std::string_view path, const LockdownPolicy& lockdown) const;

    // authorize
    //   resolve() 후 kMatched 의 요구 조건을 caller 에 대해 평가한다.
    [[nodiscard]] std::expected<AuthorizationResult, PolicyError>
    authorize(HttpMethod            method,
              std::string_view      path,
              const CallerContext&  caller,
              const LockdownPolicy& lockdown) const;

    // clear_cached_rules
    //   동적 저장소 변경 확정 후 호출하는 무효화 진입점.
    void clear_cached_rules() noexcept;

    // 현재 컴파일된 규칙 목록 (필요하면 재구성). 제어 소켓 "rules" 명령용.
    [[nodiscard]] std::expected<CompiledRuleSetPtr, PolicyError> compiled_rules() const;

private:
    // 판정 + 감사 로그 상관용 요청 id
    struct ResolvedRequest {
        PolicyDecision decision{};
        std::uint64_t  request_id{0};
    };

    [[nodiscard]] std::expected<ResolvedRequest, PolicyError>
    resolve_for(HttpMethod            method,
                std::string_view      path,
                const LockdownPolicy& lockdown,
                std::string_view      principal) const;

    std::shared_ptr<RuleCache>             cache_;
    std::shared_ptr<const AccessEvaluator> evaluator_;
    std::shared_ptr<StatsCollector>        stats_;
    std::shared_ptr<StructuredLogger>      logger_;

    mutable std::atomic<std::uint64_t> next_request_id_{1};
};
