#pragma once

// ---------------------------------------------------------------------------
// access_evaluator.hpp
//
// 일치한 규칙의 접근 요구 조건을 호출자 컨텍스트에 대해 평가한다.
//
// [책임 경계]
// - 인증은 외부 소관. 코어는 이미 식별된 CallerContext 를 받는다.
// - 표현식 언어는 구현하지 않는다. kExpression 요구 조건은 주입된
//   ExpressionEvaluator 에 원문 그대로 위임한다.
//
// [fail-close]
// - ExpressionEvaluator 가 없거나 예외를 던지면 false (거부).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "policy/access_requirement.hpp"

// ---------------------------------------------------------------------------
// AuthenticationLevel
//   kRemembered: 영속 로그인(remember-me) 쿠키로 인증됨
//   kFull      : 이번 세션에서 명시적으로 로그인함
// ---------------------------------------------------------------------------
enum class AuthenticationLevel : std::uint8_t {
    kAnonymous  = 0,
    kRemembered = 1,
    kFull       = 2,
};

struct CallerContext {
    std::string              principal{};    // 로그용 식별자 (익명이면 빈 문자열)
    std::vector<std::string> authorities{};  // 부여된 역할 목록
    AuthenticationLevel      level{AuthenticationLevel::kAnonymous};
};

class AccessEvaluator {
public:
    virtual ~AccessEvaluator() = default;

    [[nodiscard]] virtual bool evaluate(const AccessRequirement& requirement,
                                        const CallerContext&     caller) const = 0;
};

// ---------------------------------------------------------------------------
// AuthorityAccessEvaluator
//   권한 토큰 집합: 토큰 중 하나라도 만족하면 통과 (any-of).
//     ANY_AUTHENTICATED_ANONYMOUS  : 항상 만족
//     ANY_AUTHENTICATED_REMEMBERED : kRemembered 또는 kFull
//     ANY_AUTHENTICATED_FULL       : kFull
//     그 외                        : authorities 에 포함
//   표현식: ExpressionEvaluator 위임.
// ---------------------------------------------------------------------------
class AuthorityAccessEvaluator final : public AccessEvaluator {
public:
    using ExpressionEvaluator =
        std::function<bool(std::string_view expression, const CallerContext& caller)>;

    explicit AuthorityAccessEvaluator(ExpressionEvaluator expression_evaluator = {});

    [[nodiscard]] bool evaluate(const AccessRequirement& requirement,
                                const CallerContext&     caller) const override;

private:
    [[nodiscard]] static bool satisfies_token(std::string_view token, const CallerContext& caller);

    ExpressionEvaluator expression_evaluator_;
};
