// ---------------------------------------------------------------------------
// test_access_evaluator.cpp
//
// AuthorityAccessEvaluator 단위 테스트.
//
// [테스트 범위]
// - 예약 토큰별 인증 수준 요구
// - 역할 토큰 any-of 의미
// - 표현식 위임, 평가기 부재/예외 시 fail-close
// ---------------------------------------------------------------------------

#include "policy/access_evaluator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

AccessRequirement tokens(std::vector<std::string> values) {
    AccessRequirement req{};
    req.kind        = AccessRequirement::Kind::kAuthorities;
    req.authorities = std::move(values);
    return req;
}

AccessRequirement expression(std::string text) {
    AccessRequirement req{};
    req.kind       = AccessRequirement::Kind::kExpression;
    req.expression = std::move(text);
    return req;
}

CallerContext caller(AuthenticationLevel level, std::vector<std::string> authorities = {}) {
    CallerContext ctx{};
    ctx.principal   = level == AuthenticationLevel::kAnonymous ? "" : "alice";
    ctx.authorities = std::move(authorities);
    ctx.level       = level;
    return ctx;
}

}  // namespace

TEST(AccessEvaluator, AnyAuthenticatedAnonymous_AdmitsEveryone) {
    const AuthorityAccessEvaluator evaluator;
    const auto req = tokens({"ANY_AUTHENTICATED_ANONYMOUS"});

    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kAnonymous)));
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kRemembered)));
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kFull)));
}

TEST(AccessEvaluator, AnyAuthenticatedRemembered_RequiresLogin) {
    const AuthorityAccessEvaluator evaluator;
    const auto req = tokens({"ANY_AUTHENTICATED_REMEMBERED"});

    EXPECT_FALSE(evaluator.evaluate(req, caller(AuthenticationLevel::kAnonymous)));
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kRemembered)));
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kFull)));
}

TEST(AccessEvaluator, AnyAuthenticatedFull_RejectsRememberMe) {
    const AuthorityAccessEvaluator evaluator;
    const auto req = tokens({"ANY_AUTHENTICATED_FULL"});

    EXPECT_FALSE(evaluator.evaluate(req, caller(AuthenticationLevel::kAnonymous)));
    EXPECT_FALSE(evaluator.evaluate(req, caller(AuthenticationLevel::kRemembered)));
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kFull)));
}

TEST(AccessEvaluator, RoleTokens_AnyOfSemantics) {
    const AuthorityAccessEvaluator evaluator;
    const auto req = tokens({"ROLE_ADMIN", "ROLE_AUDITOR"});

    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kFull, {"ROLE_AUDITOR"})));
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kFull, {"ROLE_USER", "ROLE_ADMIN"})));
    EXPECT_FALSE(evaluator.evaluate(req, caller(AuthenticationLevel::kFull, {"ROLE_USER"})));
    EXPECT_FALSE(evaluator.evaluate(req, caller(AuthenticationLevel::kAnonymous)));
}

TEST(AccessEvaluator, EmptyAuthoritySet_IsPublic) {
    const AuthorityAccessEvaluator evaluator;
    EXPECT_TRUE(evaluator.evaluate(AccessRequirement::unrestricted(),
                                   caller(AuthenticationLevel::kAnonymous)));
}

TEST(AccessEvaluator, Expression_IsDelegatedVerbatim) {
    std::string seen;
    const AuthorityAccessEvaluator evaluator(
        [&seen](std::string_view expr, const CallerContext& ctx) {
            seen = std::string(expr);
            return ctx.level != AuthenticationLevel::kAnonymous;
        });

    const auto req = expression("isAuthenticated()");
    EXPECT_TRUE(evaluator.evaluate(req, caller(AuthenticationLevel::kRemembered)));
    EXPECT_EQ(seen, "isAuthenticated()");
    EXPECT_FALSE(evaluator.evaluate(req, caller(AuthenticationLevel::kAnonymous)));
}

TEST(AccessEvaluator, Expression_WithoutEvaluator_Denies) {
    const AuthorityAccessEvaluator evaluator;
    EXPECT_FALSE(evaluator.evaluate(expression("permitAll"), caller(AuthenticationLevel::kFull)));
}

TEST(AccessEvaluator, Expression_EvaluatorThrows_Denies) {
    const AuthorityAccessEvaluator evaluator(
        [](std::string_view, const CallerContext&) -> bool {
            throw std::runtime_error("parse error");
        });
    EXPECT_FALSE(evaluator.evaluate(expression("hasRole("), caller(AuthenticationLevel::kFull)));
}
