#include "policy/access_evaluator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

AuthorityAccessEvaluator::AuthorityAccessEvaluator(ExpressionEvaluator expression_evaluator)
    : expression_evaluator_(std::move(expression_evaluator)) {}

bool AuthorityAccessEvaluator::evaluate(const AccessRequirement& requirement,
                                        const CallerContext&     caller) const {
    if (requirement.kind == AccessRequirement::Kind::kExpression) {
        if (!expression_evaluator_) {
            spdlog::warn("access_evaluator: no expression evaluator configured, denying '{}' "
                         "(fail-close)", requirement.expression);
            return false;
        }
        try {
            return expression_evaluator_(requirement.expression, caller);
        } catch (const std::exception& e) {
            spdlog::error("access_evaluator: expression '{}' failed, denying (fail-close): {}",
                          requirement.expression, e.what());
            return false;
        }
    }

    if (requirement.authorities.empty()) {
        return true;
    }
    return std::any_of(requirement.authorities.begin(), requirement.authorities.end(),
                       [&caller](const std::string& token) { return satisfies_token(token, caller); });
}

bool AuthorityAccessEvaluator::satisfies_token(std::string_view token, const CallerContext& caller) {
    if (token == kAnyAuthenticatedAnonymous) {
        return true;
    }
    if (token == kAnyAuthenticatedRemembered) {
        return caller.level == AuthenticationLevel::kRemembered ||
               caller.level == AuthenticationLevel::kFull;
    }
    if (token == kAnyAuthenticatedFull) {
        return caller.level == AuthenticationLevel::kFull;
    }
    return std::find(caller.authorities.begin(), caller.authorities.end(), token) !=
           caller.authorities.end();
}
