#include "policy/lockdown.hpp"

PolicyDecision LockdownEnforcer::decide(const LockdownPolicy& policy) {
    if (policy.reject_if_no_rule) {
        return PolicyDecision{DecisionKind::kDeniedNoRule, {}, {}};
    }
    if (policy.reject_public_invocations) {
        return PolicyDecision{DecisionKind::kConfigurationErrorNoRule, {}, {}};
    }
    // 공개 접근: 요구 조건 없는 암묵적 일치
    return PolicyDecision{DecisionKind::kMatched, AccessRequirement::unrestricted(), {}};
}
