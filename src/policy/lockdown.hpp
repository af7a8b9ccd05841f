#pragma once

// ---------------------------------------------------------------------------
// lockdown.hpp
//
// 일치 규칙이 없는 요청의 판정.
//
//   reject_if_no_rule | reject_public_invocations | 결과
//   ------------------+---------------------------+---------------------------
//   true              | (무시)                    | kDeniedNoRule
//   false             | true                      | kConfigurationErrorNoRule
//   false             | false                     | kMatched (요구 조건 없음)
//
// 두 플래그가 모두 true 인 것은 오류가 아니다. reject_if_no_rule 이
// 조용히 우선한다 (기본값이 둘 다 true).
//
// 두 불리언만의 순수 함수이며 상태가 없다.
// ---------------------------------------------------------------------------

#include "policy/rule.hpp"

class LockdownEnforcer {
public:
    [[nodiscard]] static PolicyDecision decide(const LockdownPolicy& policy);
};
