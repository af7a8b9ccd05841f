// ---------------------------------------------------------------------------
// policy_resolver.cpp
//
// [해석 순서]
// 1. cache_->current() 로 스냅샷 취득 (오류면 그대로 반환)
// 2. 경로에서 쿼리/프래그먼트 제거
// 3. 정렬된 규칙을 순서대로 스캔, 메서드 → 패턴 순으로 비교
// 4. 첫 일치 → kMatched(requirement)
// 5. 일치 없음 → LockdownEnforcer::decide()
//
// 소문자 경로는 필요한 규칙을 처음 만났을 때 한 번만 만든다.
// ---------------------------------------------------------------------------

#include "policy/policy_resolver.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "matcher/ant_path_matcher.hpp"
#include "policy/lockdown.hpp"

namespace {

std::string_view strip_query(std::string_view path) noexcept {
    const auto cut = path.find_first_of("?#");
    if (cut == std::string_view::npos) {
        return path;
    }
    return path.substr(0, cut);
}

}  // namespace

int http_status_for(const PolicyDecision& decision) noexcept {
    switch (decision.kind) {
        case DecisionKind::kMatched:
            return 200;
        case DecisionKind::kDeniedNoRule:
            return 403;
        case DecisionKind::kConfigurationErrorNoRule:
            return 500;
    }
    return 403;
}

int http_status_for(const AuthorizationResult& result) noexcept {
    switch (result.outcome) {
        case AuthorizationOutcome::kGranted:
            return 200;
        case AuthorizationOutcome::kDenied:
            return 403;
        case AuthorizationOutcome::kConfigurationError:
            return 500;
    }
    return 403;
}

std::string_view to_string(DecisionKind kind) noexcept {
    switch (kind) {
        case DecisionKind::kMatched:                  return "matched";
        case DecisionKind::kDeniedNoRule:             return "denied-no-rule";
        case DecisionKind::kConfigurationErrorNoRule: return "configuration-error-no-rule";
    }
    return "unknown";
}

std::string_view to_string(AuthorizationOutcome outcome) noexcept {
    switch (outcome) {
        case AuthorizationOutcome::kGranted:            return "granted";
        case AuthorizationOutcome::kDenied:             return "denied";
        case AuthorizationOutcome::kConfigurationError: return "configuration-error";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PolicyResolver
// ---------------------------------------------------------------------------
PolicyResolver::PolicyResolver(std::shared_ptr<RuleCache>             cache,
                               std::shared_ptr<const AccessEvaluator> evaluator,
                               std::shared_ptr<StatsCollector>        stats,
                               std::shared_ptr<StructuredLogger>      logger)
    : cache_(std::move(cache))
    , evaluator_(std::move(evaluator))
    , stats_(std::move(stats))
    , logger_(std::move(logger)) {
    if (!cache_) {
        throw std::invalid_argument("PolicyResolver requires a RuleCache");
    }
}

std::expected<PolicyDecision, PolicyError>
PolicyResolver::resolve(HttpMethod method, std::string_view path, const LockdownPolicy& lockdown) const {
    auto resolved = resolve_for(method, path, lockdown, {});
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }
    return std::move(resolved->decision);
}

std::expected<PolicyResolver::ResolvedRequest, PolicyError>
PolicyResolver::resolve_for(HttpMethod            method,
                            std::string_view      path,
                            const LockdownPolicy& lockdown,
                            std::string_view      principal) const {
    const auto started = std::chrono::steady_clock::now();

    auto compiled = cache_->current();
    if (!compiled) {
        spdlog::error("policy_resolver: no rule set for {} {}: {}",
                      to_string(method), strip_query(path), compiled.error().message);
        return std::unexpected(compiled.error());
    }
    const CompiledRuleSetPtr rules = std::move(*compiled);

    const std::string_view   raw_path = strip_query(path);
    std::optional<std::string> lowered_path;

    PolicyDecision decision{};
    bool           found = false;
    for (const auto& entry : rules->rules) {
        if (entry.rule.http_method && *entry.rule.http_method != method) {
            continue;
        }
        std::string_view candidate = raw_path;
        if (entry.lowercase_path) {
            if (!lowered_path) {
                lowered_path = to_lower_ascii(raw_path);
            }
            candidate = *lowered_path;
        }
        if (AntPathMatcher::match(entry.rule.pattern, candidate)) {
            decision.kind            = DecisionKind::kMatched;
            decision.requirement     = entry.rule.access;
            decision.matched_pattern = entry.rule.pattern;
            found = true;
            break;
        }
    }

    if (!found) {
        decision = LockdownEnforcer::decide(lockdown);
    }

    if (stats_) {
        stats_->on_decision(decision.kind);
    }

    const auto request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("policy_resolver: #{} {} {} -> {} (pattern='{}', generation={})",
                  request_id, to_string(method), raw_path, to_string(decision.kind),
                  decision.matched_pattern, rules->generation);

    if (logger_) {
        const auto now = std::chrono::system_clock::now();
        if (decision.kind == DecisionKind::kMatched) {
            DecisionLog entry{};
            entry.request_id      = request_id;
            entry.method          = std::string(to_string(method));
            entry.path            = std::string(raw_path);
            entry.principal       = std::string(principal);
            entry.decision_raw    = static_cast<std::uint8_t>(decision.kind);
            entry.matched_pattern = decision.matched_pattern;
            entry.requirement     = decision.requirement.describe();
            entry.timestamp       = now;
            entry.duration        = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - started);
            logger_->log_decision(entry);
        } else {
            RejectionLog entry{};
            entry.request_id   = request_id;
            entry.method       = std::string(to_string(method));
            entry.path         = std::string(raw_path);
            entry.principal    = std::string(principal);
            entry.decision_raw = static_cast<std::uint8_t>(decision.kind);
            entry.reason       = decision.kind == DecisionKind::kDeniedNoRule
                                     ? "no rule matched (reject_if_no_rule)"
                                     : "no rule matched (reject_public_invocations)";
            entry.timestamp    = now;
            logger_->log_rejection(entry);
        }
    }

    return ResolvedRequest{std::move(decision), request_id};
}

std::expected<AuthorizationResult, PolicyError>
PolicyResolver::authorize(HttpMethod            method,
                          std::string_view      path,
                          const CallerContext&  caller,
                          const LockdownPolicy& lockdown) const {
    auto resolved = resolve_for(method, path, lockdown, caller.principal);
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }

    AuthorizationResult result{};
    result.decision = std::move(resolved->decision);

    switch (result.decision.kind) {
        case DecisionKind::kDeniedNoRule:
            result.outcome = AuthorizationOutcome::kDenied;
            return result;
        case DecisionKind::kConfigurationErrorNoRule:
            result.outcome = AuthorizationOutcome::kConfigurationError;
            return result;
        case DecisionKind::kMatched:
            break;
    }

    bool granted = false;
    if (result.decision.requirement.is_unrestricted()) {
        granted = true;
    } else if (evaluator_) {
        granted = evaluator_->evaluate(result.decision.requirement, caller);
    } else {
        spdlog::warn("policy_resolver: no access evaluator configured, denying '{}' (fail-close)",
                     result.decision.requirement.describe());
    }

    result.outcome = granted ? AuthorizationOutcome::kGranted : AuthorizationOutcome::kDenied;
    if (!granted) {
        if (stats_) {
            stats_->on_access_denied();
        }
        if (logger_) {
            RejectionLog entry{};
            entry.request_id   = resolved->request_id;
            entry.method       = std::string(to_string(method));
            entry.path         = std::string(strip_query(path));
            entry.principal    = caller.principal;
            entry.decision_raw = static_cast<std::uint8_t>(result.decision.kind);
            entry.reason       = "requirement not satisfied: " + result.decision.requirement.describe();
            entry.timestamp    = std::chrono::system_clock::now();
            logger_->log_rejection(entry);
        }
    }
    return result;
}

void PolicyResolver::clear_cached_rules() noexcept {
    cache_->invalidate();
}

std::expected<CompiledRuleSetPtr, PolicyError> PolicyResolver::compiled_rules() const {
    return cache_->current();
}
