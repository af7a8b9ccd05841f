// ---------------------------------------------------------------------------
// rule_source.cpp
//
// [정규화 규칙]
// - StaticDeclarationSource: 패턴 대소문자 보존 (구조적으로 생성된 경로).
// - ConfigMapSource / DynamicStoreSource: 패턴 소문자화 후 검증.
// - access 값은 make_access_requirement 로 집합 정규화.
// - http_method 는 대소문자 무관. 알 수 없는 메서드는 kConfiguration 오류.
//
// [저장소 예외]
// RuleStore 구현이 예외를 던지면 kSourceUnavailable 로 변환한다.
// 이전 스냅샷이나 빈 목록으로 대체하지 않는다.
// ---------------------------------------------------------------------------

#include "policy/rule_source.hpp"

#include "matcher/ant_path_matcher.hpp"

#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

std::string describe_entry(const RuleEntry& entry) {
    return fmt::format("pattern='{}' access=[{}] http_method='{}'",
                       entry.pattern, fmt::join(entry.access, ","), entry.http_method);
}

// 엔트리 목록 전체를 검증. 첫 번째 오류에서 중단 (all-or-nothing).
std::expected<std::vector<Rule>, PolicyError>
make_rules(const std::vector<RuleEntry>& entries, bool lowercase_pattern) {
    std::vector<Rule> rules;
    rules.reserve(entries.size());
    for (const auto& entry : entries) {
        auto rule = make_rule(entry, lowercase_pattern);
        if (!rule) {
            return std::unexpected(std::move(rule.error()));
        }
        rules.push_back(std::move(*rule));
    }
    return rules;
}

StoredRule to_stored(std::uint64_t id, const RuleEntry& entry) {
    StoredRule row{};
    row.id               = id;
    row.pattern          = entry.pattern;
    row.config_attribute = fmt::format("{}", fmt::join(entry.access, ","));
    row.http_method      = entry.http_method;
    return row;
}

PolicyError unavailable(std::string_view operation, std::string_view what) {
    return PolicyError{
        PolicyErrorCode::kSourceUnavailable,
        fmt::format("rule store {} failed: {}", operation, what),
        "dynamic-store",
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// make_rule
// ---------------------------------------------------------------------------
std::expected<Rule, PolicyError> make_rule(const RuleEntry& entry, bool lowercase_pattern) {
    Rule rule{};
    rule.pattern = lowercase_pattern ? to_lower_ascii(entry.pattern) : entry.pattern;

    if (auto valid = AntPathMatcher::validate(rule.pattern); !valid) {
        PolicyError err = std::move(valid.error());
        err.context = describe_entry(entry);
        return std::unexpected(std::move(err));
    }

    if (!entry.http_method.empty()) {
        const auto method = parse_http_method(entry.http_method);
        if (!method) {
            return std::unexpected(PolicyError{
                PolicyErrorCode::kConfiguration,
                fmt::format("unknown http_method '{}'", entry.http_method),
                describe_entry(entry),
            });
        }
        rule.http_method = *method;
    }

    auto access = make_access_requirement(entry.access);
    if (!access) {
        PolicyError err = std::move(access.error());
        err.context = describe_entry(entry);
        return std::unexpected(std::move(err));
    }
    rule.access = std::move(*access);
    return rule;
}

// ---------------------------------------------------------------------------
// StaticDeclarationSource
// ---------------------------------------------------------------------------
StaticDeclarationSource::StaticDeclarationSource(PassKey /*key*/, std::vector<Rule> rules)
    : rules_(std::move(rules)) {}

std::expected<std::shared_ptr<StaticDeclarationSource>, PolicyError>
StaticDeclarationSource::create(std::vector<Rule> rules) {
    for (const auto& rule : rules) {
        if (auto valid = AntPathMatcher::validate(rule.pattern); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
        if (rule.access.kind == AccessRequirement::Kind::kExpression && rule.access.expression.empty()) {
            return std::unexpected(PolicyError{
                PolicyErrorCode::kConfiguration,
                "declared rule has an empty access expression",
                rule.pattern,
            });
        }
    }
    spdlog::info("rule_source: static-declaration source created with {} rules", rules.size());
    return std::make_shared<StaticDeclarationSource>(PassKey{}, std::move(rules));
}

std::expected<std::shared_ptr<StaticDeclarationSource>, PolicyError>
StaticDeclarationSource::from_entries(const std::vector<RuleEntry>& entries) {
    auto rules = make_rules(entries, /*lowercase_pattern=*/false);
    if (!rules) {
        return std::unexpected(std::move(rules.error()));
    }
    return create(std::move(*rules));
}

std::expected<std::vector<Rule>, PolicyError> StaticDeclarationSource::list_rules() const {
    return rules_;
}

// ---------------------------------------------------------------------------
// ConfigMapSource
// ---------------------------------------------------------------------------
ConfigMapSource::ConfigMapSource(PassKey /*key*/, std::vector<Rule> rules)
    : rules_(std::move(rules)) {}

std::expected<std::shared_ptr<ConfigMapSource>, PolicyError>
ConfigMapSource::create(const std::vector<RuleEntry>& entries) {
    auto rules = make_rules(entries, /*lowercase_pattern=*/true);
    if (!rules) {
        return std::unexpected(std::move(rules.error()));
    }
    spdlog::info("rule_source: config-map source created with {} rules", rules->size());
    return std::make_shared<ConfigMapSource>(PassKey{}, std::move(*rules));
}

std::expected<std::vector<Rule>, PolicyError> ConfigMapSource::list_rules() const {
    return rules_;
}

// ---------------------------------------------------------------------------
// DynamicStoreSource
// ---------------------------------------------------------------------------
DynamicStoreSource::DynamicStoreSource(std::shared_ptr<RuleStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        spdlog::warn("rule_source: dynamic-store source constructed without a store; "
                     "every rebuild will fail with source-unavailable");
    }
}

std::expected<std::vector<Rule>, PolicyError> DynamicStoreSource::list_rules() const {
    if (!store_) {
        return std::unexpected(unavailable("load", "no store configured"));
    }

    std::expected<std::vector<StoredRule>, PolicyError> rows;
    try {
        rows = store_->load_all();
    } catch (const std::exception& e) {
        return std::unexpected(unavailable("load", e.what()));
    }
    if (!rows) {
        return std::unexpected(std::move(rows.error()));
    }

    std::vector<Rule> rules;
    rules.reserve(rows->size());
    for (const auto& row : *rows) {
        RuleEntry entry{};
        entry.pattern     = row.pattern;
        entry.access      = split_config_attribute(row.config_attribute);
        entry.http_method = row.http_method;

        auto rule = make_rule(entry, /*lowercase_pattern=*/true);
        if (!rule) {
            PolicyError err = std::move(rule.error());
            err.context = fmt::format("requestmap id={} {}", row.id, err.context);
            return std::unexpected(std::move(err));
        }
        rules.push_back(std::move(*rule));
    }
    return rules;
}

void DynamicStoreSource::set_invalidation_listener(InvalidationListener listener) {
    const std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

std::expected<std::uint64_t, PolicyError> DynamicStoreSource::add_rule(const RuleEntry& entry) {
    if (auto rule = make_rule(entry, /*lowercase_pattern=*/true); !rule) {
        return std::unexpected(std::move(rule.error()));
    }
    if (!store_) {
        return std::unexpected(unavailable("add", "no store configured"));
    }
    try {
        return store_->add(to_stored(0, entry));
    } catch (const std::exception& e) {
        return std::unexpected(unavailable("add", e.what()));
    }
}

std::expected<void, PolicyError>
DynamicStoreSource::update_rule(std::uint64_t id, const RuleEntry& entry) {
    if (auto rule = make_rule(entry, /*lowercase_pattern=*/true); !rule) {
        return std::unexpected(std::move(rule.error()));
    }
    if (!store_) {
        return std::unexpected(unavailable("update", "no store configured"));
    }
    try {
        return store_->update(to_stored(id, entry));
    } catch (const std::exception& e) {
        return std::unexpected(unavailable("update", e.what()));
    }
}

std::expected<void, PolicyError> DynamicStoreSource::remove_rule(std::uint64_t id) {
    if (!store_) {
        return std::unexpected(unavailable("remove", "no store configured"));
    }
    try {
        return store_->remove(id);
    } catch (const std::exception& e) {
        return std::unexpected(unavailable("remove", e.what()));
    }
}

// 리스너 호출 동안 listener_mutex_ 를 잡고 있어야 RuleCache 소멸자
// (set_invalidation_listener({}))가 진행 중인 호출이 끝날 때까지 기다린다.
// 리스너는 세대 카운터만 올리며 이 소스로 다시 들어오지 않는다.
void DynamicStoreSource::invalidate() {
    const std::lock_guard<std::mutex> lock(listener_mutex_);
    if (!listener_) {
        spdlog::debug("rule_source: invalidate() called but no cache is listening");
        return;
    }
    listener_();
}
