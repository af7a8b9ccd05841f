#include "policy/rule_store.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

PolicyError not_found(std::uint64_t id) {
    return PolicyError{
        PolicyErrorCode::kConfiguration,
        fmt::format("requestmap id {} does not exist", id),
        fmt::format("id={}", id),
    };
}

}  // namespace

std::expected<std::vector<StoredRule>, PolicyError> InMemoryRuleStore::load_all() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredRule> rows;
    rows.reserve(rows_.size());
    for (const auto& [id, row] : rows_) {
        rows.push_back(row);
    }
    return rows;
}

std::expected<std::uint64_t, PolicyError> InMemoryRuleStore::add(const StoredRule& rule) {
    const std::lock_guard<std::mutex> lock(mutex_);
    StoredRule row = rule;
    row.id = next_id_++;
    rows_.emplace(row.id, row);
    spdlog::debug("rule_store: added requestmap id={} pattern='{}'", row.id, row.pattern);
    return row.id;
}

std::expected<void, PolicyError> InMemoryRuleStore::update(const StoredRule& rule) {
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = rows_.find(rule.id);
    if (it == rows_.end()) {
        return std::unexpected(not_found(rule.id));
    }
    it->second = rule;
    spdlog::debug("rule_store: updated requestmap id={} pattern='{}'", rule.id, rule.pattern);
    return {};
}

std::expected<void, PolicyError> InMemoryRuleStore::remove(std::uint64_t id) {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (rows_.erase(id) == 0) {
        return std::unexpected(not_found(id));
    }
    spdlog::debug("rule_store: removed requestmap id={}", id);
    return {};
}
