// ---------------------------------------------------------------------------
// rule_cache.cpp
//
// [재구성 알고리즘]
// 1. 세대 번호 target 을 먼저 읽는다.
// 2. 등록 순서대로 각 소스의 list_rules() 를 수집한다. 하나라도 실패하면
//    전체 실패 (부분 스냅샷을 발행하지 않는다).
// 3. CompiledRule 로 변환 후 (specificity, source_kind) 기준 안정 정렬.
// 4. target 세대로 태그한 스냅샷을 원자적으로 발행한다.
//
// 재구성은 소스 출력에 대해 순수 함수다. 발행된 스냅샷 포인터 외에
// 재구성 간에 유지되는 상태는 없다.
// ---------------------------------------------------------------------------

#include "policy/rule_cache.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::vector<std::shared_ptr<RuleSource>> drop_null(std::vector<std::shared_ptr<RuleSource>> sources) {
    std::erase_if(sources, [](const auto& source) { return source == nullptr; });
    return sources;
}

}  // namespace

RuleCache::RuleCache(std::vector<std::shared_ptr<RuleSource>> sources,
                     std::shared_ptr<StatsCollector>          stats)
    : sources_(drop_null(std::move(sources)))
    , stats_(std::move(stats)) {
    for (const auto& source : sources_) {
        if (source->supports_live_invalidation()) {
            source->set_invalidation_listener([this]() { invalidate(); });
        }
    }
    spdlog::info("rule_cache: initialized with {} rule sources", sources_.size());
}

RuleCache::~RuleCache() {
    for (const auto& source : sources_) {
        if (source->supports_live_invalidation()) {
            source->set_invalidation_listener({});
        }
    }
}

std::expected<CompiledRuleSetPtr, PolicyError> RuleCache::current() {
    // fast path: 최신 스냅샷이면 락 없이 반환
    auto published = snapshot_.load(std::memory_order_acquire);
    if (published && published->generation == generation_.load(std::memory_order_acquire)) {
        return published;
    }

    const std::lock_guard<std::mutex> lock(build_mutex_);

    // 대기하는 동안 다른 호출자가 재구성을 끝냈을 수 있다
    const auto target = generation_.load(std::memory_order_acquire);
    published = snapshot_.load(std::memory_order_acquire);
    if (published && published->generation == target) {
        return published;
    }

    auto built = build(target);
    if (!built) {
        if (stats_) {
            stats_->on_source_failure();
        }
        spdlog::error("rule_cache: rebuild for generation {} failed ({}): {} [{}]",
                      target, to_string(built.error().code),
                      built.error().message, built.error().context);
        return std::unexpected(std::move(built.error()));
    }

    snapshot_.store(*built, std::memory_order_release);
    if (stats_) {
        stats_->on_rebuild();
    }
    spdlog::info("rule_cache: published generation {} with {} rules",
                 target, (*built)->rules.size());
    return *built;
}

void RuleCache::invalidate() noexcept {
    const auto next = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    spdlog::debug("rule_cache: invalidated, generation is now {}", next);
}

CompiledRuleSetPtr RuleCache::snapshot() const noexcept {
    return snapshot_.load(std::memory_order_acquire);
}

std::uint64_t RuleCache::generation() const noexcept {
    return generation_.load(std::memory_order_acquire);
}

std::expected<CompiledRuleSetPtr, PolicyError> RuleCache::build(std::uint64_t generation) const {
    auto compiled = std::make_shared<CompiledRuleSet>();
    compiled->generation = generation;

    for (std::size_t index = 0; index < sources_.size(); ++index) {
        const auto& source = sources_[index];
        auto rules = source->list_rules();
        if (!rules) {
            PolicyError err = std::move(rules.error());
            err.context = fmt::format("source#{} {}: {}", index, source->name(), err.context);
            return std::unexpected(std::move(err));
        }

        const bool lowercase = source->lowercases_patterns();
        for (std::size_t position = 0; position < rules->size(); ++position) {
            auto& rule = (*rules)[position];
            CompiledRule entry{};
            entry.specificity    = AntPathMatcher::specificity(rule.pattern);
            entry.source_kind    = source->kind();
            entry.source_index   = index;
            entry.position       = position;
            entry.lowercase_path = lowercase;
            entry.rule           = std::move(rule);
            compiled->rules.push_back(std::move(entry));
        }
    }

    std::stable_sort(compiled->rules.begin(), compiled->rules.end(),
                     [](const CompiledRule& a, const CompiledRule& b) {
                         if (a.specificity < b.specificity) {
                             return true;
                         }
                         if (b.specificity < a.specificity) {
                             return false;
                         }
                         return a.source_kind < b.source_kind;
                     });

    compiled->built_at = std::chrono::system_clock::now();
    return CompiledRuleSetPtr{std::move(compiled)};
}
