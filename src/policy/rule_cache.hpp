#pragma once

// ---------------------------------------------------------------------------
// rule_cache.hpp
//
// 활성 규칙 소스를 하나의 구체성 정렬 목록(CompiledRuleSet)으로 병합하고
// 메모이즈한다.
//
// [스냅샷 발행]
// CompiledRuleSet 은 발행 후 변경되지 않는다. 새 스냅샷은
// std::atomic<std::shared_ptr<const CompiledRuleSet>> 교체로 원자적으로 발행되며,
// 이미 스냅샷을 취득한 해석은 이전 스냅샷의 수명을 유지한 채 완료된다.
//
// [무효화]
// invalidate() 는 세대(generation) 카운터만 증가시킨다. 재구성은 다음
// current() 호출자가 지연 수행한다.
// 스냅샷은 자신을 만든 세대를 기록한다. 재구성 도중 invalidate() 가 들어오면
// 새 스냅샷도 즉시 stale 이 되어 다음 호출에서 다시 재구성된다.
// 따라서 invalidate() 반환 이후 시작된 current() 는 반드시 변경을 관찰한다.
//
// [single-flight]
// 재구성은 build_mutex_ 아래에서 한 번에 하나만 수행된다.
// 최신 스냅샷을 가진 호출은 락을 잡지 않는다. stale 스냅샷을 본 호출만
// 진행 중인 재구성을 기다린 뒤 그 결과를 공유한다.
// snapshot() 은 재구성을 기다리지 않고 마지막 발행본을 즉시 반환한다.
//
// [정렬]
// 1. 리터럴 접두사 길이 내림차순
// 2. 와일드카드 세그먼트 수 오름차순
// 3. 소스 종류 (static-declaration < config-map < dynamic-store)
// 4. 소스 등록 순서, 소스 내 선언 순서 (안정 정렬로 보존)
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <vector>

#include "matcher/ant_path_matcher.hpp"
#include "policy/rule.hpp"
#include "policy/rule_source.hpp"
#include "stats/stats_collector.hpp"

// ---------------------------------------------------------------------------
// CompiledRule
//   정렬 키와 출처 정보를 함께 보관한다.
//   lowercase_path: 요청 경로를 소문자로 바꿔 비교해야 하는지
// ---------------------------------------------------------------------------
struct CompiledRule {
    Rule           rule{};
    SpecificityKey specificity{};
    RuleSourceKind source_kind{RuleSourceKind::kStaticDeclaration};
    std::size_t    source_index{0};
    std::size_t    position{0};
    bool           lowercase_path{false};
};

struct CompiledRuleSet {
    std::vector<CompiledRule>              rules{};
    std::uint64_t                          generation{0};
    std::chrono::system_clock::time_point  built_at{};
};

using CompiledRuleSetPtr = std::shared_ptr<const CompiledRuleSet>;

class RuleCache {
public:
    // sources 는 등록 순서대로 전달한다. nullptr 원소는 무시한다.
    // 라이브 무효화를 지원하는 소스에는 이 캐시를 리스너로 등록한다.
    explicit RuleCache(std::vector<std::shared_ptr<RuleSource>> sources,
                       std::shared_ptr<StatsCollector>          stats = nullptr);

    // 소스에 등록한 리스너를 해제한다 (dangling this 방지).
    ~RuleCache();

    // 복사/이동 금지 (리스너가 this 를 캡처)
    RuleCache(const RuleCache&)            = delete;
    RuleCache& operator=(const RuleCache&) = delete;
    RuleCache(RuleCache&&)                 = delete;
    RuleCache& operator=(RuleCache&&)      = delete;

    // current
    //   최신 스냅샷을 반환한다. 최초 호출이거나 무효화 이후면 재구성한다.
    //   소스 오류(kSourceUnavailable 등)는 그대로 전파한다.
    //   이전 스냅샷을 stale 상태로 대신 반환하지 않는다.
    [[nodiscard]] std::expected<CompiledRuleSetPtr, PolicyError> current();

    // invalidate
    //   stale 표시만 한다. 재구성은 다음 current() 에서.
    void invalidate() noexcept;

    // snapshot
    //   마지막으로 발행된 스냅샷 (없으면 nullptr). 재구성하지 않는다.
    [[nodiscard]] CompiledRuleSetPtr snapshot() const noexcept;

    [[nodiscard]] std::uint64_t generation() const noexcept;

    [[nodiscard]] std::size_t source_count() const noexcept { return sources_.size(); }

private:
    [[nodiscard]] std::expected<CompiledRuleSetPtr, PolicyError> build(std::uint64_t generation) const;

    const std::vector<std::shared_ptr<RuleSource>> sources_;
    std::shared_ptr<StatsCollector>                stats_;

    std::atomic<std::shared_ptr<const CompiledRuleSet>> snapshot_;
    std::atomic<std::uint64_t>                          generation_{1};
    std::mutex                                          build_mutex_;
};
