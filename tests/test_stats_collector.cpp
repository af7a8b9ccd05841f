// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - on_decision: 판정 종류별 카운터 + total_resolutions
// - on_access_denied / on_source_failure / on_rebuild
// - snapshot(): rejection_rate 계산, total == 0 이면 0.0
// - ConcurrentAccess: 멀티스레드 동시성 (data race 미발생 확인)
//
// [알려진 한계]
// - rejection_rate 부동소수점 비교는 EXPECT_NEAR 으로 허용 오차 1e-9 이내.
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// InitialState_AllZero
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_resolutions,    0u) << "total_resolutions must be 0 at init";
    EXPECT_EQ(snap.matched,              0u);
    EXPECT_EQ(snap.denied_no_rule,       0u);
    EXPECT_EQ(snap.config_error_no_rule, 0u);
    EXPECT_EQ(snap.access_denied,        0u);
    EXPECT_EQ(snap.source_failures,      0u);
    EXPECT_EQ(snap.rebuilds,             0u);
    EXPECT_NEAR(snap.rejection_rate, 0.0, 1e-9) << "rejection_rate must be 0.0 at init";
}

// ---------------------------------------------------------------------------
// OnDecision_CountsPerKind
//   판정 종류별 카운터는 각자 증가하고 total 은 모두 합산한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnDecision_CountsPerKind) {
    StatsCollector stats;

    stats.on_decision(DecisionKind::kMatched);
    stats.on_decision(DecisionKind::kMatched);
    stats.on_decision(DecisionKind::kDeniedNoRule);
    stats.on_decision(DecisionKind::kConfigurationErrorNoRule);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_resolutions,    4u);
    EXPECT_EQ(snap.matched,              2u);
    EXPECT_EQ(snap.denied_no_rule,       1u);
    EXPECT_EQ(snap.config_error_no_rule, 1u);
}

// ---------------------------------------------------------------------------
// RejectionRate_CountsBothNoRuleOutcomes
//   (denied_no_rule + config_error_no_rule) / total
//   access_denied 는 규칙이 일치한 경우라 rejection_rate 에 포함하지 않는다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, RejectionRate_CountsBothNoRuleOutcomes) {
    StatsCollector stats;

    stats.on_decision(DecisionKind::kMatched);
    stats.on_decision(DecisionKind::kMatched);
    stats.on_decision(DecisionKind::kDeniedNoRule);
    stats.on_decision(DecisionKind::kConfigurationErrorNoRule);
    stats.on_access_denied();

    const auto snap = stats.snapshot();
    EXPECT_NEAR(snap.rejection_rate, 0.5, 1e-9);
    EXPECT_EQ(snap.access_denied, 1u);
    EXPECT_EQ(snap.total_resolutions, 4u) << "on_access_denied must not count as a resolution";
}

TEST(StatsCollector, RebuildAndSourceFailureCounters) {
    StatsCollector stats;

    stats.on_rebuild();
    stats.on_rebuild();
    stats.on_source_failure();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.rebuilds,        2u);
    EXPECT_EQ(snap.source_failures, 1u);
    EXPECT_EQ(snap.total_resolutions, 0u);
}

TEST(StatsCollector, Snapshot_CapturedAtIsSet) {
    StatsCollector stats;
    const auto before = std::chrono::system_clock::now();
    const auto snap   = stats.snapshot();
    EXPECT_GE(snap.captured_at, before);
}

// ---------------------------------------------------------------------------
// ConcurrentAccess_NoDataRace
//   여러 스레드에서 동시에 on_decision / snapshot 을 호출해도 안전해야 한다.
//   TSan 빌드에서 data race 가 보고되면 안 된다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess_NoDataRace) {
    StatsCollector stats;

    constexpr int kWriterThreads = 4;
    constexpr int kOpsPerThread  = 1000;

    std::vector<std::thread> writers;
    writers.reserve(static_cast<std::size_t>(kWriterThreads));

    for (int i = 0; i < kWriterThreads; ++i) {
        writers.emplace_back([&stats]() {
            for (int j = 0; j < kOpsPerThread; ++j) {
                // 홀짝 교번: 절반 일치, 절반 규칙 없음
                stats.on_decision(j % 2 == 0 ? DecisionKind::kMatched : DecisionKind::kDeniedNoRule);
            }
        });
    }

    std::atomic<bool> stop_reader{false};
    std::thread reader([&stats, &stop_reader]() {
        while (!stop_reader.load(std::memory_order_relaxed)) {
            const auto snap = stats.snapshot();
            EXPECT_GE(snap.rejection_rate, 0.0);
        }
    });

    for (auto& t : writers) { t.join(); }
    stop_reader.store(true, std::memory_order_relaxed);
    reader.join();

    const auto snap = stats.snapshot();
    const auto expected_total =
        static_cast<std::uint64_t>(kWriterThreads) *
        static_cast<std::uint64_t>(kOpsPerThread);

    EXPECT_EQ(snap.total_resolutions, expected_total)
        << "total_resolutions must equal kWriterThreads * kOpsPerThread";
    EXPECT_EQ(snap.matched + snap.denied_no_rule, expected_total);
    EXPECT_NEAR(snap.rejection_rate, 0.5, 1e-9)
        << "rejection_rate should be exactly 0.5 with alternating match/deny";
}
