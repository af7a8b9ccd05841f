#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 정책 해석 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_decision / on_source_failure / on_rebuild:
//   요청 처리 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   조회 경로(제어 소켓)에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 판정 경로로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

#include "policy/rule.hpp"  // DecisionKind

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rejection_rate: (denied_no_rule + config_error_no_rule) / total_resolutions
//                   (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_resolutions{0};
    std::uint64_t                              matched{0};
    std::uint64_t                              denied_no_rule{0};
    std::uint64_t                              config_error_no_rule{0};
    std::uint64_t                              access_denied{0};
    std::uint64_t                              source_failures{0};
    std::uint64_t                              rebuilds{0};
    double                                     rejection_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept = default;
    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_decision
    //   resolve() 가 판정 값을 반환할 때마다 호출.
    void on_decision(DecisionKind kind) noexcept {
        total_resolutions_.fetch_add(1, std::memory_order_relaxed);
        switch (kind) {
            case DecisionKind::kMatched:
                matched_.fetch_add(1, std::memory_order_relaxed);
                break;
            case DecisionKind::kDeniedNoRule:
                denied_no_rule_.fetch_add(1, std::memory_order_relaxed);
                break;
            case DecisionKind::kConfigurationErrorNoRule:
                config_error_no_rule_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    // on_access_denied
    //   규칙은 일치했으나 호출자 권한이 요구 조건을 만족하지 못한 경우.
    void on_access_denied() noexcept {
        access_denied_.fetch_add(1, std::memory_order_relaxed);
    }

    // on_source_failure
    //   스냅샷 재구성 중 소스 오류 (SourceUnavailable 등).
    void on_source_failure() noexcept {
        source_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_rebuild() noexcept {
        rebuilds_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total    = total_resolutions_.load(std::memory_order_relaxed);
        const auto denied   = denied_no_rule_.load(std::memory_order_relaxed);
        const auto conf_err = config_error_no_rule_.load(std::memory_order_relaxed);

        double rejection_rate = 0.0;
        if (total > 0) {
            rejection_rate = static_cast<double>(denied + conf_err) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_resolutions    = total,
            .matched              = matched_.load(std::memory_order_relaxed),
            .denied_no_rule       = denied,
            .config_error_no_rule = conf_err,
            .access_denied        = access_denied_.load(std::memory_order_relaxed),
            .source_failures      = source_failures_.load(std::memory_order_relaxed),
            .rebuilds             = rebuilds_.load(std::memory_order_relaxed),
            .rejection_rate       = rejection_rate,
            .captured_at          = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_resolutions_{0};
    std::atomic<std::uint64_t> matched_{0};
    std::atomic<std::uint64_t> denied_no_rule_{0};
    std::atomic<std::uint64_t> config_error_no_rule_{0};
    std::atomic<std::uint64_t> access_denied_{0};
    std::atomic<std::uint64_t> source_failures_{0};
    std::atomic<std::uint64_t> rebuilds_{0};
};
