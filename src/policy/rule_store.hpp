#pragma once

// ---------------------------------------------------------------------------
// rule_store.hpp
//
// 동적 규칙(requestmap) 저장소 인터페이스와 인메모리 구현.
//
// [책임 경계]
// - 영속화/트랜잭션은 저장소 구현 소관이다.
// - 저장소는 변경을 스스로 통지하지 않는다. 변경이 확정된 뒤 호출자가
//   DynamicStoreSource::invalidate() 를 호출해야 이후 해석에 반영된다.
// - 저장소에 접근할 수 없으면 kSourceUnavailable 오류를 반환한다.
//   빈 목록으로 대체하지 않는다 (전체 허용/전체 거부 모두 위험).
//
// [config_attribute 형식]
// "ROLE_A,ROLE_B" 처럼 콤마로 구분된 토큰 목록, 또는 표현식 1개.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/types.hpp"

struct StoredRule {
    std::uint64_t id{0};                // 저장소가 부여. add() 입력에서는 무시
    std::string   pattern{};
    std::string   config_attribute{};
    std::string   http_method{};        // 빈 문자열 = 모든 메서드
};

// ---------------------------------------------------------------------------
// RuleStore
//   모든 메서드는 여러 스레드에서 호출될 수 있다. 구현은 스레드 안전해야 한다.
// ---------------------------------------------------------------------------
class RuleStore {
public:
    virtual ~RuleStore() = default;

    // id 오름차순 (등록 순서) 으로 반환한다.
    [[nodiscard]] virtual std::expected<std::vector<StoredRule>, PolicyError> load_all() const = 0;

    [[nodiscard]] virtual std::expected<std::uint64_t, PolicyError> add(const StoredRule& rule) = 0;

    [[nodiscard]] virtual std::expected<void, PolicyError> update(const StoredRule& rule) = 0;

    [[nodiscard]] virtual std::expected<void, PolicyError> remove(std::uint64_t id) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryRuleStore
//   데몬과 테스트에서 쓰는 프로세스 내 저장소.
//   id 는 1 부터 단조 증가하며 재사용하지 않는다.
// ---------------------------------------------------------------------------
class InMemoryRuleStore final : public RuleStore {
public:
    InMemoryRuleStore()  = default;
    ~InMemoryRuleStore() override = default;

    // 복사/이동 금지 (mutex 소유)
    InMemoryRuleStore(const InMemoryRuleStore&)            = delete;
    InMemoryRuleStore& operator=(const InMemoryRuleStore&) = delete;

    [[nodiscard]] std::expected<std::vector<StoredRule>, PolicyError> load_all() const override;
    [[nodiscard]] std::expected<std::uint64_t, PolicyError> add(const StoredRule& rule) override;
    [[nodiscard]] std::expected<void, PolicyError> update(const StoredRule& rule) override;
    [[nodiscard]] std::expected<void, PolicyError> remove(std::uint64_t id) override;

private:
    mutable std::mutex                   mutex_;
    std::map<std::uint64_t, StoredRule>  rows_;
    std::uint64_t                        next_id_{1};
};
