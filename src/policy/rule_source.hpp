#pragma once

// ---------------------------------------------------------------------------
// rule_source.hpp
//
// 규칙 제공자 인터페이스와 세 가지 구현.
//
//   StaticDeclarationSource : 선언 수집기가 만든 규칙. 대소문자 보존, 읽기 전용.
//   ConfigMapSource         : 설정 {pattern, access, http_method} 목록. 소문자 정규화.
//   DynamicStoreSource      : RuleStore 에서 읽는 변경 가능한 규칙. 소문자 정규화.
//
// RuleCache 와 PolicyResolver 는 RuleSource 인터페이스에만 의존한다.
//
// [오류 처리]
// - 정적 소스는 생성 시점(create)에 패턴/메서드/access 를 검증하고
//   문제가 된 엔트리를 context 에 담아 실패한다.
// - 동적 소스는 list_rules() 시점에 검증한다. 저장소 접근 실패는
//   kSourceUnavailable 로 전파된다.
//
// [순환 의존성]
// rule_source.hpp → rule.hpp, rule_store.hpp (단방향)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "policy/rule.hpp"
#include "policy/rule_store.hpp"

// make_rule
//   RuleEntry 하나를 검증하고 Rule 로 정규화한다.
//   lowercase_pattern == true 이면 패턴을 소문자로 바꾼 뒤 검증한다.
[[nodiscard]] std::expected<Rule, PolicyError>
make_rule(const RuleEntry& entry, bool lowercase_pattern);

class RuleSource {
public:
    using InvalidationListener = std::function<void()>;

    virtual ~RuleSource() = default;

    // 선언 순서대로 규칙을 반환한다.
    [[nodiscard]] virtual std::expected<std::vector<Rule>, PolicyError> list_rules() const = 0;

    [[nodiscard]] virtual bool supports_live_invalidation() const noexcept = 0;

    [[nodiscard]] virtual RuleSourceKind kind() const noexcept = 0;

    // 로그 식별용 이름
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // 규칙 패턴이 소문자로 정규화되어 있으면 true.
    // PolicyResolver 는 이 경우 요청 경로도 소문자로 바꿔 비교한다.
    [[nodiscard]] bool lowercases_patterns() const noexcept {
        return kind() != RuleSourceKind::kStaticDeclaration;
    }

    // RuleCache 가 등록한다. 라이브 무효화를 지원하지 않는 소스는 무시한다.
    virtual void set_invalidation_listener(InvalidationListener /*listener*/) {}
};

// ---------------------------------------------------------------------------
// StaticDeclarationSource
// ---------------------------------------------------------------------------
class StaticDeclarationSource final : public RuleSource {
    struct PassKey {
        explicit PassKey() = default;
    };

public:
    [[nodiscard]] static std::expected<std::shared_ptr<StaticDeclarationSource>, PolicyError>
    create(std::vector<Rule> rules);

    // 설정 파일의 annotations 섹션처럼 RuleEntry 로 전달된 경우.
    // 패턴 대소문자는 보존한다.
    [[nodiscard]] static std::expected<std::shared_ptr<StaticDeclarationSource>, PolicyError>
    from_entries(const std::vector<RuleEntry>& entries);

    [[nodiscard]] std::expected<std::vector<Rule>, PolicyError> list_rules() const override;
    [[nodiscard]] bool supports_live_invalidation() const noexcept override { return false; }
    [[nodiscard]] RuleSourceKind kind() const noexcept override {
        return RuleSourceKind::kStaticDeclaration;
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "static-declaration"; }

    // create() 를 거쳐야만 만들 수 있다 (make_shared 용 passkey)
    StaticDeclarationSource(PassKey key, std::vector<Rule> rules);

private:
    const std::vector<Rule> rules_;
};

// ---------------------------------------------------------------------------
// ConfigMapSource
//   static_rules / intercept_url_map 엔트리에서 만든다.
// ---------------------------------------------------------------------------
class ConfigMapSource final : public RuleSource {
    struct PassKey {
        explicit PassKey() = default;
    };

public:
    [[nodiscard]] static std::expected<std::shared_ptr<ConfigMapSource>, PolicyError>
    create(const std::vector<RuleEntry>& entries);

    [[nodiscard]] std::expected<std::vector<Rule>, PolicyError> list_rules() const override;
    [[nodiscard]] bool supports_live_invalidation() const noexcept override { return false; }
    [[nodiscard]] RuleSourceKind kind() const noexcept override { return RuleSourceKind::kConfigMap; }
    [[nodiscard]] std::string_view name() const noexcept override { return "config-map"; }

    // create() 를 거쳐야만 만들 수 있다 (make_shared 용 passkey)
    ConfigMapSource(PassKey key, std::vector<Rule> rules);

private:
    const std::vector<Rule> rules_;
};

// ---------------------------------------------------------------------------
// DynamicStoreSource
//
//   [무효화 계약]
//   add_rule/update_rule/remove_rule 은 저장소만 변경한다.
//   호출자는 변경이 확정된 뒤 invalidate() 를 호출해야 한다.
//   invalidate() 이후 시작된 해석은 변경을 관찰한다 (read-your-writes).
// ---------------------------------------------------------------------------
class DynamicStoreSource final : public RuleSource {
public:
    explicit DynamicStoreSource(std::shared_ptr<RuleStore> store);

    [[nodiscard]] std::expected<std::vector<Rule>, PolicyError> list_rules() const override;
    [[nodiscard]] bool supports_live_invalidation() const noexcept override { return true; }
    [[nodiscard]] RuleSourceKind kind() const noexcept override { return RuleSourceKind::kDynamicStore; }
    [[nodiscard]] std::string_view name() const noexcept override { return "dynamic-store"; }

    void set_invalidation_listener(InvalidationListener listener) override;

    // 저장 전에 패턴/메서드/access 를 검증한다. 잘못된 행은 저장하지 않는다.
    [[nodiscard]] std::expected<std::uint64_t, PolicyError> add_rule(const RuleEntry& entry);
    [[nodiscard]] std::expected<void, PolicyError> update_rule(std::uint64_t id, const RuleEntry& entry);
    [[nodiscard]] std::expected<void, PolicyError> remove_rule(std::uint64_t id);

    // 등록된 리스너(RuleCache)에 캐시 무효화를 통지한다.
    void invalidate();

private:
    std::shared_ptr<RuleStore> store_;

    mutable std::mutex   listener_mutex_;
    InvalidationListener listener_{};
};
