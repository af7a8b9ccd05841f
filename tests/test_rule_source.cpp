// ---------------------------------------------------------------------------
// test_rule_source.cpp
//
// RuleSource 세 가지 구현 + InMemoryRuleStore 단위 테스트.
//
// [테스트 범위]
// - 정적 소스: 대소문자 보존 / 소문자 정규화, 잘못된 엔트리 거부
// - 동적 소스: CRUD, 저장 전 검증, 저장소에 직접 들어간 잘못된 행
// - 저장소 장애 (예외, 누락) → kSourceUnavailable
// - 무효화 리스너 호출, 리스너 해제와의 경합
// ---------------------------------------------------------------------------

#include "policy/rule_cache.hpp"
#include "policy/rule_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

RuleEntry entry(std::string pattern, std::vector<std::string> access, std::string method = "") {
    RuleEntry e{};
    e.pattern     = std::move(pattern);
    e.access      = std::move(access);
    e.http_method = std::move(method);
    return e;
}

// load_all() 에서 예외를 던지는 저장소 (DB 연결 끊김 모사)
class ThrowingRuleStore final : public RuleStore {
public:
    std::expected<std::vector<StoredRule>, PolicyError> load_all() const override {
        throw std::runtime_error("connection refused");
    }
    std::expected<std::uint64_t, PolicyError> add(const StoredRule&) override {
        throw std::runtime_error("connection refused");
    }
    std::expected<void, PolicyError> update(const StoredRule&) override {
        throw std::runtime_error("connection refused");
    }
    std::expected<void, PolicyError> remove(std::uint64_t) override {
        throw std::runtime_error("connection refused");
    }
};

}  // namespace

// ===========================================================================
// make_rule
// ===========================================================================

TEST(MakeRule, NormalizesPatternAndMethod) {
    const auto rule = make_rule(entry("/Admin/**", {"ROLE_ADMIN"}, "post"), true);
    ASSERT_TRUE(rule.has_value()) << rule.error().message;
    EXPECT_EQ(rule->pattern, "/admin/**");
    ASSERT_TRUE(rule->http_method.has_value());
    EXPECT_EQ(*rule->http_method, HttpMethod::kPost);
}

TEST(MakeRule, PreservesCaseWhenAsked) {
    const auto rule = make_rule(entry("/Book/show", {"ROLE_USER"}), false);
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->pattern, "/Book/show");
    EXPECT_FALSE(rule->http_method.has_value());
}

TEST(MakeRule, UnknownMethod_IsConfigurationError) {
    const auto rule = make_rule(entry("/a", {"ROLE_A"}, "FETCH"), true);
    ASSERT_FALSE(rule.has_value());
    EXPECT_EQ(rule.error().code, PolicyErrorCode::kConfiguration);
    EXPECT_NE(rule.error().context.find("/a"), std::string::npos);
}

TEST(MakeRule, InvalidPattern_CarriesOffendingEntry) {
    const auto rule = make_rule(entry("admin/**", {"ROLE_A"}), true);
    ASSERT_FALSE(rule.has_value());
    EXPECT_EQ(rule.error().code, PolicyErrorCode::kInvalidPattern);
    EXPECT_NE(rule.error().context.find("admin/**"), std::string::npos);
}

// ===========================================================================
// StaticDeclarationSource / ConfigMapSource
// ===========================================================================

TEST(StaticDeclarationSource, FromEntries_PreservesCase) {
    const auto source = StaticDeclarationSource::from_entries({
        entry("/Book/show", {"ROLE_USER"}),
        entry("/Book/**", {"ROLE_ADMIN"}),
    });
    ASSERT_TRUE(source.has_value()) << source.error().message;

    const auto rules = (*source)->list_rules();
    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 2u);
    EXPECT_EQ((*rules)[0].pattern, "/Book/show");
    EXPECT_EQ((*rules)[1].pattern, "/Book/**");

    EXPECT_EQ((*source)->kind(), RuleSourceKind::kStaticDeclaration);
    EXPECT_FALSE((*source)->supports_live_invalidation());
    EXPECT_FALSE((*source)->lowercases_patterns());
}

TEST(StaticDeclarationSource, Create_RejectsInvalidPattern) {
    Rule rule{};
    rule.pattern = "no-slash";
    const auto source = StaticDeclarationSource::create({rule});
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, PolicyErrorCode::kInvalidPattern);
}

TEST(ConfigMapSource, LowercasesPatterns_KeepsDeclarationOrder) {
    const auto source = ConfigMapSource::create({
        entry("/Assets/**", {"permitAll"}),
        entry("/LOGIN/**", {"permitAll"}),
        entry("/", {"permitAll"}),
    });
    ASSERT_TRUE(source.has_value());

    const auto rules = (*source)->list_rules();
    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 3u);
    EXPECT_EQ((*rules)[0].pattern, "/assets/**");
    EXPECT_EQ((*rules)[1].pattern, "/login/**");
    EXPECT_EQ((*rules)[2].pattern, "/");

    EXPECT_EQ((*source)->kind(), RuleSourceKind::kConfigMap);
    EXPECT_TRUE((*source)->lowercases_patterns());
    EXPECT_EQ((*source)->name(), "config-map");
}

TEST(ConfigMapSource, OneBadEntry_FailsWholeSource) {
    const auto source = ConfigMapSource::create({
        entry("/ok", {"ROLE_A"}),
        entry("/mixed", {"ROLE_A", "isAuthenticated()"}),
    });
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, PolicyErrorCode::kConfiguration);
    EXPECT_NE(source.error().context.find("/mixed"), std::string::npos);
}

TEST(ConfigMapSource, EmptyEntries_IsValid) {
    const auto source = ConfigMapSource::create({});
    ASSERT_TRUE(source.has_value());
    const auto rules = (*source)->list_rules();
    ASSERT_TRUE(rules.has_value());
    EXPECT_TRUE(rules->empty());
}

// ===========================================================================
// InMemoryRuleStore
// ===========================================================================

TEST(InMemoryRuleStore, IdsStartAtOneAndIncrease) {
    InMemoryRuleStore store;
    const auto first  = store.add(StoredRule{0, "/a", "ROLE_A", ""});
    const auto second = store.add(StoredRule{0, "/b", "ROLE_B", ""});
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, 1u);
    EXPECT_EQ(*second, 2u);

    const auto rows = store.load_all();
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2u);
    EXPECT_EQ((*rows)[0].pattern, "/a");
    EXPECT_EQ((*rows)[1].pattern, "/b");
}

TEST(InMemoryRuleStore, UpdateOrRemoveMissingId_Fails) {
    InMemoryRuleStore store;
    EXPECT_FALSE(store.update(StoredRule{42, "/a", "ROLE_A", ""}).has_value());
    const auto removed = store.remove(42);
    ASSERT_FALSE(removed.has_value());
    EXPECT_NE(removed.error().message.find("42"), std::string::npos);
}

// ===========================================================================
// DynamicStoreSource
// ===========================================================================

TEST(DynamicStoreSource, AddUpdateRemove_AreVisibleInListRules) {
    auto store = std::make_shared<InMemoryRuleStore>();
    DynamicStoreSource source(store);

    const auto id = source.add_rule(entry("/Admin/**", {"ROLE_ADMIN", "ROLE_ROOT"}));
    ASSERT_TRUE(id.has_value()) << id.error().message;

    auto rules = source.list_rules();
    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 1u);
    EXPECT_EQ((*rules)[0].pattern, "/admin/**");
    EXPECT_EQ((*rules)[0].access.describe(), "[ROLE_ADMIN,ROLE_ROOT]");

    ASSERT_TRUE(source.update_rule(*id, entry("/admin/**", {"isAuthenticated()"}, "GET")).has_value());
    rules = source.list_rules();
    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 1u);
    EXPECT_EQ((*rules)[0].access.expression, "isAuthenticated()");
    ASSERT_TRUE((*rules)[0].http_method.has_value());
    EXPECT_EQ(*(*rules)[0].http_method, HttpMethod::kGet);

    ASSERT_TRUE(source.remove_rule(*id).has_value());
    rules = source.list_rules();
    ASSERT_TRUE(rules.has_value());
    EXPECT_TRUE(rules->empty());
}

TEST(DynamicStoreSource, AddRule_RejectsInvalidEntryBeforeStoring) {
    auto store = std::make_shared<InMemoryRuleStore>();
    DynamicStoreSource source(store);

    const auto id = source.add_rule(entry("no-slash", {"ROLE_A"}));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, PolicyErrorCode::kInvalidPattern);

    const auto rows = store->load_all();
    ASSERT_TRUE(rows.has_value());
    EXPECT_TRUE(rows->empty()) << "잘못된 행은 저장소에 들어가면 안 된다";
}

TEST(DynamicStoreSource, InvalidStoredRow_FailsWithRowId) {
    auto store = std::make_shared<InMemoryRuleStore>();
    // 다른 관리 도구가 검증 없이 직접 넣은 행
    ASSERT_TRUE(store->add(StoredRule{0, "/ok", "ROLE_A", ""}).has_value());
    ASSERT_TRUE(store->add(StoredRule{0, "bad-pattern", "ROLE_A", ""}).has_value());

    DynamicStoreSource source(store);
    const auto rules = source.list_rules();
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().code, PolicyErrorCode::kInvalidPattern);
    EXPECT_EQ(rules.error().context.rfind("requestmap id=2", 0), 0u) << rules.error().context;
}

TEST(DynamicStoreSource, ConfigAttribute_ExpressionIsNotSplit) {
    auto store = std::make_shared<InMemoryRuleStore>();
    ASSERT_TRUE(store->add(StoredRule{0, "/reports/**", "hasAnyRole('A','B')", ""}).has_value());

    DynamicStoreSource source(store);
    const auto rules = source.list_rules();
    ASSERT_TRUE(rules.has_value()) << rules.error().message;
    ASSERT_EQ(rules->size(), 1u);
    EXPECT_EQ((*rules)[0].access.kind, AccessRequirement::Kind::kExpression);
    EXPECT_EQ((*rules)[0].access.expression, "hasAnyRole('A','B')");
}

TEST(DynamicStoreSource, ThrowingStore_IsSourceUnavailable) {
    DynamicStoreSource source(std::make_shared<ThrowingRuleStore>());

    const auto rules = source.list_rules();
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().code, PolicyErrorCode::kSourceUnavailable);
    EXPECT_NE(rules.error().message.find("connection refused"), std::string::npos);

    const auto id = source.add_rule(entry("/a", {"ROLE_A"}));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, PolicyErrorCode::kSourceUnavailable);
}

TEST(DynamicStoreSource, NullStore_IsSourceUnavailable) {
    DynamicStoreSource source(nullptr);
    const auto rules = source.list_rules();
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().code, PolicyErrorCode::kSourceUnavailable);
    EXPECT_FALSE(source.remove_rule(1).has_value());
}

TEST(DynamicStoreSource, Invalidate_CallsListener) {
    DynamicStoreSource source(std::make_shared<InMemoryRuleStore>());
    EXPECT_TRUE(source.supports_live_invalidation());
    EXPECT_EQ(source.kind(), RuleSourceKind::kDynamicStore);
    EXPECT_TRUE(source.lowercases_patterns());

    // 리스너 없이 호출해도 안전
    source.invalidate();

    int calls = 0;
    source.set_invalidation_listener([&calls]() { ++calls; });
    source.invalidate();
    source.invalidate();
    EXPECT_EQ(calls, 2);

    source.set_invalidation_listener({});
    source.invalidate();
    EXPECT_EQ(calls, 2);
}

// ---------------------------------------------------------------------------
// Invalidate_ListenerRemovalWaitsForRunningCall
//   리스너를 해제하는 쪽(RuleCache 소멸자)은 진행 중인 리스너 호출이 끝날
//   때까지 기다려야 한다. 그렇지 않으면 소멸된 캐시의 this 를 호출하게 된다.
// ---------------------------------------------------------------------------
TEST(DynamicStoreSource, Invalidate_ListenerRemovalWaitsForRunningCall) {
    DynamicStoreSource source(std::make_shared<InMemoryRuleStore>());

    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    source.set_invalidation_listener([&entered, &finished]() {
        entered.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        finished.store(true);
    });

    std::thread notifier([&source]() { source.invalidate(); });
    while (!entered.load()) {
        std::this_thread::yield();
    }

    source.set_invalidation_listener({});
    EXPECT_TRUE(finished.load()) << "listener removal returned while the listener was still running";

    notifier.join();
}

TEST(DynamicStoreSource, Invalidate_ConcurrentWithCacheTeardown) {
    auto source = std::make_shared<DynamicStoreSource>(std::make_shared<InMemoryRuleStore>());

    std::atomic<bool> stop{false};
    std::thread notifier([&source, &stop]() {
        while (!stop.load(std::memory_order_relaxed)) {
            source->invalidate();
        }
    });

    for (int i = 0; i < 200; ++i) {
        RuleCache cache(std::vector<std::shared_ptr<RuleSource>>{source});
        EXPECT_GE(cache.generation(), 1u);
    }

    stop.store(true, std::memory_order_relaxed);
    notifier.join();
}

// create() 밖에서는 정적 소스를 만들 수 없다 (검증 우회 방지)
TEST(ConfigMapSource, ConstructibleOnlyThroughCreate) {
    static_assert(!std::is_constructible_v<ConfigMapSource, std::vector<Rule>>);
    static_assert(!std::is_constructible_v<StaticDeclarationSource, std::vector<Rule>>);

    const auto source = ConfigMapSource::create({entry("/a", {"ROLE_A"})});
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ((*source).use_count(), 1);
}
