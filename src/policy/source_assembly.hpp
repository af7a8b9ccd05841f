#pragma once

// ---------------------------------------------------------------------------
// source_assembly.hpp
//
// GatewayConfig 의 security_config_type 에 따라 활성 규칙 소스 목록을 조립한다.
//
//   Annotation          : static-declaration(annotations) + config-map(static_rules)
//   Map                 : config-map(static_rules + intercept_url_map)
//   RequestmapInstances : config-map(static_rules) + dynamic-store(store)
//
// RequestmapInstances 에서는 requestmap 섹션을 store 에 먼저 채운다.
// store 가 nullptr 이면 InMemoryRuleStore 를 만든다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <vector>

#include "policy/rule.hpp"
#include "policy/rule_source.hpp"
#include "policy/rule_store.hpp"

struct AssembledSources {
    std::vector<std::shared_ptr<RuleSource>> sources{};  // 등록 순서
    std::shared_ptr<DynamicStoreSource>      dynamic{};  // RequestmapInstances 일 때만
};

[[nodiscard]] std::expected<AssembledSources, PolicyError>
assemble_rule_sources(const GatewayConfig& config, std::shared_ptr<RuleStore> store = nullptr);
