// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 GatewayConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱/검증 실패 시 부분 설정을 반환하지 않는다.
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
// - 선택 필드 누락 시 구조체 기본값을 적용한다.
//
// [규칙 섹션 형식]
//   - pattern: /admin/**          (필수, 스칼라)
//     access: ROLE_ADMIN          (필수, 스칼라 또는 스칼라 목록)
//     http_method: GET            (선택)
//
// [primary 소스 검증]
// security_config_type 은 스칼라 1개. 목록이면 원소가 정확히 1개여야 한다.
// 다른 종류 전용 섹션이 존재하면 (빈 목록 포함) 오류:
//   annotations       → Annotation 전용
//   intercept_url_map → Map 전용
//   requestmap        → RequestmapInstances 전용
// static_rules 는 모든 종류에서 허용된다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "policy/rule_source.hpp"

namespace {

std::unexpected<std::string> fail(std::string err) {
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: lockdown 스위치를 읽는다. 없으면 fallback.
//   값이 있는데 bool 로 해석되지 않으면("flase" 등) 기본값으로 넘어가지 않고
//   키 이름을 담은 오류를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<bool, std::string>
read_switch(const YAML::Node& parent, const char* key, bool fallback) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    bool value = fallback;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        return std::unexpected(fmt::format(
            "'security.{}' must be true or false (got '{}')", key,
            node.IsScalar() ? node.Scalar() : std::string("<non-scalar>")));
    }
    return value;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] bool is_present(const YAML::Node& node) {
    return node && !node.IsNull();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: access 값 (스칼라 또는 스칼라 목록)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<std::string>, std::string>
read_access(const YAML::Node& node) {
    std::vector<std::string> values;
    if (!is_present(node)) {
        return std::unexpected(std::string("'access' is required"));
    }
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }
    if (!node.IsSequence()) {
        return std::unexpected(std::string("'access' must be a string or a list of strings"));
    }
    values.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::unexpected(std::string("'access' list items must be strings"));
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: RuleEntry 1개 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<RuleEntry, std::string>
parse_rule_entry(const YAML::Node& node, std::string_view section, std::size_t index) {
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("{}[{}] is not a map", section, index));
    }

    RuleEntry entry{};
    const YAML::Node pattern = node["pattern"];
    if (!pattern || !pattern.IsScalar()) {
        return std::unexpected(fmt::format("{}[{}]: 'pattern' is required", section, index));
    }
    entry.pattern = pattern.as<std::string>();

    auto access = read_access(node["access"]);
    if (!access) {
        return std::unexpected(fmt::format("{}[{}] ({}): {}", section, index, entry.pattern, access.error()));
    }
    entry.access      = std::move(*access);
    entry.http_method = read_string(node["http_method"], "");
    return entry;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 규칙 섹션 파싱 + 규칙 검증
//   lowercase_pattern: 검증 시 소스와 같은 정규화를 적용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<RuleEntry>, std::string>
parse_rule_section(const YAML::Node& node, std::string_view section, bool lowercase_pattern) {
    std::vector<RuleEntry> entries;
    if (!is_present(node)) {
        return entries;
    }
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format("'{}' must be a list of rules", section));
    }

    entries.reserve(node.size());
    std::size_t index = 0;
    for (const auto& item : node) {
        auto entry = parse_rule_entry(item, section, index);
        if (!entry) {
            return std::unexpected(std::move(entry.error()));
        }
        if (auto rule = make_rule(*entry, lowercase_pattern); !rule) {
            return std::unexpected(fmt::format("{}[{}]: {} ({}) [{}]", section, index,
                                               rule.error().message, to_string(rule.error().code),
                                               rule.error().context));
        }
        entries.push_back(std::move(*entry));
        ++index;
    }
    return entries;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level = read_string(global_node["log_level"], cfg.log_level);
    cfg.log_path  = read_string(global_node["log_path"],  cfg.log_path);
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: SecurityConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<SecurityConfig, std::string>
parse_security(const YAML::Node& security_node) {
    SecurityConfig cfg{};
    if (!security_node || security_node.IsNull()) {
        return cfg;
    }
    if (!security_node.IsMap()) {
        return std::unexpected(std::string("'security' must be a map"));
    }

    const YAML::Node type_node = security_node["security_config_type"];
    if (is_present(type_node)) {
        std::string type_text;
        if (type_node.IsScalar()) {
            type_text = type_node.as<std::string>();
        } else if (type_node.IsSequence()) {
            if (type_node.size() != 1) {
                return std::unexpected(fmt::format(
                    "security_config_type names {} primary rule sources, exactly one is allowed",
                    type_node.size()));
            }
            type_text = type_node[0].as<std::string>();
        } else {
            return std::unexpected(std::string("security_config_type must be a string"));
        }

        auto type = PolicyLoader::parse_security_config_type(type_text);
        if (!type) {
            return std::unexpected(std::move(type.error()));
        }
        cfg.security_config_type = *type;
    }

    auto reject_if_no_rule =
        read_switch(security_node, "reject_if_no_rule", cfg.lockdown.reject_if_no_rule);
    if (!reject_if_no_rule) {
        return std::unexpected(std::move(reject_if_no_rule.error()));
    }
    auto reject_public_invocations =
        read_switch(security_node, "reject_public_invocations", cfg.lockdown.reject_public_invocations);
    if (!reject_public_invocations) {
        return std::unexpected(std::move(reject_public_invocations.error()));
    }
    cfg.lockdown.reject_if_no_rule         = *reject_if_no_rule;
    cfg.lockdown.reject_public_invocations = *reject_public_invocations;
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 루트 노드 → GatewayConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<GatewayConfig, std::string>
parse_root(const YAML::Node& root, std::string_view source_name) {
    if (!root || !root.IsMap()) {
        return fail(fmt::format("policy_loader: '{}' is not a valid YAML map (top-level)", source_name));
    }

    GatewayConfig cfg{};

    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: error parsing 'global' section: {}", e.what()));
    }

    try {
        auto security = parse_security(root["security"]);
        if (!security) {
            return fail(fmt::format("policy_loader: {}", security.error()));
        }
        cfg.security = *security;
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: error parsing 'security' section: {}", e.what()));
    }

    const auto type = cfg.security.security_config_type;

    // 다른 primary 종류 전용 섹션이 함께 있으면 두 종류가 활성화된 것으로 본다
    struct ExclusiveSection {
        const char*        name;
        SecurityConfigType owner;
    };
    constexpr ExclusiveSection kExclusive[] = {
        {"annotations",       SecurityConfigType::kAnnotation},
        {"intercept_url_map", SecurityConfigType::kMap},
        {"requestmap",        SecurityConfigType::kRequestmapInstances},
    };
    for (const auto& section : kExclusive) {
        if (is_present(root[section.name]) && section.owner != type) {
            return fail(fmt::format(
                "policy_loader: '{}' requires security_config_type {} but {} is configured "
                "(only one primary rule source may be enabled)",
                section.name, to_string(section.owner), to_string(type)));
        }
    }

    struct RuleSection {
        const char*             name;
        std::vector<RuleEntry>* target;
        bool                    lowercase;
    };
    const RuleSection sections[] = {
        {"annotations",       &cfg.annotations,       false},
        {"static_rules",      &cfg.static_rules,      true},
        {"intercept_url_map", &cfg.intercept_url_map, true},
        {"requestmap",        &cfg.requestmap,        true},
    };
    for (const auto& section : sections) {
        try {
            auto entries = parse_rule_section(root[section.name], section.name, section.lowercase);
            if (!entries) {
                return fail(fmt::format("policy_loader: {}", entries.error()));
            }
            *section.target = std::move(*entries);
        } catch (const YAML::Exception& e) {
            return fail(fmt::format("policy_loader: error parsing '{}' section: {}", section.name, e.what()));
        }
    }

    spdlog::info(
        "policy_loader: policy loaded successfully - type={}, annotations={}, static_rules={}, "
        "intercept_url_map={}, requestmap={}, reject_if_no_rule={}, reject_public_invocations={}",
        to_string(type), cfg.annotations.size(), cfg.static_rules.size(),
        cfg.intercept_url_map.size(), cfg.requestmap.size(),
        cfg.security.lockdown.reject_if_no_rule, cfg.security.lockdown.reject_public_invocations);

    return cfg;
}

}  // namespace

std::string_view to_string(SecurityConfigType type) noexcept {
    switch (type) {
        case SecurityConfigType::kAnnotation:          return "Annotation";
        case SecurityConfigType::kMap:                 return "Map";
        case SecurityConfigType::kRequestmapInstances: return "RequestmapInstances";
    }
    return "Unknown";
}

std::expected<SecurityConfigType, std::string>
PolicyLoader::parse_security_config_type(std::string_view text) {
    const std::string lower = to_lower_ascii(text);
    if (lower == "annotation") {
        return SecurityConfigType::kAnnotation;
    }
    if (lower == "map") {
        return SecurityConfigType::kMap;
    }
    if (lower == "requestmapinstances") {
        return SecurityConfigType::kRequestmapInstances;
    }
    return std::unexpected(fmt::format(
        "unknown security_config_type '{}' (expected Annotation, Map or RequestmapInstances)", text));
}

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<GatewayConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(fmt::format("policy_loader: cannot resolve config path '{}': {}",
                                config_path.string(), ec.message()));
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(fmt::format("policy_loader: cannot open file '{}': {}",
                                canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format("policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                canonical_path.string(), e.mark.line + 1, e.mark.column + 1,
                                e.what()));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: YAML error in '{}': {}",
                                canonical_path.string(), e.what()));
    }

    return parse_root(root, canonical_path.string());
}

std::expected<GatewayConfig, std::string>
PolicyLoader::load_from_string(std::string_view yaml_text, std::string_view source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format("policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                source_name, e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: YAML error in '{}': {}", source_name, e.what()));
    }

    return parse_root(root, source_name);
}
