#include "policy/source_assembly.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace {

template <typename Source>
std::expected<std::shared_ptr<RuleSource>, PolicyError>
upcast(std::expected<std::shared_ptr<Source>, PolicyError> created) {
    if (!created) {
        return std::unexpected(std::move(created.error()));
    }
    return std::shared_ptr<RuleSource>(std::move(*created));
}

}  // namespace

std::expected<AssembledSources, PolicyError>
assemble_rule_sources(const GatewayConfig& config, std::shared_ptr<RuleStore> store) {
    AssembledSources out{};

    switch (config.security.security_config_type) {
        case SecurityConfigType::kAnnotation: {
            auto declared = upcast(StaticDeclarationSource::from_entries(config.annotations));
            if (!declared) {
                return std::unexpected(std::move(declared.error()));
            }
            auto exemptions = upcast(ConfigMapSource::create(config.static_rules));
            if (!exemptions) {
                return std::unexpected(std::move(exemptions.error()));
            }
            out.sources.push_back(std::move(*declared));
            out.sources.push_back(std::move(*exemptions));
            break;
        }

        case SecurityConfigType::kMap: {
            std::vector<RuleEntry> entries = config.static_rules;
            entries.insert(entries.end(), config.intercept_url_map.begin(), config.intercept_url_map.end());
            auto mapped = upcast(ConfigMapSource::create(entries));
            if (!mapped) {
                return std::unexpected(std::move(mapped.error()));
            }
            out.sources.push_back(std::move(*mapped));
            break;
        }

        case SecurityConfigType::kRequestmapInstances: {
            auto exemptions = upcast(ConfigMapSource::create(config.static_rules));
            if (!exemptions) {
                return std::unexpected(std::move(exemptions.error()));
            }

            if (!store) {
                store = std::make_shared<InMemoryRuleStore>();
            }
            auto dynamic = std::make_shared<DynamicStoreSource>(std::move(store));
            for (const auto& entry : config.requestmap) {
                auto id = dynamic->add_rule(entry);
                if (!id) {
                    return std::unexpected(std::move(id.error()));
                }
            }

            out.sources.push_back(std::move(*exemptions));
            out.sources.push_back(dynamic);
            out.dynamic = std::move(dynamic);
            break;
        }
    }

    spdlog::info("source_assembly: {} rule sources assembled", out.sources.size());
    return out;
}
