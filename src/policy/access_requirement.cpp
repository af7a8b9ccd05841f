#include "policy/access_requirement.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

PolicyError access_error(std::string message, const std::vector<std::string>& values) {
    return PolicyError{
        PolicyErrorCode::kConfiguration,
        std::move(message),
        fmt::format("access=[{}]", fmt::join(values, ",")),
    };
}

}  // namespace

std::string AccessRequirement::describe() const {
    if (kind == Kind::kExpression) {
        return expression;
    }
    return fmt::format("[{}]", fmt::join(authorities, ","));
}

bool is_authority_token(std::string_view value) noexcept {
    // 괄호 없는 표현식 키워드
    if (value.empty() || value == "permitAll" || value == "denyAll") {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

bool is_reserved_token(std::string_view value) noexcept {
    return value == kAnyAuthenticatedAnonymous ||
           value == kAnyAuthenticatedRemembered ||
           value == kAnyAuthenticatedFull;
}

std::expected<AccessRequirement, PolicyError>
make_access_requirement(const std::vector<std::string>& values) {
    if (values.empty()) {
        return std::unexpected(access_error("access must name at least one token or expression", values));
    }

    std::vector<std::string> tokens;
    std::vector<std::string> expressions;
    for (const auto& raw : values) {
        const auto value = trim(raw);
        if (value.empty()) {
            return std::unexpected(access_error("access contains an empty value", values));
        }
        if (is_authority_token(value)) {
            tokens.emplace_back(value);
        } else {
            expressions.emplace_back(value);
        }
    }

    if (!expressions.empty()) {
        if (!tokens.empty()) {
            return std::unexpected(access_error(
                "access mixes authority tokens and expressions; use a single expression", values));
        }
        if (expressions.size() > 1) {
            return std::unexpected(access_error(
                "access holds more than one expression; combine them with 'and'/'or'", values));
        }
        AccessRequirement req{};
        req.kind       = AccessRequirement::Kind::kExpression;
        req.expression = std::move(expressions.front());
        return req;
    }

    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());

    AccessRequirement req{};
    req.kind        = AccessRequirement::Kind::kAuthorities;
    req.authorities = std::move(tokens);
    return req;
}

std::vector<std::string> split_config_attribute(std::string_view raw) {
    std::vector<std::string> values;
    const auto trimmed = trim(raw);
    if (trimmed.empty()) {
        return values;
    }
    if (trimmed.find('(') != std::string_view::npos) {
        values.emplace_back(trimmed);
        return values;
    }

    std::size_t start = 0;
    while (start <= trimmed.size()) {
        const auto comma = trimmed.find(',', start);
        const auto end   = (comma == std::string_view::npos) ? trimmed.size() : comma;
        const auto item  = trim(trimmed.substr(start, end - start));
        if (!item.empty()) {
            values.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return values;
}
