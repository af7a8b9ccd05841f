#include "common/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

// 내부 헬퍼: 대소문자 무관 비교
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

constexpr std::array<std::pair<std::string_view, HttpMethod>, 8> kMethodNames{{
    {"GET",     HttpMethod::kGet},
    {"POST",    HttpMethod::kPost},
    {"PUT",     HttpMethod::kPut},
    {"DELETE",  HttpMethod::kDelete},
    {"PATCH",   HttpMethod::kPatch},
    {"HEAD",    HttpMethod::kHead},
    {"OPTIONS", HttpMethod::kOptions},
    {"TRACE",   HttpMethod::kTrace},
}};

}  // namespace

std::optional<HttpMethod> parse_http_method(std::string_view text) {
    for (const auto& [name, method] : kMethodNames) {
        if (iequals(name, text)) {
            return method;
        }
    }
    return std::nullopt;
}

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::kGet:     return "GET";
        case HttpMethod::kPost:    return "POST";
        case HttpMethod::kPut:     return "PUT";
        case HttpMethod::kDelete:  return "DELETE";
        case HttpMethod::kPatch:   return "PATCH";
        case HttpMethod::kHead:    return "HEAD";
        case HttpMethod::kOptions: return "OPTIONS";
        case HttpMethod::kTrace:   return "TRACE";
        default:                   return "UNKNOWN";
    }
}

std::string_view to_string(PolicyErrorCode code) noexcept {
    switch (code) {
        case PolicyErrorCode::kConfiguration:     return "configuration";
        case PolicyErrorCode::kInvalidPattern:    return "invalid-pattern";
        case PolicyErrorCode::kSourceUnavailable: return "source-unavailable";
        case PolicyErrorCode::kInternalError:     return "internal-error";
        default:                                  return "internal-error";
    }
}

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}
