// ---------------------------------------------------------------------------
// ant_path_matcher.cpp
//
// 세그먼트 단위 DP 매칭.
// "**" 가 여러 개인 패턴에서도 지수 시간 백트래킹이 발생하지 않도록
// (패턴 세그먼트 × 경로 세그먼트) 크기의 테이블을 아래에서 위로 채운다.
// 세그먼트 내부의 '*'/'?' 는 단일 백트래킹 포인트를 쓰는 선형 알고리즘이다.
// ---------------------------------------------------------------------------

#include "matcher/ant_path_matcher.hpp"

#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

constexpr std::string_view kDoubleWildcard = "**";

// 빈 세그먼트를 제외하고 '/' 로 분리
std::vector<std::string_view> tokenize(std::string_view text) {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto slash = text.find('/', start);
        const auto end   = (slash == std::string_view::npos) ? text.size() : slash;
        if (end > start) {
            segments.push_back(text.substr(start, end - start));
        }
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

// 단일 세그먼트 glob 매칭 ('*', '?')
bool match_segment(std::string_view pattern, std::string_view segment) {
    std::size_t p = 0;
    std::size_t s = 0;
    std::size_t star_p = std::string_view::npos;
    std::size_t star_s = 0;

    while (s < segment.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == segment[s])) {
            ++p;
            ++s;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_s = s;
        } else if (star_p != std::string_view::npos) {
            p = star_p + 1;
            s = ++star_s;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool has_wildcard(std::string_view text) noexcept {
    return text.find_first_of("*?") != std::string_view::npos;
}

}  // namespace

bool AntPathMatcher::match(std::string_view pattern, std::string_view path) {
    const auto pat = tokenize(pattern);
    const auto seg = tokenize(path);
    const std::size_t np = pat.size();
    const std::size_t ns = seg.size();

    // dp[i * (ns + 1) + j] : pat[i..] 가 seg[j..] 에 매칭되는지
    std::vector<char> dp((np + 1) * (ns + 1), 0);
    const auto at = [ns](std::size_t i, std::size_t j) { return i * (ns + 1) + j; };
    dp[at(np, ns)] = 1;

    for (std::size_t i = np; i-- > 0;) {
        for (std::size_t j = ns + 1; j-- > 0;) {
            if (pat[i] == kDoubleWildcard) {
                dp[at(i, j)] = static_cast<char>(dp[at(i + 1, j)] || (j < ns && dp[at(i, j + 1)]));
            } else {
                dp[at(i, j)] = static_cast<char>(
                    j < ns && dp[at(i + 1, j + 1)] && match_segment(pat[i], seg[j]));
            }
        }
    }
    return dp[at(0, 0)] != 0;
}

// 리터럴 접두사는 정규화된 세그먼트로 센다. 매칭이 빈 세그먼트를 무시하므로
// "/admin//" 는 "/admin" 과 같은 키를, "/admin/**" 는 "/admin" 과 같은 접두사를 갖는다.
SpecificityKey AntPathMatcher::specificity(std::string_view pattern) {
    SpecificityKey key{};
    bool in_literal_prefix = true;
    for (const auto segment : tokenize(pattern)) {
        const auto first_wildcard = segment.find_first_of("*?");
        if (first_wildcard == std::string_view::npos) {
            if (in_literal_prefix) {
                key.literal_prefix_length += 1 + segment.size();
            }
            continue;
        }
        ++key.wildcard_segments;
        if (in_literal_prefix && segment != kDoubleWildcard) {
            key.literal_prefix_length += 1 + first_wildcard;
        }
        in_literal_prefix = false;
    }
    if (key.literal_prefix_length == 0) {
        key.literal_prefix_length = 1;  // 루트 "/"
    }
    return key;
}

std::expected<void, PolicyError> AntPathMatcher::validate(std::string_view pattern) {
    auto fail = [pattern](std::string message) {
        return std::unexpected(PolicyError{
            PolicyErrorCode::kInvalidPattern,
            std::move(message),
            std::string(pattern),
        });
    };

    if (pattern.empty()) {
        return fail("pattern must not be empty");
    }
    if (pattern.front() != '/') {
        return fail(fmt::format("pattern '{}' must start with '/'", pattern));
    }
    for (const unsigned char c : pattern) {
        if (c <= 0x20 || c == 0x7f) {
            return fail(fmt::format("pattern '{}' contains whitespace or control characters", pattern));
        }
    }
    for (const auto segment : tokenize(pattern)) {
        if (segment.find(kDoubleWildcard) != std::string_view::npos && segment != kDoubleWildcard) {
            return fail(fmt::format(
                "pattern '{}': '**' must be a whole path segment (found '{}')", pattern, segment));
        }
    }
    return {};
}

bool AntPathMatcher::is_pattern(std::string_view text) noexcept {
    return has_wildcard(text);
}
