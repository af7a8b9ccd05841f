#pragma once

// ---------------------------------------------------------------------------
// ant_path_matcher.hpp
//
// Ant 스타일 glob 패턴으로 URL 경로를 매칭하고, 규칙 정렬에 사용할
// 구체성(specificity) 키를 계산한다.
//
// [문법]
//   ?  : 구분자('/')가 아닌 문자 정확히 1개
//   *  : 한 세그먼트 안에서 구분자가 아닌 문자 0개 이상
//   ** : 세그먼트 0개 이상 (세그먼트 전체여야 함, "a**" 는 문법 오류)
//
// [정규화]
// - 매칭은 대소문자를 구분한다. 소문자 정규화는 호출자 책임.
// - 빈 세그먼트("//", 끝의 "/")는 양쪽 모두 무시한다.
//   따라서 "/admin/**" 는 "/admin" 과 "/admin/" 에 모두 매칭된다.
//
// [스레드 안전성]
// 모든 함수는 상태가 없으며 concurrent 호출 안전.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string_view>

#include "common/types.hpp"  // PolicyError

// ---------------------------------------------------------------------------
// SpecificityKey
//   패턴에서 계산되는 정렬 키.
//   literal_prefix_length 가 길수록, wildcard_segments 가 적을수록 우선한다.
//   등록 순서(source rank, 선언 순서)는 RuleCache 가 안정 정렬로 보장한다.
// ---------------------------------------------------------------------------
struct SpecificityKey {
    std::size_t literal_prefix_length{0};  // 빈 세그먼트를 뺀 첫 와일드카드 이전 문자 수
    std::size_t wildcard_segments{0};      // '*' 또는 '?' 를 포함한 세그먼트 수

    // a 가 b 보다 먼저 정렬되어야 하면 true (strict weak ordering)
    [[nodiscard]] friend bool operator<(const SpecificityKey& a, const SpecificityKey& b) noexcept {
        if (a.literal_prefix_length != b.literal_prefix_length) {
            return a.literal_prefix_length > b.literal_prefix_length;
        }
        return a.wildcard_segments < b.wildcard_segments;
    }

    [[nodiscard]] friend bool operator==(const SpecificityKey&, const SpecificityKey&) = default;
};

class AntPathMatcher {
public:
    // match
    //   path 가 pattern 에 매칭되면 true.
    //   pattern 은 validate() 를 통과한 것으로 가정한다.
    [[nodiscard]] static bool match(std::string_view pattern, std::string_view path);

    [[nodiscard]] static SpecificityKey specificity(std::string_view pattern);

    // validate
    //   로드 시점 문법 검사. 실패 시 kInvalidPattern 오류.
    //   context 에는 문제가 된 패턴을 담는다.
    [[nodiscard]] static std::expected<void, PolicyError> validate(std::string_view pattern);

    // 와일드카드 문자('*', '?') 포함 여부
    [[nodiscard]] static bool is_pattern(std::string_view text) noexcept;
};
