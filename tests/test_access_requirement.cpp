// ---------------------------------------------------------------------------
// test_access_requirement.cpp
//
// AccessRequirement 정규화 단위 테스트.
//
// [테스트 범위]
// - 토큰/표현식 분류 (permitAll, denyAll 은 표현식)
// - 토큰 집합 정렬 + 중복 제거
// - 혼합 목록, 표현식 2개 이상, 빈 값 → kConfiguration
// - 저장소 config_attribute 분리 규칙
// ---------------------------------------------------------------------------

#include "policy/access_requirement.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(AccessRequirement, AuthorityToken_Classification) {
    EXPECT_TRUE(is_authority_token("ROLE_ADMIN"));
    EXPECT_TRUE(is_authority_token("ANY_AUTHENTICATED_FULL"));
    EXPECT_TRUE(is_authority_token("role1"));

    EXPECT_FALSE(is_authority_token("isAuthenticated()"));
    EXPECT_FALSE(is_authority_token("hasRole('ADMIN')"));
    EXPECT_FALSE(is_authority_token("permitAll"));
    EXPECT_FALSE(is_authority_token("denyAll"));
    EXPECT_FALSE(is_authority_token(""));
}

TEST(AccessRequirement, ReservedTokens_AreRecognized) {
    EXPECT_TRUE(is_reserved_token("ANY_AUTHENTICATED_ANONYMOUS"));
    EXPECT_TRUE(is_reserved_token("ANY_AUTHENTICATED_REMEMBERED"));
    EXPECT_TRUE(is_reserved_token("ANY_AUTHENTICATED_FULL"));
    EXPECT_FALSE(is_reserved_token("ROLE_ADMIN"));
}

TEST(AccessRequirement, TokenList_IsSortedAndDeduplicated) {
    const auto req = make_access_requirement({"ROLE_USER", "ROLE_ADMIN", "ROLE_USER"});
    ASSERT_TRUE(req.has_value()) << req.error().message;

    EXPECT_EQ(req->kind, AccessRequirement::Kind::kAuthorities);
    const std::vector<std::string> expected{"ROLE_ADMIN", "ROLE_USER"};
    EXPECT_EQ(req->authorities, expected);
    EXPECT_EQ(req->describe(), "[ROLE_ADMIN,ROLE_USER]");
    EXPECT_FALSE(req->is_unrestricted());
}

TEST(AccessRequirement, SingleExpression_IsStoredUntranslated) {
    const auto req = make_access_requirement({"isAuthenticated()"});
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->kind, AccessRequirement::Kind::kExpression);
    EXPECT_EQ(req->expression, "isAuthenticated()");
    EXPECT_EQ(req->describe(), "isAuthenticated()");
}

TEST(AccessRequirement, ReservedToken_IsNotTranslatedToExpression) {
    const auto req = make_access_requirement({"ANY_AUTHENTICATED_ANONYMOUS"});
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->kind, AccessRequirement::Kind::kAuthorities);
    EXPECT_EQ(req->authorities, std::vector<std::string>{"ANY_AUTHENTICATED_ANONYMOUS"});
}

TEST(AccessRequirement, PermitAll_IsAnExpression) {
    const auto req = make_access_requirement({"permitAll"});
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->kind, AccessRequirement::Kind::kExpression);
    EXPECT_EQ(req->expression, "permitAll");
}

TEST(AccessRequirement, ValuesAreTrimmed) {
    const auto req = make_access_requirement({"  ROLE_ADMIN "});
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->authorities, std::vector<std::string>{"ROLE_ADMIN"});
}

TEST(AccessRequirement, MixedTokensAndExpression_IsConfigurationError) {
    const auto req = make_access_requirement({"ROLE_ADMIN", "isAuthenticated()"});
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, PolicyErrorCode::kConfiguration);
    EXPECT_NE(req.error().context.find("ROLE_ADMIN"), std::string::npos);
}

TEST(AccessRequirement, TwoExpressions_IsConfigurationError) {
    const auto req = make_access_requirement({"hasRole('A')", "hasRole('B')"});
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, PolicyErrorCode::kConfiguration);
}

TEST(AccessRequirement, EmptyList_IsConfigurationError) {
    const auto req = make_access_requirement({});
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, PolicyErrorCode::kConfiguration);
}

TEST(AccessRequirement, BlankValue_IsConfigurationError) {
    const auto req = make_access_requirement({"ROLE_A", "   "});
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, PolicyErrorCode::kConfiguration);
}

TEST(AccessRequirement, Unrestricted_HasNoRequirement) {
    const auto req = AccessRequirement::unrestricted();
    EXPECT_TRUE(req.is_unrestricted());
    EXPECT_EQ(req.describe(), "[]");
}

TEST(AccessRequirement, SplitConfigAttribute_SplitsCommaSeparatedTokens) {
    const std::vector<std::string> expected{"ROLE_A", "ROLE_B"};
    EXPECT_EQ(split_config_attribute("ROLE_A, ROLE_B"), expected);
    EXPECT_EQ(split_config_attribute("ROLE_A,,ROLE_B,"), expected);
}

TEST(AccessRequirement, SplitConfigAttribute_KeepsExpressionWhole) {
    const auto values = split_config_attribute("hasAnyRole('A','B')");
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values.front(), "hasAnyRole('A','B')");
}

TEST(AccessRequirement, SplitConfigAttribute_EmptyInput) {
    EXPECT_TRUE(split_config_attribute("").empty());
    EXPECT_TRUE(split_config_attribute("   ").empty());
}
