#include <gtest/gtest.h>

#include "filters/rule.hpp"

using filters::Rule;
using types::MatchType;

namespace {
Rule rule(MatchType type, const std::string& operand) {
    Rule r;
    r.match_type = type;
    r.expression = operand;
    return r;
}
} // namespace

TEST(Rule, ExpressionTakesPrecedenceOverToken) {
    Rule r;
    r.token = "old";
    r.expression = "new";
    EXPECT_EQ(r.operand(), "new");
    EXPECT_TRUE(r.matches("new"));
    EXPECT_FALSE(r.matches("old"));

    r.expression.clear();
    EXPECT_TRUE(r.matches("old"));
}

TEST(Rule, LiteralMatchTypes) {
    EXPECT_TRUE(rule(MatchType::Exact, "imgur").matches("imgur"));
    EXPECT_FALSE(rule(MatchType::Exact, "imgur").matches("Imgur"));
    EXPECT_TRUE(rule(MatchType::CaseInsensitive, "imgur").matches("IMGUR"));
    EXPECT_TRUE(rule(MatchType::Any, "ignored").matches("anything"));
    EXPECT_TRUE(rule(MatchType::StartsWith, "gal").matches("gallery"));
    EXPECT_FALSE(rule(MatchType::StartsWith, "ery").matches("gallery"));
    EXPECT_TRUE(rule(MatchType::EndsWith, "ery").matches("gallery"));
    EXPECT_TRUE(rule(MatchType::Contains, "ll").matches("gallery"));
    EXPECT_FALSE(rule(MatchType::NotContains, "ll").matches("gallery"));
    EXPECT_TRUE(rule(MatchType::NotStartsWith, "x").matches("gallery"));
    EXPECT_FALSE(rule(MatchType::NotEndsWith, "ery").matches("gallery"));
}

TEST(Rule, RegexSearchesAnywhere) {
    EXPECT_TRUE(rule(MatchType::Regex, "[0-9]+").matches("abc123"));
    EXPECT_FALSE(rule(MatchType::Regex, "^[0-9]+$").matches("abc123"));
    EXPECT_FALSE(rule(MatchType::NotRegex, "[0-9]+").matches("abc123"));
    EXPECT_TRUE(rule(MatchType::NotRegex, "[0-9]+").matches("abc"));
}

TEST(Rule, ExpressionMatchesWholeToken) {
    EXPECT_TRUE(rule(MatchType::Expression, "[a-z]+[0-9]+").matches("abc123"));
    EXPECT_FALSE(rule(MatchType::Expression, "[0-9]+").matches("abc123"));
}

TEST(Rule, InvalidPatternFailsClosedForRegexAndOpenForNotRegex) {
    EXPECT_FALSE(rule(MatchType::Regex, "([unclosed").matches("anything"));
    EXPECT_FALSE(rule(MatchType::Expression, "([unclosed").matches("anything"));
    EXPECT_TRUE(rule(MatchType::NotRegex, "([unclosed").matches("anything"));
}

TEST(Rule, InvalidPatternIsRecordedAsPatternError) {
    filters::last_pattern_error().reset();
    EXPECT_TRUE(rule(MatchType::Regex, "[0-9]+").matches("7"));
    EXPECT_FALSE(filters::last_pattern_error().has_value());

    EXPECT_FALSE(rule(MatchType::Regex, "([unclosed").matches("anything"));
    ASSERT_TRUE(filters::last_pattern_error().has_value());
    EXPECT_EQ(filters::last_pattern_error()->kind, types::ErrorKind::Pattern);
    EXPECT_NE(filters::last_pattern_error()->message.find("([unclosed"), std::string::npos);
}

TEST(Rule, JsonRoundTrip) {
    Rule r = rule(MatchType::NotEndsWith, ".gif");
    r.token = "legacy";
    const nlohmann::json j = r;
    EXPECT_EQ(j.at("match_type").get<std::string>(), "match_not_ends_with");
    EXPECT_EQ(j.get<Rule>(), r);
}

TEST(Rule, UnknownMatchTypeIsRejected) {
    const auto j = nlohmann::json::parse(R"({"token":"a","match_type":"match_sometimes"})");
    EXPECT_THROW(j.get<Rule>(), std::invalid_argument);
}

TEST(Rule, MissingFieldsDefault) {
    const auto r = nlohmann::json::parse(R"({"token":"a"})").get<Rule>();
    EXPECT_EQ(r.match_type, MatchType::Exact);
    EXPECT_TRUE(r.expression.empty());
    EXPECT_TRUE(r.matches("a"));
}
