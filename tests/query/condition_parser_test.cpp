// =============================================================================
// logq - Condition Parser Tests
// =============================================================================

#include "logq/query/condition_parser.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace logq::query {
namespace {

TEST(ConditionParserTest, SymbolicOperators) {
    auto spec = parseCondition("level == ERROR");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->field, "level");
    EXPECT_EQ(spec->op, Comparator::kEq);
    EXPECT_EQ(spec->operands, std::vector<std::string>{"ERROR"});

    auto compact = parseCondition("status>=500");
    ASSERT_TRUE(compact.has_value());
    EXPECT_EQ(compact->field, "status");
    EXPECT_EQ(compact->op, Comparator::kGe);
    EXPECT_EQ(compact->operands, std::vector<std::string>{"500"});

    EXPECT_EQ(parseCondition("a = 1")->op, Comparator::kEq);
    EXPECT_EQ(parseCondition("a != 1")->op, Comparator::kNe);
    EXPECT_EQ(parseCondition("a < 1")->op, Comparator::kLt);
}

TEST(ConditionParserTest, WordOperatorsAreCaseInsensitive) {
    auto spec = parseCondition("msg CONTAINS timeout");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->op, Comparator::kContains);

    auto exists = parseCondition("user exists");
    ASSERT_TRUE(exists.has_value());
    EXPECT_EQ(exists->op, Comparator::kExists);
    EXPECT_TRUE(exists->operands.empty());
}

TEST(ConditionParserTest, ListOperands) {
    auto in = parseCondition("level in ERROR, WARN ,FATAL");
    ASSERT_TRUE(in.has_value());
    EXPECT_EQ(in->operands, (std::vector<std::string>{"ERROR", "WARN", "FATAL"}));

    auto between = parseCondition("ts between 2024-01-01,2024-01-02");
    ASSERT_TRUE(between.has_value());
    EXPECT_EQ(between->operands.size(), 2u);

    auto cidr = parseCondition("ip cidr 10.0.0.0/8,192.168.1.1-192.168.1.9");
    ASSERT_TRUE(cidr.has_value());
    EXPECT_EQ(cidr->operands.size(), 2u);
}

TEST(ConditionParserTest, QuotedValues) {
    auto spec = parseCondition("msg == \"disk full, retrying\"");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->operands, std::vector<std::string>{"disk full, retrying"});

    auto escaped = parseCondition(R"(msg contains "say \"hi\"")");
    ASSERT_TRUE(escaped.has_value());
    EXPECT_EQ(escaped->operands, std::vector<std::string>{"say \"hi\""});

    auto list = parseCondition(R"(host in "a,b", c)");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->operands, (std::vector<std::string>{"a,b", "c"}));
}

TEST(ConditionParserTest, RejectsMalformedConditions) {
    EXPECT_EQ(parseCondition("== 5").error().code(), ErrorCode::kConfigError);
    EXPECT_FALSE(parseCondition("level").has_value());
    EXPECT_FALSE(parseCondition("level like x").has_value());
    EXPECT_FALSE(parseCondition("level ==").has_value());
    EXPECT_FALSE(parseCondition("level == \"open").has_value());
    EXPECT_FALSE(parseCondition("user exists now").has_value());
    EXPECT_FALSE(parseCondition("ts between 1").has_value());
}

TEST(ConditionParserTest, FormatParsesBack) {
    const std::vector<std::string> texts = {"level == ERROR", "host in \"a,b\",c",
                                            "user exists", "msg contains \"two words\""};
    for (const auto& text : texts) {
        SCOPED_TRACE(text);
        auto spec = parseCondition(text);
        ASSERT_TRUE(spec.has_value());
        auto again = parseCondition(formatCondition(*spec));
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(*again, *spec);
    }
}

TEST(ConditionParserTest, ParseConditionsStopsAtFirstError) {
    auto ok = parseConditions({"a == 1", "b exists"});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->size(), 2u);

    EXPECT_FALSE(parseConditions({"a == 1", "b ~ 2"}).has_value());
}

}  // namespace
}  // namespace logq::query
