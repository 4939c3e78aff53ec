/**
 * @file test_oracle_reply_parser.cpp
 * @brief Oracle reply interpretation
 */

#include <gtest/gtest.h>
#include <vision/oracle_reply_parser.hpp>

using namespace Stanchion;

TEST(OracleReplyParserTest, JsonWithSurroundingProse) {
    auto reply = parse_oracle_reply(
        "Here is my analysis:\n"
        "{\"material\": \"kov\", \"type\": \"stĺp značky samostatný\", \"confidence\": 0.82, "
        "\"rationale\": \"thin galvanized round pole\"}\nThanks.");
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->material, "kov");
    EXPECT_EQ(reply->type, "stĺp značky samostatný");
    EXPECT_DOUBLE_EQ(reply->confidence, 0.82);
    EXPECT_EQ(reply->rationale, "thin galvanized round pole");
}

TEST(OracleReplyParserTest, JsonConfidenceAsString) {
    auto reply = parse_oracle_reply(R"({"material": "betón", "type": "X", "confidence": "0.6", "reasoning": "rough"})");
    ASSERT_TRUE(reply);
    EXPECT_DOUBLE_EQ(reply->confidence, 0.6);
    EXPECT_EQ(reply->rationale, "rough");
}

TEST(OracleReplyParserTest, LabelledLines) {
    auto reply = parse_oracle_reply(
        "Material: betón\n"
        "Type: stĺp verejného osvetlenia\n"
        "Confidence: 0.55\n"
        "Reasoning: square section with visible aggregate\n");
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->material, "betón");
    EXPECT_EQ(reply->type, "stĺp verejného osvetlenia");
    EXPECT_DOUBLE_EQ(reply->confidence, 0.55);
    EXPECT_EQ(reply->rationale, "square section with visible aggregate");
}

TEST(OracleReplyParserTest, MarkdownDecoratedLines) {
    auto reply = parse_oracle_reply(
        "- **Material:** kov\n"
        "- **Type:** stĺp značky dvojitý\n"
        "- **Confidence:** 0.9\n");
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->material, "kov");
    EXPECT_EQ(reply->type, "stĺp značky dvojitý");
    EXPECT_DOUBLE_EQ(reply->confidence, 0.9);
}

TEST(OracleReplyParserTest, BrokenJsonFallsBackToLines) {
    auto reply = parse_oracle_reply(
        "{material: kov\n"
        "Material: kov\n"
        "Type: A\n"
        "Confidence: 0.7 }\n");
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->material, "kov");
    EXPECT_DOUBLE_EQ(reply->confidence, 0.7);
}

TEST(OracleReplyParserTest, MissingFieldsAreRejected) {
    EXPECT_FALSE(parse_oracle_reply(R"({"material": "kov", "type": "A"})"));
    EXPECT_FALSE(parse_oracle_reply(R"({"material": "", "type": "A", "confidence": 0.8})"));
    EXPECT_FALSE(parse_oracle_reply("Material: kov\nConfidence: 0.8\n"));
}

TEST(OracleReplyParserTest, OutOfRangeConfidenceIsRejected) {
    EXPECT_FALSE(parse_oracle_reply(R"({"material": "kov", "type": "A", "confidence": 1.5})"));
    EXPECT_FALSE(parse_oracle_reply("Material: kov\nType: A\nConfidence: -0.1\n"));
    EXPECT_FALSE(parse_oracle_reply("Material: kov\nType: A\nConfidence: high\n"));
}

TEST(OracleReplyParserTest, GarbageIsRejected) {
    EXPECT_FALSE(parse_oracle_reply(""));
    EXPECT_FALSE(parse_oracle_reply("I cannot see a pole in this image."));
    EXPECT_FALSE(parse_oracle_reply("{}"));
}
