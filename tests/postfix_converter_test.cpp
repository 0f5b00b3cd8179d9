#include "safecalc/postfix_converter.hpp"
#include "safecalc/tokenizer.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace safecalc;

namespace {
std::string postfixOf(const std::string& source) {
    Tokenizer tokenizer(source);
    PostfixConverter converter(tokenizer.tokenize());
    return formatPostfix(converter.convert());
}
}

TEST(PostfixConverterTest, HonoursPrecedence) {
    EXPECT_EQ(postfixOf("2+3*4"), "2 3 4 * +");
    EXPECT_EQ(postfixOf("2*3+4"), "2 3 * 4 +");
    EXPECT_EQ(postfixOf("2+3^2*4"), "2 3 2 ^ 4 * +");
}

TEST(PostfixConverterTest, LeftAssociativeOperatorsPopEqualPrecedence) {
    EXPECT_EQ(postfixOf("10-4-3"), "10 4 - 3 -");
    EXPECT_EQ(postfixOf("8/4*2"), "8 4 / 2 *");
}

TEST(PostfixConverterTest, PowerIsRightAssociative) {
    EXPECT_EQ(postfixOf("2^3^2"), "2 3 2 ^ ^");
}

TEST(PostfixConverterTest, ParenthesesOverridePrecedence) {
    EXPECT_EQ(postfixOf("(10+5)/3"), "10 5 + 3 /");
    EXPECT_EQ(postfixOf("(2^3)^2"), "2 3 ^ 2 ^");
    EXPECT_EQ(postfixOf("((1+2)*(3-4))"), "1 2 + 3 4 - *");
}

TEST(PostfixConverterTest, ParenthesesNeverReachOutput) {
    Tokenizer tokenizer(")(2+3)(");
    PostfixConverter converter(tokenizer.tokenize());
    auto postfix = converter.convert();
    for (const auto& token : postfix) {
        EXPECT_TRUE(token.type == TokenType::Number || token.type == TokenType::Operator);
    }
    EXPECT_EQ(formatPostfix(postfix), "2 3 +");
}

TEST(PostfixConverterTest, UnmatchedClosingParenthesisIsNotReportedHere) {
    EXPECT_EQ(postfixOf("2+3)"), "2 3 +");
}

TEST(PostfixConverterTest, FormatsEmptySequence) {
    EXPECT_EQ(formatPostfix({}), "");
}
