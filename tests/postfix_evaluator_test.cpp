#include "safecalc/errors.hpp"
#include "safecalc/postfix_evaluator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace safecalc;

namespace {
Token num(double value) {
    return {TokenType::Number, value, std::to_string(value), 0};
}

Token op(char symbol) {
    return {TokenType::Operator, 0.0, std::string(1, symbol), 0};
}

ErrorKind failureOf(std::vector<Token> postfix) {
    PostfixEvaluator machine(std::move(postfix));
    try {
        machine.evaluate();
    }
    catch (const EvaluationError& ex) {
        return ex.kind();
    }
    throw std::logic_error("EvaluationError was not thrown");
}
}

TEST(PostfixEvaluatorTest, AppliesEachOperator) {
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(7), num(2), op('+')}).evaluate(), 9.0);
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(7), num(2), op('-')}).evaluate(), 5.0);
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(7), num(2), op('*')}).evaluate(), 14.0);
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(7), num(2), op('/')}).evaluate(), 3.5);
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(7), num(2), op('^')}).evaluate(), 49.0);
}

TEST(PostfixEvaluatorTest, FirstPushedValueIsLeftOperand) {
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(2), num(10), op('-')}).evaluate(), -8.0);
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(2), num(10), op('/')}).evaluate(), 0.2);
}

TEST(PostfixEvaluatorTest, EvaluatesNestedSequence) {
    // 2 3 4 * +
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(2), num(3), num(4), op('*'), op('+')}).evaluate(), 14.0);
}

TEST(PostfixEvaluatorTest, SingleNumberIsItsOwnValue) {
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(42)}).evaluate(), 42.0);
}

TEST(PostfixEvaluatorTest, DivisionByZeroFails) {
    EXPECT_EQ(failureOf({num(5), num(0), op('/')}), ErrorKind::DivisionByZero);
}

TEST(PostfixEvaluatorTest, ZeroNumeratorIsAllowed) {
    EXPECT_DOUBLE_EQ(PostfixEvaluator({num(0), num(5), op('/')}).evaluate(), 0.0);
}

TEST(PostfixEvaluatorTest, OperatorWithoutTwoOperandsFails) {
    EXPECT_EQ(failureOf({op('+')}), ErrorKind::InsufficientOperands);
    EXPECT_EQ(failureOf({num(1), op('*')}), ErrorKind::InsufficientOperands);
}

TEST(PostfixEvaluatorTest, LeftoverValuesFail) {
    EXPECT_EQ(failureOf({num(1), num(2)}), ErrorKind::InvalidExpression);
}

TEST(PostfixEvaluatorTest, EmptySequenceFails) {
    EXPECT_EQ(failureOf({}), ErrorKind::InvalidExpression);
}
