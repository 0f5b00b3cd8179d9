#include "safecalc/errors.hpp"
#include "safecalc/validator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace safecalc;

namespace {
ErrorKind kindOf(void (*action)()) {
    try {
        action();
    }
    catch (const EvaluationError& ex) {
        return ex.kind();
    }
    throw std::logic_error("EvaluationError was not thrown");
}
}

TEST(SanitizeExpressionTest, RemovesAllWhitespace) {
    EXPECT_EQ(sanitizeExpression(" 2 +\t3 *\n4 "), "2+3*4");
    EXPECT_EQ(sanitizeExpression("(10+5)/3"), "(10+5)/3");
}

TEST(SanitizeExpressionTest, EmptyInputIsRejected) {
    EXPECT_EQ(kindOf([] { sanitizeExpression(""); }), ErrorKind::EmptyExpression);
    EXPECT_EQ(kindOf([] { sanitizeExpression("   \t\r\n"); }), ErrorKind::EmptyExpression);
}

TEST(ValidateExpressionTest, AcceptsWhitelistedCharacters) {
    EXPECT_NO_THROW(validateExpression("0123456789.+-*/^()"));
    EXPECT_NO_THROW(validateExpression("2^3^2"));
}

TEST(ValidateExpressionTest, RejectsLettersAndOtherSymbols) {
    EXPECT_EQ(kindOf([] { validateExpression("2+a"); }), ErrorKind::InvalidCharacters);
    EXPECT_EQ(kindOf([] { validateExpression("sqrt(4)"); }), ErrorKind::InvalidCharacters);
    EXPECT_EQ(kindOf([] { validateExpression("1,5+2"); }), ErrorKind::InvalidCharacters);
    EXPECT_EQ(kindOf([] { validateExpression("2%3"); }), ErrorKind::InvalidCharacters);
    EXPECT_EQ(kindOf([] { validateExpression("1e5"); }), ErrorKind::InvalidCharacters);
}

TEST(ValidateExpressionTest, InvalidCharacterMessageNamesCharacterAndPosition) {
    try {
        validateExpression(sanitizeExpression("2 + a"));
        FAIL() << "EvaluationError was not thrown";
    }
    catch (const EvaluationError& ex) {
        std::string message = ex.what();
        EXPECT_NE(message.find("'a'"), std::string::npos);
        EXPECT_NE(message.find("позиции 2 (без учёта пробелов)"), std::string::npos);
    }
}

TEST(ValidateExpressionTest, CharacterCheckRunsBeforeParenthesisCheck) {
    EXPECT_EQ(kindOf([] { validateExpression("(a"); }), ErrorKind::InvalidCharacters);
}

TEST(ValidateExpressionTest, RejectsUnequalParenthesisCounts) {
    EXPECT_EQ(kindOf([] { validateExpression("(2+3"); }), ErrorKind::MismatchedParentheses);
    EXPECT_EQ(kindOf([] { validateExpression("2+3)"); }), ErrorKind::MismatchedParentheses);
    EXPECT_EQ(kindOf([] { validateExpression("((2)"); }), ErrorKind::MismatchedParentheses);
}

TEST(ValidateExpressionTest, OnlyCountsParenthesesNotTheirOrder) {
    EXPECT_NO_THROW(validateExpression(")("));
    EXPECT_NO_THROW(validateExpression("2)+(3"));
}
