#include "safecalc/validator.hpp"

#include "safecalc/errors.hpp"
#include "safecalc/operators.hpp"

#include <algorithm>
#include <cctype>

namespace safecalc {

namespace {
bool isAllowedCharacter(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == '(' || ch == ')' ||
           isOperator(ch);
}
}

std::string sanitizeExpression(const std::string& expression) {
    std::string result;
    result.reserve(expression.size());
    for (char ch : expression) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            result.push_back(ch);
        }
    }

    if (result.empty()) {
        throw EvaluationError(ErrorKind::EmptyExpression, "Выражение не может быть пустым");
    }
    return result;
}

void validateExpression(const std::string& expression) {
    for (std::size_t i = 0; i < expression.size(); ++i) {
        if (!isAllowedCharacter(expression[i])) {
            // Позиция считается в строке после удаления пробелов
            throw EvaluationError(ErrorKind::InvalidCharacters,
                                  "Недопустимый символ '" + std::string(1, expression[i]) + "' в позиции " +
                                      std::to_string(i) + " (без учёта пробелов)");
        }
    }

    // Сверяем только количество скобок
    auto open = std::count(expression.begin(), expression.end(), '(');
    auto close = std::count(expression.begin(), expression.end(), ')');
    if (open != close) {
        throw EvaluationError(ErrorKind::MismatchedParentheses, "Несогласованные скобки");
    }
}

} // namespace safecalc
