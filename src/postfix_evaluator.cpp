#include "safecalc/postfix_evaluator.hpp"

#include "safecalc/errors.hpp"

#include <cmath>
#include <string>

namespace safecalc {

PostfixEvaluator::PostfixEvaluator(std::vector<Token> postfix) : postfix(std::move(postfix)) {}

double PostfixEvaluator::evaluate() const {
    std::vector<double> values;
    values.reserve(postfix.size());

    for (const auto& token : postfix) {
        if (token.type == TokenType::Number) {
            values.push_back(token.numericValue);
            continue;
        }
        if (token.type != TokenType::Operator) {
            continue;
        }

        if (values.size() < 2) {
            throw EvaluationError(ErrorKind::InsufficientOperands,
                                  "Недостаточно операндов для оператора " + token.text);
        }

        double b = values.back();
        values.pop_back();
        double a = values.back();
        values.pop_back();

        values.push_back(apply(token.symbol(), a, b));
    }

    if (values.size() != 1) {
        throw EvaluationError(ErrorKind::InvalidExpression, "Некорректное выражение");
    }
    return values.front();
}

double PostfixEvaluator::apply(char op, double a, double b) {
    switch (op) {
    case '+':
        return a + b;
    case '-':
        return a - b;
    case '*':
        return a * b;
    case '/':
        if (b == 0.0) {
            throw EvaluationError(ErrorKind::DivisionByZero, "Деление на ноль");
        }
        return a / b;
    case '^':
        return std::pow(a, b);
    default:
        throw EvaluationError(ErrorKind::InvalidExpression,
                              std::string("Неизвестный оператор: ") + op);
    }
}

} // namespace safecalc
