#pragma once

#include <vector>

#include "safecalc/token.hpp"

namespace safecalc {

// Стековая машина для вычисления постфиксной записи.
class PostfixEvaluator {
public:
    explicit PostfixEvaluator(std::vector<Token> postfix);

    // Вычисляет выражение.
    // Выбрасывает EvaluationError:
    //  InsufficientOperands — оператору не хватает двух операндов;
    //  DivisionByZero       — деление на ноль;
    //  InvalidExpression    — по окончании в стеке осталось не одно значение.
    double evaluate() const;

private:
    const std::vector<Token> postfix;

    // Применяет бинарный оператор к операндам a и b (a был в стеке раньше b)
    static double apply(char op, double a, double b);
};

} // namespace safecalc
