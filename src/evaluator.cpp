#include "safecalc/evaluator.hpp"

#include "safecalc/postfix_converter.hpp"
#include "safecalc/postfix_evaluator.hpp"
#include "safecalc/result_formatter.hpp"
#include "safecalc/tokenizer.hpp"
#include "safecalc/validator.hpp"

#include <algorithm>

namespace safecalc {

ExpressionEvaluator::ExpressionEvaluator(int precision) : digits(std::max(0, precision)) {}

// Полный цикл обработки выражения:
// 1-4. Очистка, проверка, токенизация и сортировочная станция (toPostfix)
// 5. Вычисление постфиксной записи
// 6. Округление результата
Number ExpressionEvaluator::evaluate(const std::string& expression) const {
    PostfixEvaluator machine(toPostfix(expression));
    double value = machine.evaluate();
    return formatResult(value, digits);
}

std::vector<Token> ExpressionEvaluator::toPostfix(const std::string& expression) const {
    // Этап 1-2: Очистка и проверка
    std::string sanitized = sanitizeExpression(expression);
    validateExpression(sanitized);

    // Этап 3: Лексический анализ
    Tokenizer tokenizer(std::move(sanitized));
    auto tokens = tokenizer.tokenize();

    // Этап 4: Инфиксная запись -> постфиксная
    PostfixConverter converter(std::move(tokens));
    return converter.convert();
}

} // namespace safecalc
