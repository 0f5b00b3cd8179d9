#pragma once

#include <string>
#include <vector>

#include "safecalc/number.hpp"
#include "safecalc/token.hpp"

namespace safecalc {

// Класс-фасад для безопасного вычисления арифметических выражений.
// Объединяет этапы очистки, проверки, токенизации, преобразования
// в постфиксную запись, вычисления и округления результата.
//
// Экземпляр хранит только точность и не меняется после создания,
// поэтому один вычислитель можно использовать из нескольких потоков.
class ExpressionEvaluator {
public:
    static constexpr int kDefaultPrecision = 2;

    // Отрицательная точность приводится к нулю
    explicit ExpressionEvaluator(int precision = kDefaultPrecision);

    // Вычисляет значение выражения.
    // Пример: "2 + 3 * 4" -> 14, "3.14 * 2" -> 6.28
    // Выбрасывает EvaluationError в случае ошибки.
    Number evaluate(const std::string& expression) const;

    // Выполняет этапы до вычисления и возвращает постфиксную запись
    std::vector<Token> toPostfix(const std::string& expression) const;

    int precision() const { return digits; }

private:
    int digits;
};

} // namespace safecalc
