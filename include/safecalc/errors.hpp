#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace safecalc {

// Виды ошибок разбора и вычисления выражения
enum class ErrorKind {
    EmptyExpression,
    InvalidCharacters,
    MismatchedParentheses,
    InsufficientOperands,
    DivisionByZero,
    InvalidExpression
};

// Стабильное имя вида ошибки (используется в CSV и логах)
std::string_view errorKindName(ErrorKind kind);

// Исключение, которое выбрасывает вычислитель при любой ошибке выражения.
// Вид ошибки позволяет вызывающему коду различать причины отказа.
class EvaluationError : public std::runtime_error {
public:
    EvaluationError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

} // namespace safecalc
