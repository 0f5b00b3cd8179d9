#pragma once

#include <cstddef>
#include <string>

namespace safecalc {

// Тип лексемы арифметического выражения
enum class TokenType {
    Number,   // Числовой литерал
    Operator, // Один из + - * / ^
    LParen,   // (
    RParen    // )
};

// Лексема, выделенная токенизатором.
// numericValue имеет смысл только для TokenType::Number.
struct Token {
    TokenType type;
    double numericValue;
    std::string text;      // Исходный текст лексемы
    std::size_t position;  // Позиция в очищенной строке

    // Символ оператора или скобки
    char symbol() const { return text.empty() ? '\0' : text.front(); }
};

} // namespace safecalc
