#pragma once

#include <string>
#include <vector>

#include "safecalc/token.hpp"

namespace safecalc {

// Лексический анализатор.
// Разбивает очищенную и проверенную строку на числа, операторы и скобки.
// Символы, не образующие лексему (например, одиночная точка без цифр перед ней),
// пропускаются: допустимость символов уже проверена валидатором.
class Tokenizer {
public:
    explicit Tokenizer(std::string sourceText);

    // Возвращает лексемы в порядке их следования в строке
    std::vector<Token> tokenize();

private:
    const std::string source;
    std::size_t index = 0;

    bool isAtEnd() const;
    char peek() const;
    char advance();

    // Считывает цифры, затем необязательную точку и дробную часть.
    // Текст вида "3." также считается числом.
    Token makeNumber();
};

} // namespace safecalc
