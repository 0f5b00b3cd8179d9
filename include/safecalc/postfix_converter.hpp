#pragma once

#include <string>
#include <vector>

#include "safecalc/token.hpp"

namespace safecalc {

// Преобразование инфиксной записи в постфиксную (обратную польскую)
// по алгоритму сортировочной станции Дейкстры.
//
// Структурные ошибки (лишняя закрывающая скобка, ")(" и т.п.) здесь
// не диагностируются: они проявляются при вычислении постфиксной записи
// как нехватка операндов или лишние значения в стеке.
class PostfixConverter {
public:
    explicit PostfixConverter(std::vector<Token> tokens);

    // Возвращает лексемы в постфиксном порядке (только числа и операторы)
    std::vector<Token> convert();

private:
    const std::vector<Token> tokens;
    std::vector<Token> output;
    std::vector<Token> stack; // Операторы и открывающие скобки

    // Выталкивает операторы, которые должны выполниться раньше текущего
    void pushOperator(const Token& token);

    // Выталкивает операторы до ближайшей открывающей скобки и удаляет её
    void closeParenthesis();
};

// Постфиксная запись в виде строки, лексемы разделены пробелом: "2 3 4 * +"
std::string formatPostfix(const std::vector<Token>& postfix);

} // namespace safecalc
