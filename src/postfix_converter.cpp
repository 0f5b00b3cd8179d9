#include "safecalc/postfix_converter.hpp"

#include "safecalc/operators.hpp"

namespace safecalc {

PostfixConverter::PostfixConverter(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

std::vector<Token> PostfixConverter::convert() {
    output.clear();
    stack.clear();
    output.reserve(tokens.size());

    for (const auto& token : tokens) {
        switch (token.type) {
        case TokenType::Number:
            output.push_back(token);
            break;
        case TokenType::LParen:
            stack.push_back(token);
            break;
        case TokenType::RParen:
            closeParenthesis();
            break;
        case TokenType::Operator:
            pushOperator(token);
            break;
        }
    }

    // Переносим оставшиеся операторы. Непарная "(" значения не несёт и отбрасывается.
    while (!stack.empty()) {
        if (stack.back().type == TokenType::Operator) {
            output.push_back(stack.back());
        }
        stack.pop_back();
    }

    return std::move(output);
}

void PostfixConverter::pushOperator(const Token& token) {
    const OperatorInfo* current = findOperator(token.symbol());
    if (current == nullptr) {
        return;
    }

    while (!stack.empty() && stack.back().type == TokenType::Operator) {
        const OperatorInfo* top = findOperator(stack.back().symbol());
        if (top == nullptr || !shouldPopOperator(*current, *top)) {
            break;
        }
        output.push_back(stack.back());
        stack.pop_back();
    }
    stack.push_back(token);
}

void PostfixConverter::closeParenthesis() {
    while (!stack.empty() && stack.back().type != TokenType::LParen) {
        output.push_back(stack.back());
        stack.pop_back();
    }
    // Если "(" не нашлась, стек уже пуст: ошибка проявится при вычислении
    if (!stack.empty()) {
        stack.pop_back();
    }
}

std::string formatPostfix(const std::vector<Token>& postfix) {
    std::string result;
    for (const auto& token : postfix) {
        if (!result.empty()) {
            result.push_back(' ');
        }
        result.append(token.text);
    }
    return result;
}

} // namespace safecalc
