#include "safecalc/tokenizer.hpp"

#include "safecalc/operators.hpp"

#include <cctype>
#include <cstdlib>

namespace safecalc {

namespace {
bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        char ch = peek();
        if (isDigit(ch)) {
            tokens.push_back(makeNumber());
        } else if (ch == '(') {
            tokens.push_back({TokenType::LParen, 0.0, "(", index});
            advance();
        } else if (ch == ')') {
            tokens.push_back({TokenType::RParen, 0.0, ")", index});
            advance();
        } else if (isOperator(ch)) {
            tokens.push_back({TokenType::Operator, 0.0, std::string(1, ch), index});
            advance();
        } else {
            // Символ вне лексемы
            advance();
        }
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

Token Tokenizer::makeNumber() {
    std::size_t start = index;
    while (!isAtEnd() && isDigit(peek())) {
        advance();
    }
    if (!isAtEnd() && peek() == '.') {
        advance();
        while (!isAtEnd() && isDigit(peek())) {
            advance();
        }
    }

    std::string text = source.substr(start, index - start);
    // strtod вместо stod: слишком длинные литералы дают бесконечность, а не исключение
    double value = std::strtod(text.c_str(), nullptr);
    return {TokenType::Number, value, text, start};
}

} // namespace safecalc
