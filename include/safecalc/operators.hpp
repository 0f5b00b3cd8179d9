#pragma once

#include <array>

namespace safecalc {

// Ассоциативность бинарного оператора
enum class Associativity {
    Left,
    Right
};

// Описание оператора: приоритет и ассоциативность
struct OperatorInfo {
    char symbol;
    int precedence;
    Associativity associativity;
};

// Таблица поддерживаемых операторов
inline constexpr std::array<OperatorInfo, 5> kOperators = {{
    {'+', 1, Associativity::Left},
    {'-', 1, Associativity::Left},
    {'*', 2, Associativity::Left},
    {'/', 2, Associativity::Left},
    {'^', 3, Associativity::Right},
}};

// Поиск оператора в таблице. Возвращает nullptr для неизвестного символа.
constexpr const OperatorInfo* findOperator(char symbol) {
    for (const auto& info : kOperators) {
        if (info.symbol == symbol) {
            return &info;
        }
    }
    return nullptr;
}

constexpr bool isOperator(char symbol) {
    return findOperator(symbol) != nullptr;
}

// Условие выталкивания оператора с вершины стека при алгоритме сортировочной станции.
// Левоассоциативный оператор выталкивает операторы с приоритетом не ниже своего,
// правоассоциативный — только со строго большим приоритетом.
constexpr bool shouldPopOperator(const OperatorInfo& current, const OperatorInfo& stackTop) {
    if (current.associativity == Associativity::Left) {
        return current.precedence <= stackTop.precedence;
    }
    return current.precedence < stackTop.precedence;
}

} // namespace safecalc
