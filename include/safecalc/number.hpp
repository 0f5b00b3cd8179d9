#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace safecalc {

// Результат вычисления: целое число либо вещественное,
// округлённое до заданного количества знаков после запятой.
class Number {
public:
    // Целый результат (дробная часть после округления равна нулю)
    static Number integer(std::int64_t value);

    // Вещественный результат с указанием числа знаков после запятой
    static Number real(double value, int decimals);

    bool isInteger() const { return std::holds_alternative<std::int64_t>(value); }

    // Значение целого результата.
    // Выбрасывает std::logic_error, если результат вещественный.
    std::int64_t asInteger() const;

    // Значение в виде double для любого варианта
    double toDouble() const;

    // Количество знаков после запятой (0 для целого)
    int decimals() const { return decimalDigits; }

    // Текстовое представление: "5", "6.28", "inf", "nan".
    // Целые значения выводятся без десятичной точки.
    std::string toString() const;

    bool operator==(const Number& other) const = default;

private:
    Number(std::variant<std::int64_t, double> value, int decimals)
        : value(value), decimalDigits(decimals) {}

    std::variant<std::int64_t, double> value;
    int decimalDigits = 0;
};

} // namespace safecalc
