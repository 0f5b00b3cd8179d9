#pragma once

#include "safecalc/number.hpp"

namespace safecalc {

// Округление до precision знаков после запятой (половина — от нуля).
// Масштабированное значение предварительно округляется до 15 значащих цифр,
// поэтому 1.005 с точностью 2 даёт 1.01.
// Нечисловые значения и значения за пределами 15 значащих цифр возвращаются без изменений.
double roundToPrecision(double value, int precision);

// Округляет результат и приводит его к целому, если дробная часть равна нулю.
// Отрицательная точность считается нулевой.
Number formatResult(double value, int precision);

} // namespace safecalc
