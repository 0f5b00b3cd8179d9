#include "safecalc/number.hpp"

#include <cmath>
#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace safecalc {

namespace {
// Знаков после запятой достаточно для последней значащей цифры наименьшего субнормального double
constexpr int kMaxPrintedDecimals = std::numeric_limits<double>::max_digits10 + 324;
}

Number Number::integer(std::int64_t value) {
    return Number(value, 0);
}

Number Number::real(double value, int decimals) {
    return Number(value, decimals < 0 ? 0 : decimals);
}

std::int64_t Number::asInteger() const {
    if (!isInteger()) {
        throw std::logic_error("Результат не является целым числом");
    }
    return std::get<std::int64_t>(value);
}

double Number::toDouble() const {
    if (isInteger()) {
        return static_cast<double>(std::get<std::int64_t>(value));
    }
    return std::get<double>(value);
}

std::string Number::toString() const {
    if (isInteger()) {
        return std::to_string(std::get<std::int64_t>(value));
    }

    double real = std::get<double>(value);
    if (std::isnan(real)) {
        return "nan";
    }
    if (std::isinf(real)) {
        return real > 0 ? "inf" : "-inf";
    }

    // Целое значение за пределами int64 выводится без дробной части
    int digits = real == std::trunc(real) ? 0 : std::min(decimalDigits, kMaxPrintedDecimals);

    std::ostringstream stream;
    stream.setf(std::ios::fixed);
    stream << std::setprecision(digits) << real;
    return stream.str();
}

} // namespace safecalc
