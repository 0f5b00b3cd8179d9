#include "safecalc/result_formatter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace safecalc {

namespace {
// Граница точного представления целых в double с запасом на 15 значащих цифр
constexpr double kMaxScaled = 1e15;

// 2^63: всё, что меньше по модулю, помещается в int64
constexpr double kInt64Limit = 9223372036854775808.0;
}

double roundToPrecision(double value, int precision) {
    if (!std::isfinite(value)) {
        return value;
    }

    double factor = std::pow(10.0, std::max(0, precision));
    double scaled = value * factor;
    if (!std::isfinite(scaled) || std::abs(scaled) >= kMaxScaled) {
        return value;
    }

    // Предварительное округление убирает хвост двоичного представления (1.005 * 100 = 100.49999...)
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", scaled);
    double preRounded = std::strtod(buffer, nullptr);

    return std::round(preRounded) / factor;
}

Number formatResult(double value, int precision) {
    precision = std::max(0, precision);
    double rounded = roundToPrecision(value, precision);

    if (std::isfinite(rounded) && rounded == std::trunc(rounded)) {
        if (rounded >= -kInt64Limit && rounded < kInt64Limit) {
            return Number::integer(static_cast<std::int64_t>(rounded));
        }
        // Целое, не помещающееся в int64, остаётся double без знаков после запятой
        return Number::real(rounded, 0);
    }
    return Number::real(rounded, precision);
}

} // namespace safecalc
