#pragma once

#include <optional>
#include <string>

#include "safecalc/evaluator.hpp"

namespace safecalc {

// Вычисляет выражение, не выбрасывая исключений.
// Возвращает std::nullopt при любой ошибке выражения; если включено
// отладочное логирование, текст ошибки пишется в лог.
// Вычислитель кэшируется для каждого потока и пересоздаётся только
// при смене точности.
std::optional<Number> evaluateOrNull(const std::string& expression,
                                     int precision = ExpressionEvaluator::kDefaultPrecision);

// Включение/выключение логирования ошибок в evaluateOrNull.
// Начальное значение берётся из переменной окружения SAFECALC_DEBUG.
void setDebugLogging(bool enabled);
bool isDebugLoggingEnabled();

// Разбор значения флага: "1", "true", "yes", "on" (без учёта регистра)
bool parseFlag(const std::string& value);

} // namespace safecalc
