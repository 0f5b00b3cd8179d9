#pragma once

#include <string>

namespace safecalc {

// Удаляет из выражения все пробельные символы.
// Выбрасывает EvaluationError (EmptyExpression), если после очистки строка пуста.
std::string sanitizeExpression(const std::string& expression);

// Проверяет очищенное выражение:
// - допустимы только цифры, точка, операторы + - * / ^ и круглые скобки;
// - количество открывающих скобок равно количеству закрывающих.
// Порядок вложенности скобок здесь не проверяется, такие ошибки
// обнаруживаются на этапе вычисления постфиксной записи.
void validateExpression(const std::string& expression);

} // namespace safecalc
