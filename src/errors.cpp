#include "safecalc/errors.hpp"

namespace safecalc {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::EmptyExpression:
        return "EmptyExpression";
    case ErrorKind::InvalidCharacters:
        return "InvalidCharacters";
    case ErrorKind::MismatchedParentheses:
        return "MismatchedParentheses";
    case ErrorKind::InsufficientOperands:
        return "InsufficientOperands";
    case ErrorKind::DivisionByZero:
        return "DivisionByZero";
    case ErrorKind::InvalidExpression:
        return "InvalidExpression";
    }
    return "Unknown";
}

EvaluationError::EvaluationError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), errorKind(kind) {}

} // namespace safecalc
