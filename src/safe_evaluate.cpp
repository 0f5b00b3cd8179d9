#include "safecalc/safe_evaluate.hpp"

#include "safecalc/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>

namespace safecalc {

namespace {
bool debugFromEnvironment() {
    const char* value = std::getenv("SAFECALC_DEBUG");
    return value != nullptr && parseFlag(value);
}

std::atomic<bool>& debugFlag() {
    static std::atomic<bool> flag{debugFromEnvironment()};
    return flag;
}
}

bool parseFlag(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

void setDebugLogging(bool enabled) {
    debugFlag().store(enabled);
}

bool isDebugLoggingEnabled() {
    return debugFlag().load();
}

std::optional<Number> evaluateOrNull(const std::string& expression, int precision) {
    thread_local std::unique_ptr<ExpressionEvaluator> evaluator;
    if (!evaluator || evaluator->precision() != std::max(0, precision)) {
        evaluator = std::make_unique<ExpressionEvaluator>(precision);
    }

    try {
        return evaluator->evaluate(expression);
    }
    catch (const EvaluationError& ex) {
        if (isDebugLoggingEnabled()) {
            spdlog::warn("Ошибка вычисления выражения '{}': {} ({})", expression, ex.what(),
                         errorKindName(ex.kind()));
        }
        return std::nullopt;
    }
}

} // namespace safecalc
