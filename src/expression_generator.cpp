#include "safecalc/expression_generator.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace safecalc {

namespace {
constexpr std::array<char, 5> kOperations = {'+', '-', '*', '/', '^'};

unsigned makeSeed(std::optional<unsigned> seed) {
    if (seed.has_value()) {
        return *seed;
    }
    std::random_device rd;
    return rd();
}
}

ExpressionGenerator::ExpressionGenerator(std::optional<unsigned> seed, double errorProbability)
    : gen(makeSeed(seed)),
      errorProbability(errorProbability),
      numDist(0.0, 100.0),
      opDist(0, static_cast<int>(kOperations.size()) - 1),
      exponentDist(0, 3), // Небольшие степени, чтобы не уходить в бесконечность
      chanceDist(0.0, 1.0),
      errorTypeDist(0, 2),
      charDist(33, 126), // Печатные символы без пробела
      typeRollDist(0, 19) {}

std::string ExpressionGenerator::generate(int depth) {
    if (depth <= 0) {
        return generateNumber();
    }

    // 0-15 бинарная операция (80%), 16-18 группировка скобками (15%), 19 число (5%)
    int typeRoll = typeRollDist(gen);
    if (typeRoll < 16) {
        return generateBinary(depth);
    }
    if (typeRoll < 19) {
        return introduceError("(" + generate(depth - 1) + ")");
    }
    return generateNumber();
}

std::string ExpressionGenerator::generateBinary(int depth) {
    char op = kOperations[static_cast<std::size_t>(opDist(gen))];
    std::string left = generate(depth - 1);
    std::string right;

    if (op == '^') {
        right = std::to_string(exponentDist(gen));
    } else if (op == '/' && roll(errorProbability * 0.3)) {
        right = "0"; // Редкое деление на ноль
    } else if (op == '/') {
        right = generateNumber(true);
    } else {
        right = generate(depth - 1);
    }

    std::string result;
    result.reserve(left.size() + right.size() + 5);
    result.append("(");
    result.append(left);
    result.append(" ");
    result.append(1, op);
    result.append(" ");
    result.append(right);
    result.append(")");
    return introduceError(std::move(result));
}

std::string ExpressionGenerator::generateNumber(bool avoidZero) {
    double num = numDist(gen);
    if (avoidZero && num < 0.1) {
        num = 1.0;
    }

    char buffer[32];
    if (roll(0.5)) {
        // Целое число
        std::snprintf(buffer, sizeof(buffer), "%d", static_cast<int>(num) + (avoidZero ? 1 : 0));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.2f", num);
    }
    return std::string(buffer);
}

std::string ExpressionGenerator::introduceError(std::string expr) {
    if (!roll(errorProbability)) {
        return expr;
    }

    switch (errorTypeDist(gen)) {
    case 0: // Незакрытая скобка: убираем последнюю закрывающую
        for (std::size_t i = expr.length(); i > 0; --i) {
            if (expr[i - 1] == ')') {
                expr.erase(i - 1, 1);
                break;
            }
        }
        break;
    case 1: // Лишний символ в середине выражения
        if (expr.length() > 2) {
            expr.insert(expr.length() / 2, 1, static_cast<char>(charDist(gen)));
        }
        break;
    case 2: // Лишняя открывающая скобка
        if (expr.length() > 1) {
            std::uniform_int_distribution<std::size_t> posDist(0, expr.length() - 1);
            expr.insert(posDist(gen), "(");
        }
        break;
    default:
        break;
    }
    return expr;
}

void writeGeneratedExpressions(const std::filesystem::path& outputPath, std::size_t count,
                               std::optional<unsigned> seed) {
    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    ExpressionGenerator generator(seed);

    // Строки собираются в буфер и записываются пачками
    constexpr std::size_t batchSize = 10000;
    std::vector<std::string> buffer;
    buffer.reserve(batchSize);

    auto flushBuffer = [&]() {
        for (const auto& line : buffer) {
            output << line << '\n';
        }
        buffer.clear();
    };

    for (std::size_t i = 0; i < count; ++i) {
        int depth = 4 + static_cast<int>(i % 5);
        buffer.emplace_back(generator.generate(depth));
        if (buffer.size() >= batchSize) {
            flushBuffer();
        }
    }
    flushBuffer();

    output.flush();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }
}

} // namespace safecalc
