// Генератор арифметических выражений для нагрузочного тестирования.
// Выражения строятся из неотрицательных десятичных чисел, операторов + - * / ^
// и скобок. С малой вероятностью вносятся ошибки: деление на ноль,
// незакрытая скобка, лишний символ.

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <random>
#include <string>

namespace safecalc {

class ExpressionGenerator {
public:
    // Вероятность внесения ошибки по умолчанию (5%)
    static constexpr double kDefaultErrorProbability = 0.05;

    // Без seed генератор инициализируется из std::random_device
    explicit ExpressionGenerator(std::optional<unsigned> seed = std::nullopt,
                                 double errorProbability = kDefaultErrorProbability);

    // Генерирует выражение заданной глубины вложенности
    std::string generate(int depth);

private:
    std::mt19937 gen;
    double errorProbability;

    std::uniform_real_distribution<> numDist;
    std::uniform_int_distribution<> opDist;
    std::uniform_int_distribution<> exponentDist;
    std::uniform_real_distribution<> chanceDist;
    std::uniform_int_distribution<> errorTypeDist;
    std::uniform_int_distribution<> charDist;
    std::uniform_int_distribution<> typeRollDist;

    bool roll(double probability) { return chanceDist(gen) < probability; }

    std::string generateNumber(bool avoidZero = false);
    std::string generateBinary(int depth);

    // Вносит ошибку в выражение с вероятностью errorProbability
    std::string introduceError(std::string expr);
};

// Записывает count сгенерированных выражений в файл, по одному на строку.
// Глубина выражений чередуется от 4 до 8.
void writeGeneratedExpressions(const std::filesystem::path& outputPath, std::size_t count,
                               std::optional<unsigned> seed);

} // namespace safecalc
