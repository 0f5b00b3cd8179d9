#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace safecalc {

// Режим работы консольной утилиты
enum class CliMode {
    Interactive, // Ввод выражений построчно
    Single,      // Одно выражение из аргументов
    Batch,       // Обработка файла (--file)
    Generate,    // Генерация файла выражений
    Help
};

// Параметры командной строки
struct CliOptions {
    CliMode mode = CliMode::Interactive;
    std::string expression;
    std::filesystem::path inputPath;
    std::filesystem::path outputPath;  // Пусто — имя по умолчанию
    std::size_t threadCount = 0;       // 0 — по числу ядер
    int precision = 2;
    bool showPostfix = false;
    bool debug = false;
    std::size_t generateCount = 0;
    std::optional<unsigned> seed;
};

// Разбор аргументов. Выбрасывает std::invalid_argument при ошибке.
CliOptions parseCommandLine(const std::vector<std::string>& args);

// Безопасный парсинг положительного числа из строки
std::size_t parsePositive(const std::string& value, const std::string& optionName);

// Парсинг неотрицательной точности
int parsePrecision(const std::string& value);

// Число потоков по умолчанию
std::size_t defaultThreadCount();

// Текст справки
std::string usageText();

} // namespace safecalc
