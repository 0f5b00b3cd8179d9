#include "safecalc/generate_mode.hpp"

#include "safecalc/console.hpp"
#include "safecalc/expression_generator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace safecalc {

void runGenerateMode(const CliOptions& options) {
    printHeader();
    std::cout << Color::BOLD << Color::CYAN << "Режим генерации выражений\n" << Color::RESET << "\n";

    std::filesystem::path outputPath = options.outputPath;
    if (outputPath.empty()) {
        outputPath = "generate_" + std::to_string(options.generateCount) + ".txt";
    }

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество выражений: " << Color::CYAN << options.generateCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:        " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    auto start = std::chrono::steady_clock::now();

    writeGeneratedExpressions(outputPath, options.generateCount, options.seed);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::debug("Сгенерировано {} выражений в {}", options.generateCount, outputPath.string());

    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << options.generateCount
              << " выражений, " << duration.count() << " мс)\n\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}

} // namespace safecalc
