#include "safecalc/batch_processor.hpp"
#include "safecalc/cli_options.hpp"
#include "safecalc/console.hpp"
#include "safecalc/errors.hpp"
#include "safecalc/evaluator.hpp"
#include "safecalc/file_utils.hpp"
#include "safecalc/generate_mode.hpp"
#include "safecalc/postfix_converter.hpp"
#include "safecalc/safe_evaluate.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace safecalc;

namespace {

// Логгер пишет в stderr, чтобы не смешиваться с результатами в stdout
void setupLogging(bool debug) {
    auto logger = spdlog::stderr_color_mt("safecalc");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    bool enabled = debug || isDebugLoggingEnabled();
    setDebugLogging(enabled);
    spdlog::set_level(enabled ? spdlog::level::debug : spdlog::level::info);
}

// Вычисление и вывод одного выражения
bool printEvaluation(const ExpressionEvaluator& evaluator, const std::string& expression, bool showPostfix) {
    try {
        if (showPostfix) {
            std::cout << Color::GRAY << "ОПН: " << formatPostfix(evaluator.toPostfix(expression))
                      << Color::RESET << "\n";
        }
        Number result = evaluator.evaluate(expression);
        std::cout << Color::GREEN << result.toString() << Color::RESET << "\n";
        return true;
    }
    catch (const EvaluationError& ex) {
        spdlog::debug("Выражение '{}' отклонено: {}", expression, errorKindName(ex.kind()));
        printError(ex.what());
        return false;
    }
}

int runSingleMode(const CliOptions& options) {
    ExpressionEvaluator evaluator(options.precision);
    return printEvaluation(evaluator, options.expression, options.showPostfix) ? 0 : 1;
}

void runInteractiveMode(const CliOptions& options) {
    printHeader();
    std::cout << "Введите выражение (пустая строка, exit или quit — выход).\n"
              << "Точность: " << Color::CYAN << options.precision << Color::RESET << " знака(ов)\n\n";

    ExpressionEvaluator evaluator(options.precision);
    std::string line;
    while (true) {
        std::cout << Color::BOLD << "> " << Color::RESET << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        // Удаление пробелов по краям
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty() || line == "exit" || line == "quit") {
            break;
        }

        printEvaluation(evaluator, line, options.showPostfix);
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
}

void runBatchMode(const CliOptions& options) {
    printHeader();

    BatchOptions batch;
    batch.inputPath = options.inputPath;
    batch.outputPath = options.outputPath.empty() ? defaultOutputPath(options.inputPath) : options.outputPath;
    batch.threadCount = options.threadCount == 0 ? defaultThreadCount() : options.threadCount;
    batch.precision = options.precision;

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << batch.inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << batch.outputPath << Color::RESET << "\n";
    std::cout << "  Потоков:       " << Color::CYAN << batch.threadCount << Color::RESET << "\n";
    std::cout << "  Точность:      " << Color::CYAN << batch.precision << Color::RESET << "\n\n";

    // Подсчет строк нужен только для индикатора прогресса
    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    std::size_t totalLines = countLinesInFile(batch.inputPath);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << totalLines << " строк)\n\n";

    std::cout << Color::BOLD << "Обработка выражений:\n" << Color::RESET;
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> finished{false};
    std::thread progressThread(displayProgress, std::cref(completed), totalLines, std::cref(finished));

    BatchSummary summary;
    try {
        summary = runBatch(batch, completed);
    }
    catch (...) {
        finished = true;
        progressThread.join();
        throw;
    }
    finished = true;
    progressThread.join();

    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
    if (summary.failed > 0) {
        std::cout << "  Ошибок:           " << Color::RED << summary.failed << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << summary.elapsed.count() << " мс" << Color::RESET << "\n";

    // Производительность (выражений в секунду)
    if (summary.elapsed.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
                  << static_cast<long long>(summary.total * 1000.0 / summary.elapsed.count())
                  << " выр/сек" << Color::RESET << "\n";
    }
    std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << batch.outputPath << Color::RESET << "\n\n";
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        CliOptions options = parseCommandLine(args);
        setupLogging(options.debug);

        switch (options.mode) {
        case CliMode::Help:
            std::cout << usageText();
            return 0;
        case CliMode::Single:
            return runSingleMode(options);
        case CliMode::Batch:
            runBatchMode(options);
            return 0;
        case CliMode::Generate:
            runGenerateMode(options);
            return 0;
        case CliMode::Interactive:
            runInteractiveMode(options);
            return 0;
        }
    }
    catch (const std::invalid_argument& ex) {
        printError(ex.what());
        std::cerr << "\n" << usageText();
        return 2;
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
    return 0;
}
