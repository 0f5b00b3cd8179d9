#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "safecalc/csv_writer.hpp"
#include "safecalc/evaluator.hpp"
#include "safecalc/thread_pool.hpp"

namespace safecalc {

// Строка входного файла с её номером
struct ExpressionLine {
    std::size_t number;
    std::string text;
};

// Параметры пакетной обработки файла
struct BatchOptions {
    std::filesystem::path inputPath;
    std::filesystem::path outputPath;
    std::size_t threadCount = 1;
    int precision = ExpressionEvaluator::kDefaultPrecision;
    std::size_t chunkSize = 10000; // Строк, читаемых за один раз
    std::size_t batchSize = 1000;  // Результатов, собираемых перед записью
};

// Итоги пакетной обработки
struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds elapsed{0};
};

// Вычисляет одну строку. Ошибка выражения превращается в запись со статусом "error".
EvaluationRecord evaluateLine(const ExpressionLine& line, const ExpressionEvaluator& evaluator);

// Обрабатывает файл: читает его порциями, вычисляет строки в пуле потоков
// и пишет результаты в CSV в порядке следования строк.
// completed увеличивается по мере вычисления строк (для индикатора прогресса).
// Выбрасывает std::runtime_error, если входной или выходной файл не открывается.
BatchSummary runBatch(const BatchOptions& options, std::atomic<std::size_t>& completed);
BatchSummary runBatch(const BatchOptions& options);

// Потоковая обработка: строки читаются порциями по chunkSize и сразу уходят в пул,
// результаты собираются пачками по batchSize и передаются в processBatch
// в исходном порядке. Файл целиком в память не загружается.
template <typename ProcessCallback>
void processExpressionsStreaming(std::istream& input,
                                 const ExpressionEvaluator& evaluator,
                                 ThreadPool& pool,
                                 std::atomic<std::size_t>& completed,
                                 ProcessCallback&& processBatch,
                                 std::size_t chunkSize,
                                 std::size_t batchSize) {
    if (chunkSize == 0) {
        chunkSize = 1;
    }
    if (batchSize == 0) {
        batchSize = 1;
    }

    std::vector<ExpressionLine> chunk;
    chunk.reserve(chunkSize);
    std::vector<std::future<EvaluationRecord>> futures;
    futures.reserve(batchSize);

    auto flushFutures = [&]() {
        if (futures.empty()) {
            return;
        }
        std::vector<EvaluationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    auto submitChunk = [&]() {
        for (auto& expressionLine : chunk) {
            futures.emplace_back(pool.enqueue(
                [line = std::move(expressionLine), &evaluator, &completed]() {
                    EvaluationRecord record = evaluateLine(line, evaluator);
                    completed.fetch_add(1);
                    return record;
                }));
            if (futures.size() >= batchSize) {
                flushFutures();
            }
        }
        chunk.clear();
    };

    std::string buffer;
    std::size_t lineNumber = 1;
    while (std::getline(input, buffer)) {
        chunk.push_back({lineNumber++, std::move(buffer)});
        if (chunk.size() >= chunkSize) {
            submitChunk();
        }
    }

    // Остаток, меньший chunkSize
    submitChunk();
    flushFutures();
}

} // namespace safecalc
