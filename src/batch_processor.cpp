#include "safecalc/batch_processor.hpp"

#include "safecalc/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace safecalc {

EvaluationRecord evaluateLine(const ExpressionLine& line, const ExpressionEvaluator& evaluator) {
    EvaluationRecord record;
    record.lineNumber = line.number;
    record.expression = line.text;
    try {
        record.value = evaluator.evaluate(line.text);
        record.status = "success";
    }
    catch (const EvaluationError& ex) {
        record.value.reset();
        record.status = "error";
        record.errorKind = std::string(errorKindName(ex.kind()));
        record.message = ex.what();
    }
    return record;
}

BatchSummary runBatch(const BatchOptions& options, std::atomic<std::size_t>& completed) {
    std::ifstream input(options.inputPath);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + options.inputPath.string());
    }

    spdlog::debug("Пакетная обработка: {} -> {}, потоков: {}, точность: {}",
                  options.inputPath.string(), options.outputPath.string(), options.threadCount,
                  options.precision);

    auto start = std::chrono::steady_clock::now();

    ExpressionEvaluator evaluator(options.precision);
    CsvWriter writer(options.outputPath);
    BatchSummary summary;

    // Пачки приходят в порядке строк, поэтому пишем их сразу
    auto processBatch = [&](const std::vector<EvaluationRecord>& batch) {
        for (const auto& record : batch) {
            ++summary.total;
            if (record.value.has_value()) {
                ++summary.succeeded;
            } else {
                ++summary.failed;
            }
        }
        writer.write(batch);
    };

    {
        // Пул уничтожается до записи итогов: все задачи к этому моменту завершены
        ThreadPool pool(options.threadCount);
        processExpressionsStreaming(input, evaluator, pool, completed, processBatch,
                                    options.chunkSize, options.batchSize);
    }
    writer.flush();

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::info("Обработано выражений: {} (успешно: {}, ошибок: {}) за {} мс", summary.total,
                 summary.succeeded, summary.failed, summary.elapsed.count());
    return summary;
}

BatchSummary runBatch(const BatchOptions& options) {
    std::atomic<std::size_t> completed{0};
    return runBatch(options, completed);
}

} // namespace safecalc
