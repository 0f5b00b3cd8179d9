#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "safecalc/number.hpp"

namespace safecalc {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber = 0;   // Номер строки (с единицы)
    std::string expression;       // Исходный текст выражения
    std::optional<Number> value;  // Результат, если вычисление успешно
    std::string status;           // "success" или "error"
    std::string errorKind;        // Имя вида ошибки (пусто при успехе)
    std::string message;          // Текст ошибки
};

// Запись результатов в CSV.
// Формат: line,expression,status,result,error,message
// Кавычки внутри текстовых полей заменяются на апострофы.
class CsvWriter {
public:
    // Создаёт (перезаписывает) файл и пишет заголовок.
    // Выбрасывает std::runtime_error, если файл не удалось открыть.
    explicit CsvWriter(std::filesystem::path targetPath);

    void writeRecord(const EvaluationRecord& record);
    void write(const std::vector<EvaluationRecord>& records);

    // Сбрасывает буфер на диск
    void flush();

    const std::filesystem::path& path() const { return target; }

private:
    std::filesystem::path target;
    std::ofstream stream;
};

} // namespace safecalc
