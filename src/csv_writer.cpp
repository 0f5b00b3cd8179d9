#include "safecalc/csv_writer.hpp"

#include <stdexcept>

namespace safecalc {

namespace {
// Оборачивает поле в кавычки, заменяя внутренние двойные кавычки на одинарные
std::string quoted(const std::string& text) {
    std::string result;
    result.reserve(text.size() + 2);
    result.push_back('"');
    for (char ch : text) {
        result.push_back(ch == '"' ? '\'' : ch);
    }
    result.push_back('"');
    return result;
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : target(std::move(targetPath)), stream(target, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + target.string());
    }
    stream << "line,expression,status,result,error,message\n";
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << record.lineNumber << ',' << quoted(record.expression) << ',' << record.status << ',';
    if (record.value.has_value()) {
        stream << record.value->toString();
    }
    stream << ',' << record.errorKind << ',' << quoted(record.message) << '\n';

    if (!stream) {
        throw std::runtime_error("Ошибка записи в CSV файл: " + target.string());
    }
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
}

void CsvWriter::flush() {
    stream.flush();
}

} // namespace safecalc
