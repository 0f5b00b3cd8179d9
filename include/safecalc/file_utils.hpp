#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace safecalc {

// Быстрый подсчет количества строк в файле
// Читает файл блоками и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path);

// Текущее локальное время в формате YYYYMMDD_HHMMSS для имени файла
std::string getCurrentTimeString();

// Имя файла результатов по умолчанию: <имя входного файла>_results_<время>.csv
std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath);

} // namespace safecalc
