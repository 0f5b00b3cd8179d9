#pragma once

#include <atomic>
#include <cstddef>
#include <string>

namespace safecalc {

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Вывод сообщения об ошибке в stderr
void printError(const std::string& message);

// Индикатор прогресса. Запускается в отдельном потоке и работает,
// пока не обработаны все строки или не выставлен флаг finished.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& finished);

} // namespace safecalc
