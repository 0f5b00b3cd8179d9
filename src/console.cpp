#include "safecalc/console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace safecalc {

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Безопасный калькулятор выражений safecalc v1.0         ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: " << Color::RESET << Color::RED << message
              << Color::RESET << "\n";
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& finished) {
    const int barWidth = 50;
    while (completed.load() < total && !finished.load()) {
        std::size_t current = completed.load();
        float progress = static_cast<float>(current) / static_cast<float>(total);
        int pos = static_cast<int>(barWidth * progress);

        std::cout << "\r  " << Color::CYAN << "[";
        for (int i = 0; i < barWidth; ++i) {
            if (i < pos) std::cout << "█";
            else if (i == pos) std::cout << "▒";
            else std::cout << "░";
        }
        std::cout << "] " << Color::BOLD << std::setw(3) << static_cast<int>(progress * 100.0f)
                  << "%" << Color::RESET << " (" << current << "/" << total << ")";
        std::cout.flush();

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (completed.load() < total) {
        // Обработка прервана
        std::cout << "\n";
        return;
    }

    // Финальное обновление до 100%
    std::cout << "\r  " << Color::GREEN << "[";
    for (int i = 0; i < barWidth; ++i) std::cout << "█";
    std::cout << "] " << Color::BOLD << "100%" << Color::RESET
              << " (" << total << "/" << total << ")\n";
}

} // namespace safecalc
