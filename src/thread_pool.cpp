#include "safecalc/thread_pool.hpp"

namespace safecalc {

ThreadPool::ThreadPool(std::size_t threadCount) {
    // Пул без потоков никогда не выполнил бы ни одного выражения
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop = true;
    }

    // Потоки доделывают уже поставленные выражения и завершаются,
    // поэтому после разрушения пула все future пакета готовы
    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// Цикл рабочего потока: берёт вычисление строки из очереди и выполняет его
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);

            // Спим, пока не появится строка или не придёт сигнал остановки
            condition.wait(lock, [this]() { return stop || !tasks.empty(); });

            // Остановка только после того, как очередь опустела
            if (stop && tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
        }

        // Вычисление идёт вне блокировки, чтобы остальные потоки могли брать задачи.
        // Исключения задачи попадают в её future через packaged_task.
        task();
    }
}

} // namespace safecalc
