#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace safecalc {

// Пул потоков для пакетного вычисления выражений.
// Задачи выполняются в порядке постановки в очередь; деструктор
// дожидается выполнения всех уже поставленных задач.
class ThreadPool {
public:
    // Значение 0 заменяется на 1
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задачу в очередь и возвращает future с её результатом.
    // Исключение, выброшенное задачей, передаётся через future.
    template <class Func>
    auto enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;
    std::condition_variable condition;
    bool stop = false;

    void workerLoop();
};

template <class Func>
inline auto ThreadPool::enqueue(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Return = std::invoke_result_t<Func>;

    // packaged_task некопируемый, а std::function требует копируемости — храним через shared_ptr
    auto task = std::make_shared<std::packaged_task<Return()>>(std::forward<Func>(func));
    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    condition.notify_one();
    return result;
}

} // namespace safecalc
