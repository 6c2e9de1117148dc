// ==============================================================================
// lexrefine/executor.hpp - Пул потоков с ограниченным параллелизмом
// ==============================================================================
//
// Назначение:
// - Фиксированное число рабочих потоков (max_concurrent)
// - Очередь задач под mutex + condition_variable
// - wait_idle(): дождаться завершения всех поставленных задач (граница batch)
//
// Исключение задачи не останавливает пул: сообщение возвращается из
// wait_idle(), остальные задачи выполняются.
//
// ==============================================================================

#ifndef LEXREFINE_EXECUTOR_HPP
#define LEXREFINE_EXECUTOR_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace lexrefine::orchestrator {

class BoundedExecutor {
public:
    /// threads == 0 -> hardware_concurrency (4 если неизвестно)
    explicit BoundedExecutor(std::size_t threads);
    ~BoundedExecutor();

    BoundedExecutor(const BoundedExecutor&) = delete;
    BoundedExecutor& operator=(const BoundedExecutor&) = delete;

    void submit(std::function<void()> task);

    /// Блокирует до опустошения очереди и завершения активных задач.
    /// Возвращает ошибки задач с прошлого вызова.
    std::vector<std::string> wait_idle();

    std::size_t thread_count() const { return threads_.size(); }

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void()>> queue_;
    std::vector<std::string> errors_;
    std::size_t active_ = 0;
    bool shutdown_ = false;
    std::vector<std::thread> threads_;
};

}  // namespace lexrefine::orchestrator

#endif  // LEXREFINE_EXECUTOR_HPP
