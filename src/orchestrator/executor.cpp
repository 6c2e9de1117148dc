// ==============================================================================
// executor.cpp - Пул потоков с ограниченным параллелизмом
// ==============================================================================

#include <lexrefine/executor.hpp>

#include <exception>
#include <optional>

namespace lexrefine::orchestrator {

BoundedExecutor::BoundedExecutor(std::size_t threads) {
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) {
            threads = 4;
        }
    }
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

BoundedExecutor::~BoundedExecutor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void BoundedExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(task));
    }
    work_cv_.notify_one();
}

std::vector<std::string> BoundedExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
    std::vector<std::string> errors;
    errors.swap(errors_);
    return errors;
}

void BoundedExecutor::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            // Оставшиеся задачи дорабатываются до выхода
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop();
            ++active_;
        }

        std::optional<std::string> error;
        try {
            task();
        } catch (const std::exception& e) {
            error = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (error) {
                errors_.push_back(std::move(*error));
            }
            --active_;
            if (queue_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

}  // namespace lexrefine::orchestrator
