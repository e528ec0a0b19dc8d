#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <memory>
#include <type_traits>

namespace cverify::infra {

// Пул для параллельного запуска независимых операций копирования.
// Одну операцию (один файл) пул никогда не дробит.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Удалить копирование и присваивание
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи с возвратом (future)
    template<typename F>
    auto enqueue_with_future(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Блокирующее ожидание завершения всех поставленных задач
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable idle_cv_;
    std::size_t active_tasks_ = 0; // под queue_mutex_
    bool stop_ = false;
    std::vector<std::jthread> workers_; // последним: потоки стартуют после остальных полей
};

// =============== Реализация шаблонов ===============

template<typename F>
auto ThreadPool::enqueue_with_future(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>>;

    // packaged_task не копируется, std::function требует копируемости
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    // jthread сам вызовет request_stop и join; оставшиеся задачи дорабатываются
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return; // stop_ или request_stop, и очередь пуста
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

} // namespace cverify::infra
