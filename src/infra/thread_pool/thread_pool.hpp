#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

namespace dbxfer::infra {

/// Пул потоков для локального хеширования файлов.
/// Порядок результатов задаёт вызывающий: future на каждую задачу.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = default_thread_count());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Задача с результатом; исключение задачи доставляется через future
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

    // Ждёт, пока очередь не опустеет и все задачи не завершатся
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

    // hardware_concurrency, но не больше 8 и не меньше 1
    [[nodiscard]] static auto default_thread_count() -> std::size_t;

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    bool stop_ = false;
    std::size_t active_tasks_ = 0;

    // последним: потоки должны остановиться раньше, чем умрут очередь и мьютекс
    std::vector<std::jthread> workers_;
};

// =============== Реализация ===============

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        [fn = std::forward<F>(f), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable {
            return std::apply(fn, std::move(tup));
        }
    );

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

inline auto ThreadPool::default_thread_count() -> std::size_t {
    const std::size_t hw = std::thread::hardware_concurrency();
    if (hw == 0) return 1;
    return hw > 8 ? 8 : hw;
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
    for (auto& w : workers_) {
        w.request_stop();
    }
    // jthread: join в деструкторе
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, [this, &st] {
                return st.stop_requested() || stop_ || !tasks_.empty();
            });
            // оставшиеся задачи выполняются до выхода, иначе их future зависнут
            if (tasks_.empty()) {
                return;
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

} // namespace dbxfer::infra
