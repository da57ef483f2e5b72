#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <type_traits>

namespace SpecOpt {
namespace Utils {

// Fixed-size worker pool used to step environments in parallel.
// Per-thread queues with stealing; idle workers sleep on a condition variable.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result; exceptions surface through the future
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<typename std::result_of<F(Args...)>::type>;

    // Run func(i) for every i in [start, end) and block until all finish.
    // Rethrows the first exception raised by any iteration.
    void parallel_for(size_t start, size_t end, const std::function<void(size_t)>& func);

    size_t size() const { return num_threads_; }

private:
    void worker(size_t thread_id);
    bool try_pop(size_t thread_id, std::function<void()>& task);

    struct WorkQueue {
        std::queue<std::function<void()>> tasks;
        std::mutex mutex;
    };

    std::vector<std::thread> threads_;
    std::vector<std::unique_ptr<WorkQueue>> work_queues_;

    size_t num_threads_;
    std::atomic<bool> stop_;
    std::atomic<size_t> pending_;
    std::atomic<size_t> next_queue_;

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {

    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    size_t queue_id = next_queue_.fetch_add(1, std::memory_order_relaxed) % num_threads_;

    {
        std::lock_guard<std::mutex> lock(work_queues_[queue_id]->mutex);
        work_queues_[queue_id]->tasks.emplace([task]() { (*task)(); });
    }

    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        pending_.fetch_add(1, std::memory_order_release);
    }
    sleep_cv_.notify_one();

    return result;
}

} // namespace Utils
} // namespace SpecOpt
