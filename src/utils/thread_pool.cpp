#include "utils/thread_pool.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <exception>

namespace SpecOpt {
namespace Utils {

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(num_threads == 0 ? std::max(1u, std::thread::hardware_concurrency()) : num_threads),
      stop_(false),
      pending_(0),
      next_queue_(0) {

    ModuleLogger logger("THREAD_POOL");
    logger.debug("Starting " + std::to_string(num_threads_) + " workers");

    work_queues_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        work_queues_.push_back(std::make_unique<WorkQueue>());
    }

    threads_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        threads_.emplace_back(&ThreadPool::worker, this, i);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        stop_.store(true, std::memory_order_release);
    }
    sleep_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool ThreadPool::try_pop(size_t thread_id, std::function<void()>& task) {
    // Own queue first, then steal round-robin
    for (size_t i = 0; i < num_threads_; ++i) {
        size_t queue_id = (thread_id + i) % num_threads_;
        std::lock_guard<std::mutex> lock(work_queues_[queue_id]->mutex);
        if (!work_queues_[queue_id]->tasks.empty()) {
            task = std::move(work_queues_[queue_id]->tasks.front());
            work_queues_[queue_id]->tasks.pop();
            return true;
        }
    }
    return false;
}

void ThreadPool::worker(size_t thread_id) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait(lock, [this]() {
                return stop_.load(std::memory_order_acquire) ||
                       pending_.load(std::memory_order_acquire) > 0;
            });
            if (stop_.load(std::memory_order_acquire) && pending_.load(std::memory_order_acquire) == 0) {
                return;
            }
        }

        std::function<void()> task;
        if (!try_pop(thread_id, task)) {
            // Another worker took it between the wake-up and the pop
            std::this_thread::yield();
            continue;
        }

        pending_.fetch_sub(1, std::memory_order_acq_rel);

        // packaged_task stores exceptions in the future; nothing escapes here
        task();
    }
}

void ThreadPool::parallel_for(size_t start, size_t end, const std::function<void(size_t)>& func) {
    if (start >= end) return;

    std::vector<std::future<void>> futures;
    futures.reserve(end - start);

    for (size_t i = start; i < end; ++i) {
        futures.push_back(submit([&func, i]() { func(i); }));
    }

    // Wait for every task before rethrowing so none still references func
    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace Utils
} // namespace SpecOpt
