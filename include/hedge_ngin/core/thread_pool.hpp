// include/hedge_ngin/core/thread_pool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>
#include "hedge_ngin/core/error.hpp"

namespace hedge_ngin {

/**
 * @brief Fixed-size worker pool with a bounded task queue
 *
 * submit() blocks while the queue is full. Tasks still queued at shutdown are
 * discarded; their futures report a broken promise.
 */
class ThreadPool {
public:
    /**
     * @brief Start the workers
     * @param num_threads Number of worker threads (at least 1)
     * @param max_queue_size Maximum number of queued, not yet running tasks
     */
    explicit ThreadPool(size_t num_threads, size_t max_queue_size = 1024);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task for execution
     * @param func Callable with no arguments
     * @return Future for the callable's return value
     * @throws HedgeError NOT_INITIALIZED if the pool has been shut down
     */
    template <typename Func>
    auto submit(Func func) -> std::future<typename std::invoke_result<Func>::type> {
        using ReturnType = typename std::invoke_result<Func>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::move(func));
        std::future<ReturnType> future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return stopping_ || tasks_.size() < max_queue_size_; });
            if (stopping_) {
                throw HedgeError(ErrorCode::NOT_INITIALIZED, "Thread pool is shut down",
                                 "ThreadPool");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        not_empty_.notify_one();
        return future;
    }

    /**
     * @brief Stop accepting tasks and join the workers
     */
    void shutdown();

    size_t size() const {
        return workers_.size();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    size_t max_queue_size_;
    bool stopping_{false};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

}  // namespace hedge_ngin
