// src/core/thread_pool.cpp

#include "hedge_ngin/core/thread_pool.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size == 0 ? 1 : max_queue_size) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        tasks_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop() {
    Logger::register_component("ThreadPool");

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        not_full_.notify_one();

        // packaged_task stores exceptions in the future
        task();
    }
}

}  // namespace hedge_ngin
