#include "chunkfs/core/WorkerPool.hpp"

#include <algorithm>

namespace chunkfs {

WorkerPool::WorkerPool(std::size_t threads) {
    const auto count = std::max<std::size_t>(threads, 1);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&WorkerPool::run, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::post(Task task) {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shutting down");
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::pending() const {
    std::scoped_lock lock(mutex_);
    return tasks_.size();
}

void WorkerPool::run() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

}  // namespace chunkfs
