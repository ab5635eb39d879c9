#include "chunkfs/core/PeriodicTask.hpp"

#include "chunkfs/daemon/StructuredLogger.hpp"

#include <exception>
#include <utility>

namespace chunkfs {

using daemon::StructuredLogger;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name_(std::move(name)),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&PeriodicTask::loop, this);
}

void PeriodicTask::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PeriodicTask::running() const noexcept {
    return running_.load(std::memory_order_acquire);
}

std::uint64_t PeriodicTask::runs() const noexcept {
    return runs_.load(std::memory_order_relaxed);
}

void PeriodicTask::loop() {
    while (true) {
        try {
            callback_();
        } catch (const std::exception& ex) {
            daemon::log_event(StructuredLogger::Level::Error,
                              "task.run.failed",
                              {{"task", name_}, {"error", ex.what()}});
        }
        runs_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock lock(mutex_);
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            return;
        }
    }
}

}  // namespace chunkfs
