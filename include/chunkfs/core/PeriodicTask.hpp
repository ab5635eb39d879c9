#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace chunkfs {

// Runs a callback on its own thread every `interval` until stop(). The first
// run happens immediately after start(). Exceptions thrown by the callback are
// logged and the schedule continues.
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint64_t runs() const noexcept;

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> runs_{0};
};

}  // namespace chunkfs
