#include "chunkfs/core/PeriodicTask.hpp"
#include "chunkfs/core/WorkerPool.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace chunkfs;
using namespace std::chrono_literals;

int main() {
    test::quiet_logs();

    // Work is bounded by the pool size and every task runs.
    {
        WorkerPool pool(3);
        assert(pool.size() == 3);
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::vector<std::future<int>> results;
        for (int i = 0; i < 24; ++i) {
            results.push_back(pool.submit([&running, &peak, i]() {
                const auto now = ++running;
                int observed = peak.load();
                while (now > observed && !peak.compare_exchange_weak(observed, now)) {
                }
                std::this_thread::sleep_for(5ms);
                --running;
                return i * i;
            }));
        }
        for (int i = 0; i < 24; ++i) {
            assert(results[static_cast<std::size_t>(i)].get() == i * i);
        }
        assert(peak.load() <= 3);
        assert(peak.load() >= 1);
    }

    // Exceptions surface through the future.
    {
        WorkerPool pool(1);
        auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
        bool threw = false;
        try {
            failing.get();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(pool.submit([]() { return 5; }).get() == 5);
    }

    // Shutdown drains queued work and refuses more.
    {
        std::atomic<int> done{0};
        WorkerPool pool(0);
        assert(pool.size() == 1);
        for (int i = 0; i < 10; ++i) {
            pool.post([&done]() {
                std::this_thread::sleep_for(1ms);
                ++done;
            });
        }
        pool.shutdown();
        assert(done.load() == 10);
        assert(pool.pending() == 0);
        bool refused = false;
        try {
            pool.post([]() {});
        } catch (const std::runtime_error&) {
            refused = true;
        }
        assert(refused);
    }

    // PeriodicTask runs immediately, repeats, survives a throwing callback and stops promptly.
    {
        std::atomic<int> calls{0};
        PeriodicTask task("probe", 20ms, [&calls]() {
            if (++calls == 2) {
                throw std::runtime_error("transient");
            }
        });
        assert(!task.running());
        task.start();
        assert(task.running());
        assert(test::wait_until([&]() { return calls.load() >= 5; }, 2s));
        const auto started = std::chrono::steady_clock::now();
        task.stop();
        assert(std::chrono::steady_clock::now() - started < 1s);
        assert(!task.running());
        const auto after_stop = calls.load();
        std::this_thread::sleep_for(60ms);
        assert(calls.load() == after_stop);
        assert(task.runs() == static_cast<std::uint64_t>(after_stop));

        // Long intervals do not delay stop().
        PeriodicTask slow("slow", std::chrono::hours(1), []() {});
        slow.start();
        assert(test::wait_until([&]() { return slow.runs() == 1; }, 2s));
        const auto stop_started = std::chrono::steady_clock::now();
        slow.stop();
        assert(std::chrono::steady_clock::now() - stop_started < 1s);
    }

    return 0;
}
