#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "infrastructure/DebounceTimer.hpp"

using dialog::infrastructure::DebounceTimer;
using namespace std::chrono_literals;

static bool WaitFor(const std::atomic<int>& value, int expected) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (value.load() != expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    return value.load() == expected;
}

int main() {
    std::cout << "[Test] Starting DebounceTimer Test..." << std::endl;

    {
        DebounceTimer timer(40ms);
        std::atomic<int> runs{0};
        std::atomic<int> last{0};
        for (int i = 1; i <= 5; ++i) {
            timer.schedule([&, i] { last = i; ++runs; });
        }
        assert(WaitFor(runs, 1));
        std::this_thread::sleep_for(100ms);
        assert(runs == 1 && last == 5);
        assert(!timer.isPending());
        std::cout << "[PASS] Rescheduling keeps only the latest task." << std::endl;
    }

    {
        // Each schedule() inside the quiet period restarts the full wait.
        const auto start = std::chrono::steady_clock::now();
        DebounceTimer timer(150ms);
        std::atomic<int> runs{0};
        std::atomic<int> last{0};
        timer.schedule([&] { last = 1; ++runs; });
        std::this_thread::sleep_until(start + 100ms);
        timer.schedule([&] { last = 2; ++runs; });
        std::this_thread::sleep_until(start + 200ms);
        timer.schedule([&] { last = 3; ++runs; });

        // Past the first deadline (150ms) and the second (250ms), before the third (350ms).
        std::this_thread::sleep_until(start + 280ms);
        assert(runs == 0);
        assert(timer.isPending());

        assert(WaitFor(runs, 1));
        std::this_thread::sleep_for(200ms);
        assert(runs == 1 && last == 3);
        std::cout << "[PASS] Rescheduling restarts the quiet period." << std::endl;
    }

    {
        DebounceTimer timer(1h);
        int runs = 0;
        timer.schedule([&] { ++runs; });
        assert(timer.isPending());
        assert(timer.fireNow());
        assert(runs == 1 && !timer.isPending());
        assert(!timer.fireNow());

        timer.schedule([&] { ++runs; });
        timer.cancel();
        assert(!timer.isPending() && !timer.fireNow());
        assert(runs == 1);
        std::cout << "[PASS] fireNow() runs inline; cancel() drops the task." << std::endl;
    }

    {
        DebounceTimer timer(1h);
        timer.schedule([] { throw std::runtime_error("boom"); });
        assert(timer.fireNow());
        timer.stop();
        timer.schedule([] {});
        assert(!timer.isPending());
        std::cout << "[PASS] Task errors are contained; stop() ignores later schedules." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
