/**
 * @file DebounceTimer.hpp
 * @brief Single-slot delayed task with reset-on-schedule semantics.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace dialog::infrastructure {

/**
 * @class DebounceTimer
 * @brief Runs the most recently scheduled task once the quiet period elapses without a new schedule() call.
 *
 * There is at most one pending task. Scheduling replaces it and restarts the
 * wait; nothing queues up behind it. The task runs on the timer's own thread.
 */
class DebounceTimer {
public:
    using Task = std::function<void()>;

    explicit DebounceTimer(std::chrono::milliseconds quietPeriod);
    ~DebounceTimer();

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    /** @brief Replaces any pending task and restarts the quiet period. */
    void schedule(Task task);

    /** @brief Drops the pending task, if any. */
    void cancel();

    /**
     * @brief Runs the pending task on the calling thread instead of waiting.
     * @return True if there was a task to run.
     */
    bool fireNow();

    bool isPending() const;

    std::chrono::milliseconds quietPeriod() const { return m_quietPeriod; }

    /** @brief Stops the thread. A pending task is discarded. */
    void stop();

private:
    void workerLoop();
    static void runGuarded(const Task& task);

    const std::chrono::milliseconds m_quietPeriod;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    Task m_task;
    std::chrono::steady_clock::time_point m_deadline;
    std::uint64_t m_generation = 0;
    bool m_running = true;
    std::thread m_worker;
};

} // namespace dialog::infrastructure
