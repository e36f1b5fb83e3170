/**
 * @file DebounceTimer.cpp
 * @brief Implementation of DebounceTimer.
 */

#include "infrastructure/DebounceTimer.hpp"
#include <exception>
#include <iostream>

namespace dialog::infrastructure {

DebounceTimer::DebounceTimer(std::chrono::milliseconds quietPeriod) : m_quietPeriod(quietPeriod) {
    m_worker = std::thread(&DebounceTimer::workerLoop, this);
}

DebounceTimer::~DebounceTimer() {
    stop();
}

void DebounceTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
        m_task = nullptr;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void DebounceTimer::schedule(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_task = std::move(task);
        m_deadline = std::chrono::steady_clock::now() + m_quietPeriod;
        ++m_generation;
    }
    m_cv.notify_all();
}

void DebounceTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_task = nullptr;
        ++m_generation;
    }
    m_cv.notify_all();
}

bool DebounceTimer::fireNow() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_task) return false;
        task = std::move(m_task);
        m_task = nullptr;
        ++m_generation;
    }
    m_cv.notify_all();
    runGuarded(task);
    return true;
}

bool DebounceTimer::isPending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_task);
}

void DebounceTimer::workerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        if (!m_task) {
            m_cv.wait(lock, [this] { return !m_running || m_task; });
            continue;
        }

        const std::uint64_t generation = m_generation;
        const auto deadline = m_deadline;
        bool interrupted = m_cv.wait_until(lock, deadline, [this, generation] {
            return !m_running || m_generation != generation;
        });
        if (interrupted) {
            // Rescheduled, cancelled or stopping: re-evaluate from the top.
            continue;
        }

        Task task = std::move(m_task);
        m_task = nullptr;
        lock.unlock();
        runGuarded(task);
        lock.lock();
    }
}

void DebounceTimer::runGuarded(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[DebounceTimer] Scheduled task failed: " << e.what() << std::endl;
    }
}

} // namespace dialog::infrastructure
