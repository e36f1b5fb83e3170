/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <exception>
#include <iostream>

namespace dialog::infrastructure {

PersistenceService::PersistenceService(std::shared_ptr<domain::HostRuntime> host)
    : m_host(std::move(host)) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    enqueue(PersistenceTask{PersistenceTask::Kind::Write, filename, content});
}

void PersistenceService::deleteAsync(const std::string& filename) {
    enqueue(PersistenceTask{PersistenceTask::Kind::Delete, filename, {}});
}

void PersistenceService::enqueue(PersistenceTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Stopped, dropping task for " << task.path << std::endl;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void PersistenceService::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return m_queue.empty() && !m_busy;
    });
}

void PersistenceService::workerLoop() {
    while (true) {
        PersistenceTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (m_queue.empty()) {
                // Stopped with nothing left to do.
                m_idleCv.notify_all();
                return;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Host I/O happens outside the lock.
        perform(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::perform(const PersistenceTask& task) {
    bool ok = false;
    try {
        if (task.kind == PersistenceTask::Kind::Write) {
            ok = m_host->writeFile(task.path, task.content);
        } else {
            ok = m_host->deleteFile(task.path);
        }
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] Host error on " << task.path << ": " << e.what() << std::endl;
    }

    if (!ok) {
        ++m_failures;
        std::cerr << "[PersistenceService] Failed to "
                  << (task.kind == PersistenceTask::Kind::Write ? "write " : "delete ")
                  << task.path << std::endl;
    }
}

} // namespace dialog::infrastructure
