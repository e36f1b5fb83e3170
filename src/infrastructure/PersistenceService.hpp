/**
 * @file PersistenceService.hpp
 * @brief Background worker that performs record file writes and deletes in issue order.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include "domain/HostRuntime.hpp"

namespace dialog::infrastructure {

/**
 * @struct PersistenceTask
 * @brief A single queued file operation.
 */
struct PersistenceTask {
    enum class Kind { Write, Delete };
    Kind kind = Kind::Write;
    std::string path;
    std::string content; ///< Unused for deletes.
};

/**
 * @class PersistenceService
 * @brief Runs file operations on one worker thread so callers never wait on disk.
 *
 * Failures are logged and counted; nothing is retried. The next mutation of the
 * same record queues a fresh write.
 */
class PersistenceService {
public:
    explicit PersistenceService(std::shared_ptr<domain::HostRuntime> host);
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a text file to be written.
     * @param filename Destination path.
     * @param content The full file content.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Queues a file removal. */
    void deleteAsync(const std::string& filename);

    /** @brief Blocks until every queued task has been carried out. */
    void waitIdle();

    /** @brief Drains the queue and joins the worker. Later submissions are dropped. */
    void stop();

    /** @brief Number of tasks the host reported as failed. */
    std::size_t failureCount() const { return m_failures.load(); }

private:
    void enqueue(PersistenceTask task);
    void workerLoop();
    void perform(const PersistenceTask& task);

    std::shared_ptr<domain::HostRuntime> m_host;

    std::queue<PersistenceTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    bool m_running = true;
    std::atomic<std::size_t> m_failures{0};
};

} // namespace dialog::infrastructure
