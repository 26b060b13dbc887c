/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic, durable file writes.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace adaharvest::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single queued file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Atomic file writes (temp file -> fsync -> rename -> fsync directory).
 *
 * writeAtomic() is synchronous and is what every artifact store uses: once it
 * returns, the file survives a crash. saveTextAsync() funnels best-effort
 * writes (checkpoints, run reports) through a single background thread so that
 * later writes to the same path always win.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Writes @p content to @p filename atomically and durably.
     * @throws domain::StorageError on any I/O failure. The target is left untouched then.
     */
    void writeAtomic(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued write has been performed.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    bool m_busy = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<unsigned long long> m_tempCounter{0};
};

} // namespace adaharvest::infrastructure
