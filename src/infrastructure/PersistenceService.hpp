/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes on a single background thread.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace decodedesk::infrastructure {

/**
 * @struct WriteTask
 * @brief Full replacement content for one file.
 */
struct WriteTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Owns a worker thread that applies queued writes in submission order.
 *
 * Each write goes to a temp file that is then renamed over the target, so readers
 * never see a half-written file and concurrent producers never interleave.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues @p content to replace the file at @p filename.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every write queued so far has been applied. */
    void flush();

    /** @brief Drains the queue and joins the worker. Idempotent. */
    void stop();

    /** @brief Number of writes that failed since construction. */
    int failedWrites() const { return m_failures.load(); }

private:
    void workerLoop();
    bool performAtomicWrite(const WriteTask& task);

    std::queue<WriteTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<int> m_failures{0};
};

} // namespace decodedesk::infrastructure
