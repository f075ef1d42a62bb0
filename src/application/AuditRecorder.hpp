/**
 * @file AuditRecorder.hpp
 * @brief Fire-and-forget recorder for the audit trail.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "domain/repositories/IAuditTrailRepository.hpp"

namespace staffledger::application {

/**
 * @class AuditRecorder
 * @brief Queues audit entries and writes them from a background thread.
 *
 * record() never throws and never blocks on storage. A failed write is logged
 * and counted; the business mutation it documents stays committed. Entries
 * get their id and timestamp when record() is called, so the trail reflects
 * call order even though writes happen later.
 */
class AuditRecorder {
public:
    explicit AuditRecorder(std::shared_ptr<domain::IAuditTrailRepository> repository,
                           std::size_t queueLimit = 1024);
    ~AuditRecorder();

    AuditRecorder(const AuditRecorder&) = delete;
    AuditRecorder& operator=(const AuditRecorder&) = delete;

    void record(const std::string& actorId,
                domain::AuditAction action,
                const std::string& resourceType,
                const std::string& resourceId,
                nlohmann::json details = nlohmann::json::object(),
                std::optional<std::string> ipAddress = std::nullopt,
                std::optional<std::string> userAgent = std::nullopt);

    /** @brief Blocks until every entry queued so far has been written or has failed. */
    void flush();

    /** @brief Drains the queue and joins the worker. Later record() calls write inline. */
    void stop();

    /** @brief Number of entries that could not be stored (write failure or full queue). */
    std::size_t failedCount() const { return m_failed.load(); }

private:
    void workerLoop();
    void persist(const domain::AuditTrail& entry);

    std::shared_ptr<domain::IAuditTrailRepository> m_repository;
    std::size_t m_queueLimit;

    std::queue<domain::AuditTrail> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    bool m_running;
    std::atomic<std::size_t> m_failed{0};
};

} // namespace staffledger::application
