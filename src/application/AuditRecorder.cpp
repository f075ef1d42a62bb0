/**
 * @file AuditRecorder.cpp
 * @brief Implementation of AuditRecorder.
 */

#include "application/AuditRecorder.hpp"
#include "infrastructure/Credentials.hpp"

#include <iostream>

namespace staffledger::application {

using namespace staffledger::domain;

AuditRecorder::AuditRecorder(std::shared_ptr<IAuditTrailRepository> repository, std::size_t queueLimit)
    : m_repository(std::move(repository)), m_queueLimit(queueLimit), m_running(true) {
    m_worker = std::thread(&AuditRecorder::workerLoop, this);
}

AuditRecorder::~AuditRecorder() {
    stop();
}

void AuditRecorder::stop() {
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

void AuditRecorder::record(const std::string& actorId,
                           AuditAction action,
                           const std::string& resourceType,
                           const std::string& resourceId,
                           nlohmann::json details,
                           std::optional<std::string> ipAddress,
                           std::optional<std::string> userAgent) {
    AuditTrail entry;
    try {
        entry.id = infrastructure::Credentials::NewId();
    } catch (const std::exception& e) {
        ++m_failed;
        std::cerr << "[AuditRecorder] Dropped " << AuditActionToString(action) << " " << resourceType
                  << "/" << resourceId << ": " << e.what() << std::endl;
        return;
    }
    entry.userId = actorId;
    entry.action = action;
    entry.resourceType = resourceType;
    entry.resourceId = resourceId;
    entry.details = details.is_object() ? std::move(details) : nlohmann::json{{"value", std::move(details)}};
    entry.ipAddress = std::move(ipAddress);
    entry.userAgent = std::move(userAgent);
    entry.timestamp = Now();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            if (m_queue.size() >= m_queueLimit) {
                ++m_failed;
                std::cerr << "[AuditRecorder] Queue full, dropped " << AuditActionToString(action) << " "
                          << resourceType << "/" << resourceId << std::endl;
                return;
            }
            m_queue.push(std::move(entry));
            m_cv.notify_one();
            return;
        }
    }

    // Worker already stopped.
    persist(entry);
}

void AuditRecorder::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return (m_queue.empty() && !m_busy) || !m_running; });
}

void AuditRecorder::workerLoop() {
    while (true) {
        AuditTrail entry;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return;
            }

            entry = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Storage I/O outside the lock
        persist(entry);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void AuditRecorder::persist(const AuditTrail& entry) {
    try {
        m_repository->append(entry);
    } catch (const std::exception& e) {
        ++m_failed;
        std::cerr << "[AuditRecorder] Failed to record " << AuditActionToString(entry.action) << " "
                  << entry.resourceType << "/" << entry.resourceId << ": " << e.what() << std::endl;
    }
}

} // namespace staffledger::application
