/**
 * @file WorkLogRepositoryFs.cpp
 * @brief Implementation of WorkLogRepositoryFs.
 */

#include "infrastructure/WorkLogRepositoryFs.hpp"
#include <algorithm>
#include <cmath>
#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"

namespace staffledger::infrastructure {

using namespace staffledger::domain;

namespace {

// Non-finite values encode as JSON null and would make the row undecodable.
void RequireValidTimeSpent(double hours) {
    if (!std::isfinite(hours)) {
        throw ValidationError("Time spent must be a finite number");
    }
    if (hours < 0.0) {
        throw ValidationError("Time spent must not be negative");
    }
}

} // namespace

WorkLogRepositoryFs::WorkLogRepositoryFs(std::shared_ptr<RecordStore> store)
    : m_logs(std::move(store)) {}

WorkLog WorkLogRepositoryFs::create(const std::string& employeeId, const NewWorkLog& input) {
    RequireValidTimeSpent(input.timeSpent);

    return m_logs.insert([&](const std::vector<WorkLog>&) {
        WorkLog log;
        log.id = Credentials::NewId();
        log.employeeId = employeeId;
        log.date = input.date;
        log.taskDescription = input.taskDescription;
        log.timeSpent = input.timeSpent;
        log.status = input.status;
        log.project = input.project;
        log.category = input.category;
        log.notes = input.notes;
        log.createdAt = Now();
        log.updatedAt = log.createdAt;
        return log;
    });
}

std::optional<WorkLog> WorkLogRepositoryFs::findById(const std::string& id) {
    return m_logs.findById(id);
}

std::vector<WorkLog> WorkLogRepositoryFs::findByEmployee(const std::string& employeeId,
                                                         const std::optional<CalendarDate>& from,
                                                         const std::optional<CalendarDate>& to) {
    auto logs = m_logs.filter([&](const WorkLog& log) {
        return log.employeeId == employeeId && InDateRange(log.date, from, to);
    });
    std::stable_sort(logs.begin(), logs.end(), [](const WorkLog& a, const WorkLog& b) {
        return a.date > b.date;
    });
    return logs;
}

std::optional<WorkLog> WorkLogRepositoryFs::update(const std::string& id, const WorkLogUpdate& update) {
    if (update.timeSpent) RequireValidTimeSpent(*update.timeSpent);
    return m_logs.modify(id, [&](WorkLog& log) { ApplyUpdate(log, update); });
}

std::optional<WorkLog> WorkLogRepositoryFs::setManagerFeedback(const std::string& id, const std::string& feedback) {
    return m_logs.modify(id, [&](WorkLog& log) { log.managerFeedback = feedback; });
}

} // namespace staffledger::infrastructure
