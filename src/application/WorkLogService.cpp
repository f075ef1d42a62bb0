/**
 * @file WorkLogService.cpp
 * @brief Implementation of WorkLogService.
 */

#include "application/WorkLogService.hpp"
#include "domain/Errors.hpp"

namespace staffledger::application {

using namespace staffledger::domain;
using json = nlohmann::json;

namespace {

json OptionalJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json DescribeUpdate(const WorkLogUpdate& update) {
    json details = json::object();
    if (update.taskDescription) details["task_description"] = *update.taskDescription;
    if (update.timeSpent) details["time_spent"] = *update.timeSpent;
    if (update.status) details["status"] = TaskStatusToString(*update.status);
    if (update.project) details["project"] = OptionalJson(*update.project);
    if (update.category) details["category"] = OptionalJson(*update.category);
    if (update.notes) details["notes"] = OptionalJson(*update.notes);
    return details;
}

} // namespace

WorkLogService::WorkLogService(std::shared_ptr<IWorkLogRepository> workLogs,
                               std::shared_ptr<AuthorizationPolicy> policy,
                               std::shared_ptr<AuditRecorder> audit)
    : m_workLogs(std::move(workLogs)), m_policy(std::move(policy)), m_audit(std::move(audit)) {}

WorkLog WorkLogService::withEditFlag(WorkLog log, const Employee& actor) const {
    log.canEdit = m_policy->canEditWorkLog(log, actor);
    return log;
}

WorkLog WorkLogService::createWorkLog(const Employee& actor, const NewWorkLog& input) {
    WorkLog log = m_workLogs->create(actor.id, input);
    m_audit->record(actor.id, AuditAction::Create, "work_log", log.id,
                    {{"date", log.date.toString()},
                     {"task_description", log.taskDescription},
                     {"time_spent", log.timeSpent}});
    return withEditFlag(std::move(log), actor);
}

std::vector<WorkLog> WorkLogService::listWorkLogs(const Employee& actor,
                                                  const std::optional<std::string>& targetEmployeeId,
                                                  const std::optional<CalendarDate>& from,
                                                  const std::optional<CalendarDate>& to) {
    const std::string target = targetEmployeeId.value_or(actor.id);
    if (!m_policy->canAccessEmployeeData(actor, target)) {
        throw PermissionDeniedError("Not authorized to access these work logs");
    }

    std::vector<WorkLog> logs;
    for (auto& log : m_workLogs->findByEmployee(target, from, to)) {
        logs.push_back(withEditFlag(std::move(log), actor));
    }
    return logs;
}

std::optional<WorkLog> WorkLogService::getWorkLog(const Employee& actor, const std::string& id) {
    auto log = m_workLogs->findById(id);
    if (!log) return std::nullopt;
    if (!m_policy->canAccessEmployeeData(actor, log->employeeId)) {
        throw PermissionDeniedError("Not authorized to access this work log");
    }
    return withEditFlag(std::move(*log), actor);
}

std::optional<WorkLog> WorkLogService::updateWorkLog(const Employee& actor,
                                                     const std::string& id,
                                                     const WorkLogUpdate& update) {
    auto log = m_workLogs->findById(id);
    if (!log) return std::nullopt;
    if (!m_policy->canEditWorkLog(*log, actor)) {
        throw PermissionDeniedError("Cannot edit this work log (time limit exceeded or insufficient permissions)");
    }

    auto updated = m_workLogs->update(id, update);
    if (!updated) return std::nullopt;

    m_audit->record(actor.id, AuditAction::Update, "work_log", id, DescribeUpdate(update));
    return withEditFlag(std::move(*updated), actor);
}

std::optional<WorkLog> WorkLogService::addManagerFeedback(const Employee& actor,
                                                          const std::string& id,
                                                          const std::string& feedbackText) {
    auto log = m_workLogs->findById(id);
    if (!log) return std::nullopt;
    if (!m_policy->canGiveFeedback(actor, *log)) {
        throw PermissionDeniedError("Not authorized to provide feedback on this work log");
    }

    auto updated = m_workLogs->setManagerFeedback(id, feedbackText);
    if (!updated) return std::nullopt;

    m_audit->record(actor.id, AuditAction::Update, "work_log", id,
                    {{"action", "add_feedback"}, {"feedback", feedbackText}});
    return withEditFlag(std::move(*updated), actor);
}

} // namespace staffledger::application
