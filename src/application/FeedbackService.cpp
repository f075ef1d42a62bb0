/**
 * @file FeedbackService.cpp
 * @brief Implementation of FeedbackService.
 */

#include "application/FeedbackService.hpp"
#include "domain/Errors.hpp"

namespace staffledger::application {

using namespace staffledger::domain;
using json = nlohmann::json;

FeedbackService::FeedbackService(std::shared_ptr<IFeedbackRepository> feedback,
                                 std::shared_ptr<IWorkLogRepository> workLogs,
                                 std::shared_ptr<AuthorizationPolicy> policy,
                                 std::shared_ptr<AuditRecorder> audit)
    : m_feedback(std::move(feedback)),
      m_workLogs(std::move(workLogs)),
      m_policy(std::move(policy)),
      m_audit(std::move(audit)) {}

std::optional<Feedback> FeedbackService::giveFeedback(const Employee& actor, const NewFeedback& input) {
    if (!AuthorizationPolicy::IsManagerOrAdmin(actor)) {
        throw PermissionDeniedError("Only managers and admins can provide feedback");
    }
    if (!IsValidRating(input.rating)) {
        throw ValidationError("Rating must be between 1 and 5");
    }

    auto log = m_workLogs->findById(input.workLogId);
    if (!log) return std::nullopt;
    if (!m_policy->canGiveFeedback(actor, *log)) {
        throw PermissionDeniedError("Can only provide feedback for your direct reports");
    }

    auto feedback = m_feedback->create(actor.id, input);
    if (!feedback) return std::nullopt;

    m_audit->record(actor.id, AuditAction::Create, "feedback", feedback->id,
                    {{"work_log_id", feedback->workLogId},
                     {"employee_id", feedback->employeeId},
                     {"rating", feedback->rating ? json(*feedback->rating) : json(nullptr)}});
    return feedback;
}

std::vector<Feedback> FeedbackService::feedbackForEmployee(const Employee& actor, const std::string& employeeId) {
    if (!m_policy->canAccessEmployeeData(actor, employeeId)) {
        throw PermissionDeniedError("Not authorized to view this employee's feedback");
    }
    return m_feedback->findByEmployee(employeeId);
}

std::optional<std::vector<Feedback>> FeedbackService::feedbackForWorkLog(const Employee& actor,
                                                                         const std::string& workLogId) {
    auto log = m_workLogs->findById(workLogId);
    if (!log) return std::nullopt;
    if (!m_policy->canAccessEmployeeData(actor, log->employeeId)) {
        throw PermissionDeniedError("Not authorized to view feedback for this work log");
    }
    return m_feedback->findByWorkLog(workLogId);
}

std::vector<Feedback> FeedbackService::givenBy(const Employee& actor) {
    if (!AuthorizationPolicy::IsManagerOrAdmin(actor)) {
        throw PermissionDeniedError("Only managers and admins have given feedback");
    }
    return m_feedback->findByManager(actor.id);
}

} // namespace staffledger::application
