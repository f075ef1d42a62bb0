/**
 * @file WorkLogService.hpp
 * @brief Application Service for work logs.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AuditRecorder.hpp"
#include "application/AuthorizationPolicy.hpp"
#include "domain/repositories/IWorkLogRepository.hpp"

namespace staffledger::application {

/**
 * @class WorkLogService
 * @brief Every WorkLog it returns has canEdit computed for the acting employee
 * at the time of the call.
 */
class WorkLogService {
public:
    WorkLogService(std::shared_ptr<domain::IWorkLogRepository> workLogs,
                   std::shared_ptr<AuthorizationPolicy> policy,
                   std::shared_ptr<AuditRecorder> audit);

    domain::WorkLog createWorkLog(const domain::Employee& actor, const domain::NewWorkLog& input);

    // targetEmployeeId defaults to the actor.
    std::vector<domain::WorkLog> listWorkLogs(const domain::Employee& actor,
                                              const std::optional<std::string>& targetEmployeeId,
                                              const std::optional<domain::CalendarDate>& from,
                                              const std::optional<domain::CalendarDate>& to);

    std::optional<domain::WorkLog> getWorkLog(const domain::Employee& actor, const std::string& id);

    // Throws PermissionDeniedError when canEditWorkLog is false.
    std::optional<domain::WorkLog> updateWorkLog(const domain::Employee& actor,
                                                 const std::string& id,
                                                 const domain::WorkLogUpdate& update);

    // Throws PermissionDeniedError unless canGiveFeedback.
    std::optional<domain::WorkLog> addManagerFeedback(const domain::Employee& actor,
                                                      const std::string& id,
                                                      const std::string& feedbackText);

private:
    domain::WorkLog withEditFlag(domain::WorkLog log, const domain::Employee& actor) const;

    std::shared_ptr<domain::IWorkLogRepository> m_workLogs;
    std::shared_ptr<AuthorizationPolicy> m_policy;
    std::shared_ptr<AuditRecorder> m_audit;
};

} // namespace staffledger::application
