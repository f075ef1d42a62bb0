/**
 * @file LeaveService.hpp
 * @brief Application Service for filing and deciding leave requests.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AuditRecorder.hpp"
#include "application/AuthorizationPolicy.hpp"
#include "domain/repositories/ILeaveRequestRepository.hpp"

namespace staffledger::application {

class LeaveService {
public:
    LeaveService(std::shared_ptr<domain::ILeaveRequestRepository> requests,
                 std::shared_ptr<AuthorizationPolicy> policy,
                 std::shared_ptr<AuditRecorder> audit);

    // Files a request for the actor. ValidationError when start > end.
    domain::LeaveRequest fileRequest(const domain::Employee& actor, const domain::NewLeaveRequest& input);

    // The actor's own requests, newest first.
    std::vector<domain::LeaveRequest> listOwn(const domain::Employee& actor,
                                              const std::optional<domain::LeaveStatus>& status = std::nullopt);

    // Pending requests the actor may decide, oldest first. Admins see all of
    // them, managers those filed while they were the employee's manager.
    std::vector<domain::LeaveRequest> pendingApprovals(const domain::Employee& actor);

    std::optional<domain::LeaveRequest> getRequest(const domain::Employee& actor, const std::string& id);

    // Owner only, pending only.
    std::optional<domain::LeaveRequest> updateRequest(const domain::Employee& actor,
                                                      const std::string& id,
                                                      const domain::LeaveRequestUpdate& update);

    // status must be Approved or Rejected. InvalidStateError when already decided.
    std::optional<domain::LeaveRequest> decide(const domain::Employee& actor,
                                               const std::string& id,
                                               domain::LeaveStatus status,
                                               const std::optional<std::string>& comments);

    // Owner only, pending only. Ends in Rejected with an explanatory comment.
    std::optional<domain::LeaveRequest> cancel(const domain::Employee& actor, const std::string& id);

private:
    std::shared_ptr<domain::ILeaveRequestRepository> m_requests;
    std::shared_ptr<AuthorizationPolicy> m_policy;
    std::shared_ptr<AuditRecorder> m_audit;
};

} // namespace staffledger::application
