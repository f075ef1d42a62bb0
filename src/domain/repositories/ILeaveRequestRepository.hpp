/**
 * @file ILeaveRequestRepository.hpp
 * @brief Interface for persisting leave requests.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../LeaveRequest.hpp"

namespace staffledger::domain {

class ILeaveRequestRepository {
public:
    virtual ~ILeaveRequestRepository() = default;

    // Snapshots the employee's current manager. Throws ValidationError when
    // startDate > endDate.
    virtual LeaveRequest create(const std::string& employeeId, const NewLeaveRequest& input) = 0;

    virtual std::optional<LeaveRequest> findById(const std::string& id) = 0;
    virtual std::vector<LeaveRequest> findByEmployee(const std::string& employeeId) = 0;
    virtual std::vector<LeaveRequest> findByManager(const std::string& managerId) = 0;
    virtual std::vector<LeaveRequest> findByStatus(LeaveStatus status) = 0;

    // Pending requests only (InvalidStateError otherwise). Re-validates the
    // resulting date range (ValidationError).
    virtual std::optional<LeaveRequest> update(const std::string& id, const LeaveRequestUpdate& update) = 0;

    // pending -> approved/rejected. InvalidStateError when not pending,
    // ValidationError when decision.status is Pending.
    virtual std::optional<LeaveRequest> decide(const std::string& id, const LeaveDecision& decision) = 0;
};

} // namespace staffledger::domain
