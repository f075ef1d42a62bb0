/**
 * @file LeaveRequest.hpp
 * @brief Domain entity for a request for time off.
 */

#pragma once

#include <optional>
#include <string>

#include "value_objects/CalendarDate.hpp"
#include "value_objects/LeaveStatus.hpp"
#include "value_objects/Timestamp.hpp"

namespace staffledger::domain {

/**
 * @struct LeaveRequest
 * @brief managerId is copied from the employee when the request is filed and
 * is not re-resolved afterwards. It decides who may approve.
 */
struct LeaveRequest {
    std::string id;
    std::string employeeId;
    CalendarDate startDate;
    CalendarDate endDate;
    std::string leaveType;
    std::string reason;
    LeaveStatus status = LeaveStatus::Pending;
    std::optional<std::string> managerId;
    std::optional<std::string> managerComments;
    std::optional<std::string> approvedBy;
    std::optional<Timestamp> approvedAt;
    Timestamp createdAt;
    Timestamp updatedAt;
};

struct NewLeaveRequest {
    CalendarDate startDate;
    CalendarDate endDate;
    std::string leaveType;
    std::string reason;
};

struct LeaveRequestUpdate {
    std::optional<CalendarDate> startDate;
    std::optional<CalendarDate> endDate;
    std::optional<std::string> leaveType;
    std::optional<std::string> reason;
};

/**
 * @struct LeaveDecision
 * @brief Moves a pending request to a terminal status.
 */
struct LeaveDecision {
    LeaveStatus status = LeaveStatus::Approved;   ///< Approved or Rejected.
    std::optional<std::string> comments;
    std::string decidedBy;
};

} // namespace staffledger::domain
