/**
 * @file LeaveStatus.hpp
 * @brief Value Object defining the lifecycle of a leave request.
 */

#pragma once

#include <optional>
#include <string>

namespace staffledger::domain {

/**
 * @enum LeaveStatus
 * @brief Pending is the only non-terminal state.
 *
 * pending --approve--> approved
 * pending --reject/cancel--> rejected
 */
enum class LeaveStatus {
    Pending,
    Approved,
    Rejected
};

inline std::string LeaveStatusToString(LeaveStatus status) {
    switch (status) {
        case LeaveStatus::Pending: return "pending";
        case LeaveStatus::Approved: return "approved";
        case LeaveStatus::Rejected: return "rejected";
        default: return "pending";
    }
}

inline std::optional<LeaveStatus> LeaveStatusFromString(const std::string& text) {
    if (text == "pending") return LeaveStatus::Pending;
    if (text == "approved") return LeaveStatus::Approved;
    if (text == "rejected") return LeaveStatus::Rejected;
    return std::nullopt;
}

inline bool IsTerminal(LeaveStatus status) {
    return status != LeaveStatus::Pending;
}

} // namespace staffledger::domain
