/**
 * @file AuthorizationPolicy.cpp
 * @brief Implementation of AuthorizationPolicy.
 */

#include "application/AuthorizationPolicy.hpp"

#include <chrono>
#include <ratio>
#include <iostream>

namespace staffledger::application {

using namespace staffledger::domain;

AuthorizationPolicy::AuthorizationPolicy(std::shared_ptr<IEmployeeRepository> employees,
                                         std::shared_ptr<ISettingsRepository> settings)
    : m_employees(std::move(employees)), m_settings(std::move(settings)) {}

bool AuthorizationPolicy::isDirectManagerOf(const Employee& actor, const std::string& targetId) const {
    if (actor.role != Role::Manager) return false;
    try {
        auto target = m_employees->findById(targetId);
        return target && target->managerId == actor.id;
    } catch (const std::exception& e) {
        std::cerr << "[AuthorizationPolicy] Employee lookup failed for " << targetId << ": " << e.what() << std::endl;
        return false;
    }
}

bool AuthorizationPolicy::canAccessEmployeeData(const Employee& actor, const std::string& targetId) const {
    if (actor.role == Role::Admin) return true;
    if (actor.id == targetId) return true;
    return isDirectManagerOf(actor, targetId);
}

bool AuthorizationPolicy::canApproveLeave(const Employee& actor, const LeaveRequest& request) const {
    if (actor.role == Role::Admin) return true;
    return actor.role == Role::Manager && request.managerId == actor.id;
}

bool AuthorizationPolicy::canViewLeaveRequest(const Employee& actor, const LeaveRequest& request) const {
    if (actor.role == Role::Admin) return true;
    return request.employeeId == actor.id || request.managerId == actor.id;
}

bool AuthorizationPolicy::canEditWorkLog(const WorkLog& log, const Employee& actor) const {
    return canEditWorkLog(log, actor, Now());
}

bool AuthorizationPolicy::canEditWorkLog(const WorkLog& log, const Employee& actor, Timestamp now) const {
    if (actor.role == Role::Admin) return true;
    if (log.employeeId != actor.id) return false;

    int limitHours = 0;
    try {
        limitHours = m_settings->get().logEditTimeLimitHours;
    } catch (const std::exception& e) {
        std::cerr << "[AuthorizationPolicy] Settings unavailable, denying edit: " << e.what() << std::endl;
        return false;
    }

    // Compare in hours so large limits cannot overflow the clock's tick count.
    using FractionalHours = std::chrono::duration<double, std::ratio<3600>>;
    const FractionalHours elapsed = now - log.createdAt;
    return elapsed.count() <= static_cast<double>(limitHours);
}

bool AuthorizationPolicy::canGiveFeedback(const Employee& actor, const WorkLog& log) const {
    if (actor.role == Role::Admin) return true;
    return isDirectManagerOf(actor, log.employeeId);
}

} // namespace staffledger::application
