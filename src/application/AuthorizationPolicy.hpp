/**
 * @file AuthorizationPolicy.hpp
 * @brief Role and reporting-line access rules.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/Employee.hpp"
#include "domain/LeaveRequest.hpp"
#include "domain/WorkLog.hpp"
#include "domain/repositories/IEmployeeRepository.hpp"
#include "domain/repositories/ISettingsRepository.hpp"

namespace staffledger::application {

/**
 * @class AuthorizationPolicy
 * @brief Stateless predicates over (actor, target). They never mutate and
 * never throw; a lookup that fails counts as "not allowed".
 *
 * Reporting lines are resolved one hop at a time (target.managerId), never
 * as a chain.
 */
class AuthorizationPolicy {
public:
    AuthorizationPolicy(std::shared_ptr<domain::IEmployeeRepository> employees,
                        std::shared_ptr<domain::ISettingsRepository> settings);

    /** @brief Admin, self, or the target's direct manager. */
    bool canAccessEmployeeData(const domain::Employee& actor, const std::string& targetId) const;

    /**
     * @brief Admin, or the manager captured on the request when it was filed.
     * A later reassignment of the employee does not change the answer.
     */
    bool canApproveLeave(const domain::Employee& actor, const domain::LeaveRequest& request) const;

    /** @brief Admin, the owner, or the request's snapshot manager. */
    bool canViewLeaveRequest(const domain::Employee& actor, const domain::LeaveRequest& request) const;

    /**
     * @brief Admin always. Otherwise the owner, while
     * now - createdAt <= log_edit_time_limit_hours (read from settings on
     * every call).
     */
    bool canEditWorkLog(const domain::WorkLog& log, const domain::Employee& actor) const;
    bool canEditWorkLog(const domain::WorkLog& log, const domain::Employee& actor, domain::Timestamp now) const;

    /** @brief Admin, or a manager who is the log owner's direct manager. */
    bool canGiveFeedback(const domain::Employee& actor, const domain::WorkLog& log) const;

    static bool IsManagerOrAdmin(const domain::Employee& actor) {
        return actor.role == domain::Role::Manager || actor.role == domain::Role::Admin;
    }

private:
    bool isDirectManagerOf(const domain::Employee& actor, const std::string& targetId) const;

    std::shared_ptr<domain::IEmployeeRepository> m_employees;
    std::shared_ptr<domain::ISettingsRepository> m_settings;
};

} // namespace staffledger::application
