/**
 * @file EmployeeService.hpp
 * @brief Application Service for employee accounts and reporting lines.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AuditRecorder.hpp"
#include "application/AuthorizationPolicy.hpp"
#include "domain/repositories/IEmployeeRepository.hpp"

namespace staffledger::application {

struct BulkCreateError {
    std::size_t row = 0;        ///< 1-based position in the input.
    std::string email;
    std::string error;
};

struct BulkCreateResult {
    std::vector<std::string> createdIds;
    std::vector<BulkCreateError> errors;
};

class EmployeeService {
public:
    EmployeeService(std::shared_ptr<domain::IEmployeeRepository> employees,
                    std::shared_ptr<AuthorizationPolicy> policy,
                    std::shared_ptr<AuditRecorder> audit);

    // Active accounts only. Records a login entry on success.
    std::optional<domain::Employee> authenticate(const std::string& email, const std::string& password);
    void logout(const domain::Employee& actor);

    // Throws PermissionDeniedError unless canAccessEmployeeData.
    std::optional<domain::Employee> getEmployee(const domain::Employee& actor, const std::string& id);

    // Admin only.
    std::vector<domain::Employee> listEmployees(const domain::Employee& actor, bool activeOnly = true);
    domain::Employee createEmployee(const domain::Employee& actor, const domain::NewEmployee& input);
    BulkCreateResult bulkCreate(const domain::Employee& actor, const std::vector<domain::NewEmployee>& inputs);
    bool deactivateEmployee(const domain::Employee& actor, const std::string& id);

    // Admins may change anything. Employees may change their own names, and a
    // manager the department and position of a direct report.
    std::optional<domain::Employee> updateEmployee(const domain::Employee& actor,
                                                   const std::string& id,
                                                   const domain::EmployeeUpdate& update);

    // Active direct reports. The manager themself or an admin.
    std::vector<domain::Employee> directReports(const domain::Employee& actor, const std::string& managerId);

private:
    std::shared_ptr<domain::IEmployeeRepository> m_employees;
    std::shared_ptr<AuthorizationPolicy> m_policy;
    std::shared_ptr<AuditRecorder> m_audit;
};

} // namespace staffledger::application
