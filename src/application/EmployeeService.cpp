/**
 * @file EmployeeService.cpp
 * @brief Implementation of EmployeeService.
 */

#include "application/EmployeeService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"

#include <algorithm>

namespace staffledger::application {

using namespace staffledger::domain;
using json = nlohmann::json;

namespace {

void RequireAdmin(const Employee& actor, const std::string& what) {
    if (actor.role != Role::Admin) {
        throw PermissionDeniedError("Only administrators can " + what);
    }
}

template <typename T>
json OptionalJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json DescribeUpdate(const EmployeeUpdate& update) {
    json details = json::object();
    if (update.email) details["email"] = *update.email;
    if (update.firstName) details["first_name"] = *update.firstName;
    if (update.lastName) details["last_name"] = *update.lastName;
    if (update.role) details["role"] = RoleToString(*update.role);
    if (update.managerId) details["manager_id"] = OptionalJson(*update.managerId);
    if (update.department) details["department"] = OptionalJson(*update.department);
    if (update.position) details["position"] = OptionalJson(*update.position);
    if (update.isActive) details["is_active"] = *update.isActive;
    return details;
}

} // namespace

EmployeeService::EmployeeService(std::shared_ptr<IEmployeeRepository> employees,
                                 std::shared_ptr<AuthorizationPolicy> policy,
                                 std::shared_ptr<AuditRecorder> audit)
    : m_employees(std::move(employees)), m_policy(std::move(policy)), m_audit(std::move(audit)) {}

std::optional<Employee> EmployeeService::authenticate(const std::string& email, const std::string& password) {
    auto employee = m_employees->findByEmail(email);
    if (!employee || !employee->isActive) {
        return std::nullopt;
    }
    if (!infrastructure::Credentials::VerifyPassword(password, employee->passwordHash)) {
        return std::nullopt;
    }

    m_audit->record(employee->id, AuditAction::Login, "user", employee->id, {{"email", email}});
    return employee;
}

void EmployeeService::logout(const Employee& actor) {
    m_audit->record(actor.id, AuditAction::Logout, "user", actor.id, {{"email", actor.email}});
}

std::optional<Employee> EmployeeService::getEmployee(const Employee& actor, const std::string& id) {
    if (!m_policy->canAccessEmployeeData(actor, id)) {
        throw PermissionDeniedError("Not authorized to access this employee's data");
    }
    return m_employees->findById(id);
}

std::vector<Employee> EmployeeService::listEmployees(const Employee& actor, bool activeOnly) {
    RequireAdmin(actor, "list all employees");
    auto employees = m_employees->findAll();
    if (activeOnly) {
        employees.erase(std::remove_if(employees.begin(), employees.end(),
                                       [](const Employee& e) { return !e.isActive; }),
                        employees.end());
    }
    return employees;
}

Employee EmployeeService::createEmployee(const Employee& actor, const NewEmployee& input) {
    RequireAdmin(actor, "create employees");
    Employee created = m_employees->create(input);
    m_audit->record(actor.id, AuditAction::Create, "employee", created.id,
                    {{"email", created.email}, {"role", RoleToString(created.role)}});
    return created;
}

BulkCreateResult EmployeeService::bulkCreate(const Employee& actor, const std::vector<NewEmployee>& inputs) {
    RequireAdmin(actor, "perform bulk operations");

    BulkCreateResult result;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        try {
            result.createdIds.push_back(m_employees->create(inputs[i]).id);
        } catch (const StaffLedgerError& e) {
            result.errors.push_back({i + 1, inputs[i].email, e.what()});
        }
    }

    m_audit->record(actor.id, AuditAction::Create, "bulk_employees", "bulk_operation",
                    {{"total_processed", inputs.size()},
                     {"successful", result.createdIds.size()},
                     {"errors", result.errors.size()}});
    return result;
}

bool EmployeeService::deactivateEmployee(const Employee& actor, const std::string& id) {
    RequireAdmin(actor, "delete employees");
    if (!m_employees->deactivate(id)) {
        return false;
    }
    m_audit->record(actor.id, AuditAction::Delete, "employee", id, {{"action", "soft_delete"}});
    return true;
}

std::optional<Employee> EmployeeService::updateEmployee(const Employee& actor,
                                                        const std::string& id,
                                                        const EmployeeUpdate& update) {
    auto target = m_employees->findById(id);
    if (!target) {
        return std::nullopt;
    }
    if (actor.role != Role::Admin) {
        if (update.role || update.isActive) {
            throw PermissionDeniedError("Only administrators can change roles or activation");
        }
        bool touchesNames = update.firstName || update.lastName;
        bool touchesPlacement = update.department || update.position;
        bool touchesOther = update.email || update.managerId;

        bool allowed = false;
        if (actor.id == id) {
            allowed = !touchesPlacement && !touchesOther;
        } else if (actor.role == Role::Manager && target->managerId == actor.id) {
            allowed = !touchesNames && !touchesOther;
        }
        if (!allowed) {
            throw PermissionDeniedError("Not authorized to update these fields of this employee");
        }
    }

    auto updated = m_employees->update(id, update);
    if (updated) {
        m_audit->record(actor.id, AuditAction::Update, "employee", id, DescribeUpdate(update));
    }
    return updated;
}

std::vector<Employee> EmployeeService::directReports(const Employee& actor, const std::string& managerId) {
    if (actor.role != Role::Admin && actor.id != managerId) {
        throw PermissionDeniedError("Not authorized to view these direct reports");
    }
    auto reports = m_employees->findDirectReports(managerId);
    reports.erase(std::remove_if(reports.begin(), reports.end(),
                                 [](const Employee& e) { return !e.isActive; }),
                  reports.end());
    return reports;
}

} // namespace staffledger::application
