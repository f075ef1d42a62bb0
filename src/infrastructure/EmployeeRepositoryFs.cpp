/**
 * @file EmployeeRepositoryFs.cpp
 * @brief Implementation of EmployeeRepositoryFs.
 */

#include "infrastructure/EmployeeRepositoryFs.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Credentials.hpp"

namespace staffledger::infrastructure {

using namespace staffledger::domain;

EmployeeRepositoryFs::EmployeeRepositoryFs(std::shared_ptr<RecordStore> store)
    : m_employees(std::move(store)) {}

Employee EmployeeRepositoryFs::create(const NewEmployee& input) {
    if (input.email.empty()) {
        throw ValidationError("Employee email must not be empty");
    }

    return m_employees.insert([&](const std::vector<Employee>& current) {
        for (const auto& existing : current) {
            if (existing.email == input.email) {
                throw ConflictError("Employee with this email already exists");
            }
        }

        Employee employee;
        employee.id = Credentials::NewId();
        employee.email = input.email;
        employee.passwordHash = Credentials::HashPassword(input.password);
        employee.firstName = input.firstName;
        employee.lastName = input.lastName;
        employee.role = input.role;
        employee.managerId = input.managerId;
        employee.department = input.department;
        employee.position = input.position;
        employee.hireDate = input.hireDate;
        employee.isActive = true;
        employee.createdAt = Now();
        employee.updatedAt = employee.createdAt;
        return employee;
    });
}

std::optional<Employee> EmployeeRepositoryFs::findById(const std::string& id) {
    return m_employees.findById(id);
}

std::optional<Employee> EmployeeRepositoryFs::findByEmail(const std::string& email) {
    return m_employees.findFirst([&](const Employee& e) { return e.email == email; });
}

std::vector<Employee> EmployeeRepositoryFs::findAll() {
    return m_employees.loadAll();
}

std::vector<Employee> EmployeeRepositoryFs::findDirectReports(const std::string& managerId) {
    return m_employees.filter([&](const Employee& e) { return e.managerId == managerId; });
}

std::optional<Employee> EmployeeRepositoryFs::update(const std::string& id, const EmployeeUpdate& update) {
    return m_employees.modify(id, [&](Employee& employee) {
        if (update.email && *update.email != employee.email) {
            if (update.email->empty()) {
                throw ValidationError("Employee email must not be empty");
            }
            // Exclusive section is held, so this snapshot is current.
            for (const auto& other : m_employees.loadAll()) {
                if (other.id != id && other.email == *update.email) {
                    throw ConflictError("Employee with this email already exists");
                }
            }
        }
        ApplyUpdate(employee, update);
    });
}

bool EmployeeRepositoryFs::deactivate(const std::string& id) {
    EmployeeUpdate update;
    update.isActive = false;
    return this->update(id, update).has_value();
}

} // namespace staffledger::infrastructure
