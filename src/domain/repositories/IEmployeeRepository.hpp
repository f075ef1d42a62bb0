/**
 * @file IEmployeeRepository.hpp
 * @brief Interface for persisting employees.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../Employee.hpp"

namespace staffledger::domain {

class IEmployeeRepository {
public:
    virtual ~IEmployeeRepository() = default;

    // Throws ConflictError when the email is already taken (active or not).
    virtual Employee create(const NewEmployee& input) = 0;

    virtual std::optional<Employee> findById(const std::string& id) = 0;
    virtual std::optional<Employee> findByEmail(const std::string& email) = 0;
    virtual std::vector<Employee> findAll() = 0;

    // Employees whose managerId equals managerId, active or not.
    virtual std::vector<Employee> findDirectReports(const std::string& managerId) = 0;

    // Throws ConflictError when the update would duplicate another row's email.
    virtual std::optional<Employee> update(const std::string& id, const EmployeeUpdate& update) = 0;

    // Soft delete. Returns false when no such employee.
    virtual bool deactivate(const std::string& id) = 0;
};

} // namespace staffledger::domain
