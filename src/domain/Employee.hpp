/**
 * @file Employee.hpp
 * @brief Domain entity for a member of the organization.
 */

#pragma once

#include <optional>
#include <string>

#include "value_objects/CalendarDate.hpp"
#include "value_objects/FieldPatch.hpp"
#include "value_objects/Role.hpp"
#include "value_objects/Timestamp.hpp"

namespace staffledger::domain {

/**
 * @struct Employee
 * @brief A stored employee row. Rows are never removed; isActive is the
 * soft-delete marker.
 */
struct Employee {
    std::string id;
    std::string email;                       ///< Unique across active and inactive rows.
    std::string passwordHash;                ///< Hex SHA-256, never the plaintext.
    std::string firstName;
    std::string lastName;
    Role role = Role::Employee;
    std::optional<std::string> managerId;    ///< Weak reference into the Employee collection.
    std::optional<std::string> department;
    std::optional<std::string> position;
    CalendarDate hireDate;
    bool isActive = true;
    Timestamp createdAt;
    Timestamp updatedAt;

    std::string fullName() const { return firstName + " " + lastName; }
};

/**
 * @struct NewEmployee
 * @brief Input for creating an employee. Carries the plaintext password,
 * which the repository hashes before anything is stored.
 */
struct NewEmployee {
    std::string email;
    std::string password;
    std::string firstName;
    std::string lastName;
    Role role = Role::Employee;
    std::optional<std::string> managerId;
    std::optional<std::string> department;
    std::optional<std::string> position;
    CalendarDate hireDate;
};

/**
 * @struct EmployeeUpdate
 * @brief Partial update. Disengaged fields are left untouched.
 */
struct EmployeeUpdate {
    std::optional<std::string> email;
    std::optional<std::string> firstName;
    std::optional<std::string> lastName;
    std::optional<Role> role;
    NullablePatch<std::string> managerId;
    NullablePatch<std::string> department;
    NullablePatch<std::string> position;
    std::optional<bool> isActive;

    bool empty() const {
        return !email && !firstName && !lastName && !role && !managerId &&
               !department && !position && !isActive;
    }
};

inline void ApplyUpdate(Employee& employee, const EmployeeUpdate& update) {
    ApplyPatch(employee.email, update.email);
    ApplyPatch(employee.firstName, update.firstName);
    ApplyPatch(employee.lastName, update.lastName);
    ApplyPatch(employee.role, update.role);
    ApplyPatch(employee.managerId, update.managerId);
    ApplyPatch(employee.department, update.department);
    ApplyPatch(employee.position, update.position);
    ApplyPatch(employee.isActive, update.isActive);
}

} // namespace staffledger::domain
