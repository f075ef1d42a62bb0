/**
 * @file Role.hpp
 * @brief Value Object for the organizational role of an employee.
 */

#pragma once

#include <optional>
#include <string>

namespace staffledger::domain {

/**
 * @enum Role
 * @brief Access tier. Admin > Manager > Employee.
 */
enum class Role {
    Employee,   ///< Sees and edits own data.
    Manager,    ///< Additionally sees direct reports, approves their leave.
    Admin       ///< Unrestricted.
};

inline std::string RoleToString(Role role) {
    switch (role) {
        case Role::Employee: return "employee";
        case Role::Manager: return "manager";
        case Role::Admin: return "admin";
        default: return "employee";
    }
}

inline std::optional<Role> RoleFromString(const std::string& text) {
    if (text == "employee") return Role::Employee;
    if (text == "manager") return Role::Manager;
    if (text == "admin") return Role::Admin;
    return std::nullopt;
}

} // namespace staffledger::domain
