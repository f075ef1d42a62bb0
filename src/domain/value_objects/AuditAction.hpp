/**
 * @file AuditAction.hpp
 * @brief Kinds of action recorded in the audit trail.
 */

#pragma once

#include <optional>
#include <string>

namespace staffledger::domain {

enum class AuditAction {
    Create,
    Update,
    Delete,
    Login,
    Logout,
    Approve,
    Reject
};

inline std::string AuditActionToString(AuditAction action) {
    switch (action) {
        case AuditAction::Create: return "create";
        case AuditAction::Update: return "update";
        case AuditAction::Delete: return "delete";
        case AuditAction::Login: return "login";
        case AuditAction::Logout: return "logout";
        case AuditAction::Approve: return "approve";
        case AuditAction::Reject: return "reject";
        default: return "update";
    }
}

inline std::optional<AuditAction> AuditActionFromString(const std::string& text) {
    if (text == "create") return AuditAction::Create;
    if (text == "update") return AuditAction::Update;
    if (text == "delete") return AuditAction::Delete;
    if (text == "login") return AuditAction::Login;
    if (text == "logout") return AuditAction::Logout;
    if (text == "approve") return AuditAction::Approve;
    if (text == "reject") return AuditAction::Reject;
    return std::nullopt;
}

} // namespace staffledger::domain
