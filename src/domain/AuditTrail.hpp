/**
 * @file AuditTrail.hpp
 * @brief Append-only record of a mutating action.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "value_objects/AuditAction.hpp"
#include "value_objects/Timestamp.hpp"

namespace staffledger::domain {

struct AuditTrail {
    std::string id;
    std::string userId;
    AuditAction action = AuditAction::Update;
    std::string resourceType;
    std::string resourceId;
    nlohmann::json details = nlohmann::json::object();   ///< Opaque to the engine.
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;
    Timestamp timestamp;
};

/**
 * @struct AuditQuery
 * @brief Filter for reading the trail. Results are newest first.
 */
struct AuditQuery {
    std::optional<std::string> userId;
    std::optional<AuditAction> action;
    std::optional<std::string> resourceType;
    std::size_t limit = 100;
};

} // namespace staffledger::domain
