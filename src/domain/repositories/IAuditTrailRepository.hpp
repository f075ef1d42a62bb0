/**
 * @file IAuditTrailRepository.hpp
 * @brief Interface for the append-only audit trail.
 */

#pragma once

#include <vector>
#include "../AuditTrail.hpp"

namespace staffledger::domain {

class IAuditTrailRepository {
public:
    virtual ~IAuditTrailRepository() = default;

    // Stores a fully built entry (id and timestamp already assigned).
    virtual void append(const AuditTrail& entry) = 0;

    virtual std::vector<AuditTrail> query(const AuditQuery& query) = 0;
};

} // namespace staffledger::domain
