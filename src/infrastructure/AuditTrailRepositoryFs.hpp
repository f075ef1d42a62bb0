/**
 * @file AuditTrailRepositoryFs.hpp
 * @brief File-backed implementation of IAuditTrailRepository.
 */

#pragma once

#include <memory>
#include "domain/repositories/IAuditTrailRepository.hpp"
#include "infrastructure/TypedCollection.hpp"

namespace staffledger::infrastructure {

class AuditTrailRepositoryFs : public domain::IAuditTrailRepository {
public:
    explicit AuditTrailRepositoryFs(std::shared_ptr<RecordStore> store);

    void append(const domain::AuditTrail& entry) override;
    std::vector<domain::AuditTrail> query(const domain::AuditQuery& query) override;

private:
    TypedCollection<domain::AuditTrail> m_entries;
};

} // namespace staffledger::infrastructure
