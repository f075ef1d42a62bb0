/**
 * @file AuditTrailRepositoryFs.cpp
 * @brief Implementation of AuditTrailRepositoryFs.
 */

#include "infrastructure/AuditTrailRepositoryFs.hpp"

#include <algorithm>

namespace staffledger::infrastructure {

using namespace staffledger::domain;

AuditTrailRepositoryFs::AuditTrailRepositoryFs(std::shared_ptr<RecordStore> store)
    : m_entries(std::move(store)) {}

void AuditTrailRepositoryFs::append(const AuditTrail& entry) {
    m_entries.insert([&](const std::vector<AuditTrail>&) { return entry; });
}

std::vector<AuditTrail> AuditTrailRepositoryFs::query(const AuditQuery& query) {
    auto entries = m_entries.filter([&](const AuditTrail& e) {
        if (query.userId && e.userId != *query.userId) return false;
        if (query.action && e.action != *query.action) return false;
        if (query.resourceType && e.resourceType != *query.resourceType) return false;
        return true;
    });

    // Equal timestamps keep reverse insertion order.
    std::reverse(entries.begin(), entries.end());
    std::stable_sort(entries.begin(), entries.end(), [](const AuditTrail& a, const AuditTrail& b) {
        return a.timestamp > b.timestamp;
    });

    if (entries.size() > query.limit) {
        entries.resize(query.limit);
    }
    return entries;
}

} // namespace staffledger::infrastructure
