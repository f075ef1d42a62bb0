/**
 * @file AdminService.hpp
 * @brief Application Service for administrator-only operations.
 */

#pragma once

#include <memory>
#include <vector>

#include "application/AuditRecorder.hpp"
#include "domain/Employee.hpp"
#include "domain/repositories/IAuditTrailRepository.hpp"
#include "domain/repositories/ISettingsRepository.hpp"

namespace staffledger::application {

class AdminService {
public:
    AdminService(std::shared_ptr<domain::ISettingsRepository> settings,
                 std::shared_ptr<domain::IAuditTrailRepository> auditTrail,
                 std::shared_ptr<AuditRecorder> audit);

    domain::SystemSettings settings(const domain::Employee& actor);
    domain::SystemSettings updateSettings(const domain::Employee& actor, const domain::SettingsUpdate& update);
    std::vector<domain::AuditTrail> auditTrail(const domain::Employee& actor, const domain::AuditQuery& query);

private:
    std::shared_ptr<domain::ISettingsRepository> m_settings;
    std::shared_ptr<domain::IAuditTrailRepository> m_auditTrail;
    std::shared_ptr<AuditRecorder> m_audit;
};

} // namespace staffledger::application
