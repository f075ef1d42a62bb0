/**
 * @file AdminService.cpp
 * @brief Implementation of AdminService.
 */

#include "application/AdminService.hpp"
#include "domain/Errors.hpp"

namespace staffledger::application {

using namespace staffledger::domain;
using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxAuditLimit = 1000;

void RequireAdmin(const Employee& actor) {
    if (actor.role != Role::Admin) {
        throw PermissionDeniedError("Administrator access required");
    }
}

} // namespace

AdminService::AdminService(std::shared_ptr<ISettingsRepository> settings,
                           std::shared_ptr<IAuditTrailRepository> auditTrail,
                           std::shared_ptr<AuditRecorder> audit)
    : m_settings(std::move(settings)), m_auditTrail(std::move(auditTrail)), m_audit(std::move(audit)) {}

SystemSettings AdminService::settings(const Employee& actor) {
    RequireAdmin(actor);
    return m_settings->get();
}

SystemSettings AdminService::updateSettings(const Employee& actor, const SettingsUpdate& update) {
    RequireAdmin(actor);
    SystemSettings updated = m_settings->update(update);

    json details = json::object();
    if (update.logEditTimeLimitHours) details["log_edit_time_limit_hours"] = *update.logEditTimeLimitHours;
    if (update.defaultLeaveTypes) details["default_leave_types"] = *update.defaultLeaveTypes;
    if (update.defaultTaskCategories) details["default_task_categories"] = *update.defaultTaskCategories;
    if (update.notificationSettings) details["notification_settings"] = *update.notificationSettings;
    m_audit->record(actor.id, AuditAction::Update, "system_settings", SystemSettings::kId, details);
    return updated;
}

std::vector<AuditTrail> AdminService::auditTrail(const Employee& actor, const AuditQuery& query) {
    RequireAdmin(actor);
    if (query.limit > kMaxAuditLimit) {
        throw ValidationError("Audit query limit must not exceed 1000");
    }
    return m_auditTrail->query(query);
}

} // namespace staffledger::application
