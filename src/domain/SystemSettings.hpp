/**
 * @file SystemSettings.hpp
 * @brief Singleton organization-wide configuration record.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "value_objects/FieldPatch.hpp"
#include "value_objects/Timestamp.hpp"

namespace staffledger::domain {

struct SystemSettings {
    static constexpr const char* kId = "system_settings";

    std::string id = kId;
    int logEditTimeLimitHours = 24;
    std::vector<std::string> defaultLeaveTypes{"Sick Leave", "Vacation", "Personal", "Maternity/Paternity"};
    std::vector<std::string> defaultTaskCategories{"Development", "Testing", "Documentation", "Meetings", "Research"};
    nlohmann::json notificationSettings = nlohmann::json::object();
    Timestamp createdAt;
    Timestamp updatedAt;
};

struct SettingsUpdate {
    std::optional<int> logEditTimeLimitHours;
    std::optional<std::vector<std::string>> defaultLeaveTypes;
    std::optional<std::vector<std::string>> defaultTaskCategories;
    std::optional<nlohmann::json> notificationSettings;
};

inline void ApplyUpdate(SystemSettings& settings, const SettingsUpdate& update) {
    ApplyPatch(settings.logEditTimeLimitHours, update.logEditTimeLimitHours);
    ApplyPatch(settings.defaultLeaveTypes, update.defaultLeaveTypes);
    ApplyPatch(settings.defaultTaskCategories, update.defaultTaskCategories);
    ApplyPatch(settings.notificationSettings, update.notificationSettings);
}

} // namespace staffledger::domain
