/**
 * @file SettingsRepositoryFs.cpp
 * @brief Implementation of SettingsRepositoryFs.
 */

#include "infrastructure/SettingsRepositoryFs.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/RecordCodec.hpp"

#include <algorithm>
#include <iostream>

namespace staffledger::infrastructure {

using namespace staffledger::domain;

namespace {

SystemSettings Defaults() {
    SystemSettings settings;
    settings.createdAt = Now();
    settings.updatedAt = settings.createdAt;
    return settings;
}

} // namespace

SettingsRepositoryFs::SettingsRepositoryFs(std::shared_ptr<RecordStore> store)
    : m_store(std::move(store)) {}

std::optional<SystemSettings> SettingsRepositoryFs::decodeStored(const RecordList& records) const {
    if (records.empty()) return std::nullopt;
    try {
        return DecodeSettings(records.front());
    } catch (const std::exception& e) {
        std::cerr << "[SettingsRepository] Stored settings unreadable, using defaults: " << e.what() << std::endl;
        return std::nullopt;
    }
}

SystemSettings SettingsRepositoryFs::get() {
    RecordList records = m_store->read(collections::kSettings);
    if (!records.empty()) {
        if (auto stored = decodeStored(records)) return *stored;
        return Defaults();
    }

    auto lock = m_store->scopedExclusive(collections::kSettings);
    records = m_store->read(collections::kSettings);
    if (!records.empty()) {
        // Another caller materialized them first.
        if (auto stored = decodeStored(records)) return *stored;
        return Defaults();
    }

    SystemSettings settings = Defaults();
    m_store->write(collections::kSettings, {EncodeSettings(settings)});
    return settings;
}

SystemSettings SettingsRepositoryFs::update(const SettingsUpdate& update) {
    if (update.logEditTimeLimitHours && *update.logEditTimeLimitHours < 0) {
        throw ValidationError("Log edit time limit must not be negative");
    }
    if (update.notificationSettings && !update.notificationSettings->is_object()) {
        throw ValidationError("Notification settings must be an object");
    }

    auto lock = m_store->scopedExclusive(collections::kSettings);
    RecordList records = m_store->read(collections::kSettings);

    SystemSettings settings = decodeStored(records).value_or(Defaults());
    ApplyUpdate(settings, update);
    settings.updatedAt = std::max(Now(), settings.updatedAt);

    m_store->write(collections::kSettings, {EncodeSettings(settings)});
    return settings;
}

} // namespace staffledger::infrastructure
