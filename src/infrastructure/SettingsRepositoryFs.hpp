/**
 * @file SettingsRepositoryFs.hpp
 * @brief File-backed implementation of ISettingsRepository.
 */

#pragma once

#include <memory>
#include "domain/repositories/ISettingsRepository.hpp"
#include "infrastructure/RecordStore.hpp"

namespace staffledger::infrastructure {

/**
 * @class SettingsRepositoryFs
 * @brief The settings collection always holds exactly one record, written
 * with defaults the first time it is needed.
 */
class SettingsRepositoryFs : public domain::ISettingsRepository {
public:
    explicit SettingsRepositoryFs(std::shared_ptr<RecordStore> store);

    domain::SystemSettings get() override;
    domain::SystemSettings update(const domain::SettingsUpdate& update) override;

private:
    // Caller holds the exclusive section.
    std::optional<domain::SystemSettings> decodeStored(const RecordList& records) const;

    std::shared_ptr<RecordStore> m_store;
};

} // namespace staffledger::infrastructure
