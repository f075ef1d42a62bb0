/**
 * @file ISettingsRepository.hpp
 * @brief Interface for the singleton settings record.
 */

#pragma once

#include "../SystemSettings.hpp"

namespace staffledger::domain {

class ISettingsRepository {
public:
    virtual ~ISettingsRepository() = default;

    // Materializes and stores the defaults on first call.
    virtual SystemSettings get() = 0;

    virtual SystemSettings update(const SettingsUpdate& update) = 0;
};

} // namespace staffledger::domain
