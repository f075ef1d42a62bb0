/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (staffledger.json).
 *
 * Keeps JSON parsing of configuration in one place. Missing or unreadable
 * files fall back to defaults.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace staffledger::infrastructure {

struct StoreConfig {
    std::filesystem::path dataDir;      ///< Directory holding the collection files.
    bool prettyPrint = true;            ///< Indent stored JSON.
    std::size_t auditQueueLimit = 1024; ///< Pending audit entries beyond this are dropped.
};

class ConfigLoader {
public:
    static constexpr const char* kDataDirEnv = "STAFFLEDGER_DATA_DIR";

    /**
     * @brief Reads configuration from a file.
     * @param configPath Path to staffledger.json, or nullopt for
     * <config home>/StaffLedger/staffledger.json.
     * @return Defaults overridden by the file, then by STAFFLEDGER_DATA_DIR.
     */
    static StoreConfig Load(const std::optional<std::filesystem::path>& configPath = std::nullopt);

    /** @brief Defaults without consulting any file or the environment. */
    static StoreConfig Defaults();

    static std::filesystem::path DefaultConfigPath();
};

} // namespace staffledger::infrastructure
