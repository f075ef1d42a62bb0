/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace staffledger::infrastructure {

StoreConfig ConfigLoader::Defaults() {
    StoreConfig config;
    config.dataDir = PathUtils::GetDataHome() / "StaffLedger" / "data";
    return config;
}

std::filesystem::path ConfigLoader::DefaultConfigPath() {
    return PathUtils::GetConfigHome() / "StaffLedger" / "staffledger.json";
}

StoreConfig ConfigLoader::Load(const std::optional<std::filesystem::path>& configPath) {
    StoreConfig config = Defaults();
    std::filesystem::path path = configPath.value_or(DefaultConfigPath());

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream f(path);
            nlohmann::json j;
            f >> j;

            if (j.contains("data_dir")) {
                std::filesystem::path dataDir = j["data_dir"].get<std::string>();
                // Relative paths are relative to the config file.
                config.dataDir = dataDir.is_relative() ? path.parent_path() / dataDir : dataDir;
            }
            if (j.contains("pretty_print")) {
                config.prettyPrint = j["pretty_print"].get<bool>();
            }
            if (j.contains("audit_queue_limit")) {
                config.auditQueueLimit = j["audit_queue_limit"].get<std::size_t>();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << path << ", using defaults: " << e.what() << std::endl;
            config = Defaults();
        }
    } else if (configPath) {
        std::cerr << "[ConfigLoader] Config file not found: " << path << ", using defaults" << std::endl;
    }

    const char* envDataDir = std::getenv(kDataDirEnv);
    if (envDataDir && *envDataDir) {
        config.dataDir = envDataDir;
    }
    return config;
}

} // namespace staffledger::infrastructure
