/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace staffledger::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path ResolveXdg(const char* variable, const fs::path& homeRelative) {
    if (const char* value = std::getenv(variable); value && *value) {
        return fs::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return ResolveXdg("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return ResolveXdg("XDG_CONFIG_HOME", ".config");
}

} // namespace staffledger::infrastructure
