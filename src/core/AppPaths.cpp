/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for SecureXfer.
 */

#include "securexfer/AppPaths.h"
#include "securexfer/config.h"

#include <cstdlib>

namespace SecureXfer {

static std::filesystem::path absoluteEnvPath(const char* name) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') {
        return {};
    }
    std::filesystem::path out(value);
    if (!out.is_absolute()) {
        return {};
    }
    return out;
}

std::filesystem::path AppPaths::homeDir() {
    return absoluteEnvPath("HOME");
}

std::filesystem::path AppPaths::xdgDir(const char* envVar, const char* homeFallback) {
    const auto xdg = absoluteEnvPath(envVar);
    if (!xdg.empty()) {
        return xdg;
    }
    const auto home = homeDir();
    if (home.empty()) {
        return {};
    }
    return home / homeFallback;
}

std::filesystem::path AppPaths::dataRoot() {
    const auto root = xdgDir("XDG_DATA_HOME", ".local/share");
    if (root.empty()) {
        return {};
    }
    return root / APP_DIR_NAME;
}

std::filesystem::path AppPaths::configDir() {
    const auto root = xdgDir("XDG_CONFIG_HOME", ".config");
    if (root.empty()) {
        return {};
    }
    return root / APP_DIR_NAME;
}

std::filesystem::path AppPaths::configJsonPath() {
    const auto dir = configDir();
    if (dir.empty()) {
        return {};
    }
    return dir / CONFIG_FILE_NAME;
}

std::filesystem::path AppPaths::defaultLogPath() {
    const auto root = dataRoot();
    if (root.empty()) {
        return {};
    }
    return root / LOG_FILE_NAME;
}

std::filesystem::path AppPaths::defaultDownloadDir() {
    const auto home = homeDir();
    if (home.empty()) {
        return {};
    }
    return home / "Downloads";
}

}  // namespace SecureXfer
