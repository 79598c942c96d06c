/**
 * @file AppPaths.h
 * @brief Canonical storage paths for SecureXfer (XDG base directories).
 *
 * Path contract:
 * - Data:      $XDG_DATA_HOME/securexfer      (default ~/.local/share/securexfer)
 * - Config:    $XDG_CONFIG_HOME/securexfer/config.json
 *                                             (default ~/.config/securexfer/config.json)
 * - Log:       <data>/debug.log
 * - Downloads: ~/Downloads
 *
 * Relative XDG values are ignored, per the XDG Base Directory rules.
 * Every function returns an empty path when neither the XDG variable nor
 * $HOME is usable.
 */

#pragma once

#include <filesystem>

namespace SecureXfer {

class AppPaths {
public:
    /**
     * @brief $HOME, or an empty path
     */
    static std::filesystem::path homeDir();

    static std::filesystem::path dataRoot();
    static std::filesystem::path configDir();
    static std::filesystem::path configJsonPath();
    static std::filesystem::path defaultLogPath();
    static std::filesystem::path defaultDownloadDir();

private:
    /**
     * @brief Absolute value of @p envVar, else $HOME/@p homeFallback
     */
    static std::filesystem::path xdgDir(const char* envVar, const char* homeFallback);
};

}  // namespace SecureXfer
