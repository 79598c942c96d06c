/**
 * @file SettingsManager.h
 * @brief Runtime settings persisted in config.json
 */

#pragma once

#include "config.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace SecureXfer {

/**
 * @brief Runtime settings
 *
 * Empty strings mean "use the platform default" (hostname, ~/Downloads,
 * <data>/debug.log); the accessors on SettingsManager resolve them.
 */
struct Settings {
    std::string displayName;
    std::string downloadPath;
    std::string logPath;
    uint32_t decisionTimeoutMs = DECISION_TIMEOUT_MS;
    uint32_t discoveryIntervalMs = DISCOVERY_INTERVAL_MS;
    uint32_t peerStaleMs = PEER_STALE_MS;
    uint64_t maxIncomingSizeBytes = DEFAULT_MAX_INCOMING_SIZE_BYTES;
};

/**
 * @class SettingsManager
 * @brief Loads, validates and saves config.json
 *
 * JSON keys are snake_case:
 * @code
 * {
 *     "decision_timeout_ms": 30000,
 *     "discovery_interval_ms": 3000,
 *     "display_name": "",
 *     "download_path": "",
 *     "log_path": "",
 *     "max_incoming_size_bytes": 10737418240,
 *     "peer_stale_ms": 30000
 * }
 * @endcode
 * Missing or mistyped keys keep their defaults; numbers are clamped to the
 * ranges in config.h. A missing or corrupt file is replaced with defaults.
 */
class SettingsManager {
public:
    explicit SettingsManager(const std::filesystem::path& configPath);

    /**
     * @brief Read the file, writing defaults on first run or corruption
     * @return false only if defaults had to be written and that failed
     */
    bool loadSettings(std::string& errorMsg);

    /**
     * @brief Write the current settings (4-space indented JSON)
     */
    bool saveSettings(std::string& errorMsg) const;

    void resetToDefaults() { m_settings = Settings{}; }

    const Settings& settings() const { return m_settings; }
    const std::filesystem::path& getConfigFilePath() const { return m_configPath; }

    //=========================================================================
    // Resolved values
    //=========================================================================

    std::string getDisplayName() const;
    std::string getDownloadPath() const;
    std::string getLogPath() const;
    uint32_t getDecisionTimeoutMs() const { return m_settings.decisionTimeoutMs; }
    uint32_t getDiscoveryIntervalMs() const { return m_settings.discoveryIntervalMs; }
    uint32_t getPeerStaleMs() const { return m_settings.peerStaleMs; }
    uint64_t getMaxIncomingSizeBytes() const { return m_settings.maxIncomingSizeBytes; }

    //=========================================================================
    // Setters (clamped; call saveSettings() to persist)
    //=========================================================================

    void setDisplayName(const std::string& name);
    void setDownloadPath(const std::string& path) { m_settings.downloadPath = path; }
    void setLogPath(const std::string& path) { m_settings.logPath = path; }
    void setDecisionTimeoutMs(uint32_t ms);
    void setDiscoveryIntervalMs(uint32_t ms);
    void setPeerStaleMs(uint32_t ms);
    void setMaxIncomingSizeBytes(uint64_t bytes);

    //=========================================================================
    // JSON mapping
    //=========================================================================

    static Settings fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const Settings& settings);

private:
    std::filesystem::path m_configPath;
    Settings m_settings;
};

}  // namespace SecureXfer
