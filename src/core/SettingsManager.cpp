/**
 * @file SettingsManager.cpp
 * @brief Runtime settings persisted in config.json
 */

#include "securexfer/SettingsManager.h"
#include "securexfer/AppPaths.h"
#include "securexfer/AtomicFile.h"
#include "securexfer/CertificateManager.h"
#include "securexfer/ThreadSafeLog.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace SecureXfer {

namespace {

uint32_t clampMs(uint32_t value, uint32_t lo, uint32_t hi) {
    return std::min(std::max(value, lo), hi);
}

/**
 * @brief Read an unsigned integer key; negative or mistyped values are ignored
 */
bool readUnsigned(const json& j, const char* key, uint64_t& out) {
    if (!j.contains(key)) {
        return false;
    }
    const json& v = j[key];
    if (v.is_number_unsigned()) {
        out = v.get<uint64_t>();
        return true;
    }
    if (v.is_number_integer()) {
        const int64_t signedValue = v.get<int64_t>();
        if (signedValue >= 0) {
            out = static_cast<uint64_t>(signedValue);
            return true;
        }
    }
    return false;
}

uint32_t toMs(uint64_t value) {
    return static_cast<uint32_t>(std::min<uint64_t>(value, UINT32_MAX));
}

}  // namespace

SettingsManager::SettingsManager(const std::filesystem::path& configPath)
    : m_configPath(configPath)
{
}

//=============================================================================
// JSON mapping
//=============================================================================

Settings SettingsManager::fromJson(const json& j) {
    Settings s;
    if (!j.is_object()) {
        return s;
    }

    if (j.contains("display_name") && j["display_name"].is_string()) {
        s.displayName = j["display_name"].get<std::string>();
        if (s.displayName.size() > MAX_DISPLAY_NAME) {
            s.displayName.resize(MAX_DISPLAY_NAME);
        }
    }

    if (j.contains("download_path") && j["download_path"].is_string()) {
        s.downloadPath = j["download_path"].get<std::string>();
    }

    if (j.contains("log_path") && j["log_path"].is_string()) {
        s.logPath = j["log_path"].get<std::string>();
    }

    uint64_t value = 0;
    if (readUnsigned(j, "decision_timeout_ms", value)) {
        s.decisionTimeoutMs = clampMs(toMs(value), MIN_DECISION_TIMEOUT_MS, MAX_DECISION_TIMEOUT_MS);
    }
    if (readUnsigned(j, "discovery_interval_ms", value)) {
        s.discoveryIntervalMs = clampMs(toMs(value), MIN_DISCOVERY_INTERVAL_MS,
                                        MAX_DISCOVERY_INTERVAL_MS);
    }
    if (readUnsigned(j, "peer_stale_ms", value)) {
        s.peerStaleMs = clampMs(toMs(value), MIN_PEER_STALE_MS, MAX_PEER_STALE_MS);
    }
    if (readUnsigned(j, "max_incoming_size_bytes", value) && value > 0) {
        s.maxIncomingSizeBytes = value;
    }

    return s;
}

json SettingsManager::toJson(const Settings& settings) {
    json j;
    j["display_name"] = settings.displayName;
    j["download_path"] = settings.downloadPath;
    j["log_path"] = settings.logPath;
    j["decision_timeout_ms"] = settings.decisionTimeoutMs;
    j["discovery_interval_ms"] = settings.discoveryIntervalMs;
    j["peer_stale_ms"] = settings.peerStaleMs;
    j["max_incoming_size_bytes"] = settings.maxIncomingSizeBytes;
    return j;
}

//=============================================================================
// Persistence Operations
//=============================================================================

bool SettingsManager::loadSettings(std::string& errorMsg) {
    std::error_code ec;
    if (!std::filesystem::exists(m_configPath, ec)) {
        // First run - save defaults
        m_settings = Settings{};
        return saveSettings(errorMsg);
    }

    std::ifstream in(m_configPath, std::ios::binary);
    if (!in) {
        ThreadSafeLog::warn("[Settings] Cannot open " + m_configPath.string() + ", using defaults");
        m_settings = Settings{};
        return true;
    }

    const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    json j = json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        // Invalid JSON - recreate with defaults
        ThreadSafeLog::warn("[Settings] " + m_configPath.string() +
                            " is not a JSON object, rewriting defaults");
        m_settings = Settings{};
        return saveSettings(errorMsg);
    }

    m_settings = fromJson(j);
    return true;
}

bool SettingsManager::saveSettings(std::string& errorMsg) const {
    if (m_configPath.empty()) {
        errorMsg = "No config path";
        return false;
    }

    const std::string jsonString = toJson(m_settings).dump(4);
    if (!writeFileAtomically(m_configPath, jsonString, errorMsg)) {
        errorMsg = "Failed to save " + m_configPath.string() + ": " + errorMsg;
        return false;
    }
    return true;
}

//=============================================================================
// Resolved values
//=============================================================================

std::string SettingsManager::getDisplayName() const {
    if (!m_settings.displayName.empty()) {
        return m_settings.displayName;
    }
    return CertificateManager::getHostname();
}

std::string SettingsManager::getDownloadPath() const {
    if (!m_settings.downloadPath.empty()) {
        return m_settings.downloadPath;
    }
    return AppPaths::defaultDownloadDir().string();
}

std::string SettingsManager::getLogPath() const {
    if (!m_settings.logPath.empty()) {
        return m_settings.logPath;
    }
    return AppPaths::defaultLogPath().string();
}

//=============================================================================
// Setters
//=============================================================================

void SettingsManager::setDisplayName(const std::string& name) {
    m_settings.displayName = name.substr(0, MAX_DISPLAY_NAME);
}

void SettingsManager::setDecisionTimeoutMs(uint32_t ms) {
    m_settings.decisionTimeoutMs = clampMs(ms, MIN_DECISION_TIMEOUT_MS, MAX_DECISION_TIMEOUT_MS);
}

void SettingsManager::setDiscoveryIntervalMs(uint32_t ms) {
    m_settings.discoveryIntervalMs = clampMs(ms, MIN_DISCOVERY_INTERVAL_MS,
                                             MAX_DISCOVERY_INTERVAL_MS);
}

void SettingsManager::setPeerStaleMs(uint32_t ms) {
    m_settings.peerStaleMs = clampMs(ms, MIN_PEER_STALE_MS, MAX_PEER_STALE_MS);
}

void SettingsManager::setMaxIncomingSizeBytes(uint64_t bytes) {
    if (bytes > 0) {
        m_settings.maxIncomingSizeBytes = bytes;
    }
}

}  // namespace SecureXfer
