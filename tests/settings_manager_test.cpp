/**
 * @file settings_manager_test.cpp
 * @brief Tests for config.json loading, validation and persistence
 */

#include "securexfer/SettingsManager.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

using namespace SecureXfer;

namespace fs = std::filesystem;

//=============================================================================
// Test Fixtures
//=============================================================================

class SettingsManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("securexfer_settings_" + std::to_string(rd()));
        configPath = root / "config.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeConfig(const std::string& text) {
        fs::create_directories(root);
        std::ofstream out(configPath, std::ios::binary);
        out << text;
    }

    nlohmann::json readConfig() const {
        std::ifstream in(configPath, std::ios::binary);
        return nlohmann::json::parse(in, nullptr, false);
    }

    fs::path root;
    fs::path configPath;
};

//=============================================================================
// Loading
//=============================================================================

/** @test First run writes a default config file */
TEST_F(SettingsManagerTest, MissingFileIsCreatedWithDefaults) {
    SettingsManager manager(configPath);
    std::string error;
    ASSERT_TRUE(manager.loadSettings(error)) << error;

    ASSERT_TRUE(fs::exists(configPath));
    const nlohmann::json j = readConfig();
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["decision_timeout_ms"], DECISION_TIMEOUT_MS);
    EXPECT_EQ(j["peer_stale_ms"], PEER_STALE_MS);
    EXPECT_EQ(manager.getDecisionTimeoutMs(), DECISION_TIMEOUT_MS);
}

TEST_F(SettingsManagerTest, ValuesAreLoaded) {
    writeConfig(R"({
        "display_name": "office-pc",
        "download_path": "/srv/inbox",
        "decision_timeout_ms": 45000,
        "discovery_interval_ms": 5000,
        "peer_stale_ms": 60000,
        "max_incoming_size_bytes": 1048576
    })");

    SettingsManager manager(configPath);
    std::string error;
    ASSERT_TRUE(manager.loadSettings(error)) << error;
    EXPECT_EQ(manager.getDisplayName(), "office-pc");
    EXPECT_EQ(manager.getDownloadPath(), "/srv/inbox");
    EXPECT_EQ(manager.getDecisionTimeoutMs(), 45000u);
    EXPECT_EQ(manager.getDiscoveryIntervalMs(), 5000u);
    EXPECT_EQ(manager.getPeerStaleMs(), 60000u);
    EXPECT_EQ(manager.getMaxIncomingSizeBytes(), 1048576u);
}

TEST_F(SettingsManagerTest, InvalidJsonIsReplacedByDefaults) {
    writeConfig("{ this is not json");

    SettingsManager manager(configPath);
    std::string error;
    ASSERT_TRUE(manager.loadSettings(error)) << error;
    EXPECT_EQ(manager.getDecisionTimeoutMs(), DECISION_TIMEOUT_MS);
    EXPECT_TRUE(readConfig().is_object());
}

TEST_F(SettingsManagerTest, WrongTypesAndRangesAreIgnoredOrClamped) {
    writeConfig(R"({
        "display_name": 42,
        "decision_timeout_ms": 5,
        "discovery_interval_ms": -1,
        "peer_stale_ms": 99999999,
        "max_incoming_size_bytes": 0
    })");

    SettingsManager manager(configPath);
    std::string error;
    ASSERT_TRUE(manager.loadSettings(error)) << error;
    EXPECT_TRUE(manager.settings().displayName.empty());
    EXPECT_EQ(manager.getDecisionTimeoutMs(), MIN_DECISION_TIMEOUT_MS);
    EXPECT_EQ(manager.getDiscoveryIntervalMs(), DISCOVERY_INTERVAL_MS);
    EXPECT_EQ(manager.getPeerStaleMs(), MAX_PEER_STALE_MS);
    EXPECT_EQ(manager.getMaxIncomingSizeBytes(), DEFAULT_MAX_INCOMING_SIZE_BYTES);
}

//=============================================================================
// Persistence
//=============================================================================

TEST_F(SettingsManagerTest, SavedSettingsReloadIdentically) {
    SettingsManager manager(configPath);
    manager.setDisplayName(std::string(100, 'n'));
    manager.setDownloadPath("/data/in");
    manager.setDecisionTimeoutMs(20000);
    manager.setMaxIncomingSizeBytes(4096);

    std::string error;
    ASSERT_TRUE(manager.saveSettings(error)) << error;

    SettingsManager reloaded(configPath);
    ASSERT_TRUE(reloaded.loadSettings(error)) << error;
    EXPECT_EQ(reloaded.settings().displayName.size(), MAX_DISPLAY_NAME);
    EXPECT_EQ(reloaded.getDownloadPath(), "/data/in");
    EXPECT_EQ(reloaded.getDecisionTimeoutMs(), 20000u);
    EXPECT_EQ(reloaded.getMaxIncomingSizeBytes(), 4096u);
}

TEST_F(SettingsManagerTest, SettersClamp) {
    SettingsManager manager(configPath);
    manager.setDecisionTimeoutMs(UINT32_MAX);
    manager.setDiscoveryIntervalMs(1);
    manager.setMaxIncomingSizeBytes(0);

    EXPECT_EQ(manager.getDecisionTimeoutMs(), MAX_DECISION_TIMEOUT_MS);
    EXPECT_EQ(manager.getDiscoveryIntervalMs(), MIN_DISCOVERY_INTERVAL_MS);
    EXPECT_EQ(manager.getMaxIncomingSizeBytes(), DEFAULT_MAX_INCOMING_SIZE_BYTES);

    manager.resetToDefaults();
    EXPECT_EQ(manager.getDiscoveryIntervalMs(), DISCOVERY_INTERVAL_MS);
}

TEST_F(SettingsManagerTest, EmptyValuesResolveToFallbacks) {
    SettingsManager manager(configPath);
    EXPECT_FALSE(manager.getDisplayName().empty());
}
