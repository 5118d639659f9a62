#include <gtest/gtest.h>
#include "system/config_manager.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>

#include <nlohmann/json.hpp>

using namespace vani;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("", Logger::Level::Critical, false);
    }

    void TearDown() override {
        Logger::shutdown();
    }

    static ConfigManager::EnvironmentLookup environment(std::map<std::string, std::string> values) {
        return [values](const std::string& name) -> std::optional<std::string> {
            auto it = values.find(name);
            if (it == values.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }
};

TEST_F(ConfigManagerTest, DefaultsMatchDeviceContract) {
    ConfigManager manager;
    auto config = manager.getConfiguration();

    EXPECT_EQ(config.server.port, 8000);
    EXPECT_EQ(config.audio.deviceInputSampleRate, 16000u);
    EXPECT_EQ(config.audio.deviceOutputSampleRate, 24000u);
    EXPECT_EQ(config.audio.frameDurationMs, 120u);
    EXPECT_EQ(config.audio.frameBytes(), 5760u);
    EXPECT_EQ(config.audio.opusBitrate, 12000);
    EXPECT_EQ(config.usage.freeQuotaSeconds, 600u);
    EXPECT_EQ(config.usage.premiumQuotaSeconds, 36000u);
    EXPECT_EQ(config.providers.size(), 4u);
    EXPECT_FLOAT_EQ(config.providers.at("hume").outputGain.gainDb, 6.0f);

    EXPECT_TRUE(ConfigManager::validateConfiguration(config).empty());
}

TEST_F(ConfigManagerTest, DocumentOverlaysOnlyNamedKeys) {
    ConfigManager manager;
    manager.loadFromString(R"({
        "server": {"port": 9100},
        "audio": {"frame_duration_ms": 60},
        "providers": {"gemini": {"api_key": "g-key", "voice": "Puck"}},
        "logging": {"level": "debug", "console": false}
    })");

    auto config = manager.getConfiguration();
    EXPECT_EQ(config.server.port, 9100);
    EXPECT_EQ(config.server.bindAddress, "0.0.0.0");
    EXPECT_EQ(config.audio.frameDurationMs, 60u);
    EXPECT_EQ(config.audio.frameBytes(), 2880u);
    EXPECT_EQ(config.providers.at("gemini").apiKey, "g-key");
    EXPECT_EQ(config.providers.at("gemini").voice, "Puck");
    EXPECT_EQ(config.providers.at("gemini").readyTimeoutMs, 10000u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.console);
}

TEST_F(ConfigManagerTest, MalformedDocumentsAreRejected) {
    ConfigManager manager;

    auto expectInvalid = [&manager](const std::string& text) {
        try {
            manager.loadFromString(text);
            ADD_FAILURE() << "accepted: " << text;
        } catch (const BridgeError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidConfiguration);
        }
    };

    expectInvalid("{not json");
    expectInvalid("[1, 2]");
    expectInvalid(R"({"server": {"port": "eight thousand"}})");
    expectInvalid(R"({"providers": ["openai"]})");

    // A rejected document leaves the configuration untouched
    EXPECT_EQ(manager.getConfiguration().server.port, 8000);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKeysAndPort) {
    ConfigManager manager;
    size_t applied = manager.loadFromEnvironment(environment({
        {"VANI_PORT", "8443"},
        {"VANI_LOG_LEVEL", "warning"},
        {"OPENAI_API_KEY", "sk-env"},
        {"HUME_API_KEY", ""}
    }));

    EXPECT_EQ(applied, 3u);
    auto config = manager.getConfiguration();
    EXPECT_EQ(config.server.port, 8443);
    EXPECT_EQ(config.logging.level, "warning");
    EXPECT_EQ(config.providers.at("openai").apiKey, "sk-env");
    EXPECT_TRUE(config.providers.at("hume").apiKey.empty());
}

TEST_F(ConfigManagerTest, BadPortFromEnvironmentThrows) {
    ConfigManager manager;
    EXPECT_THROW(manager.loadFromEnvironment(environment({{"VANI_PORT", "http"}})), BridgeError);
    EXPECT_THROW(manager.loadFromEnvironment(environment({{"VANI_PORT", "70000"}})), BridgeError);
}

TEST_F(ConfigManagerTest, ValidationReportsEachProblem) {
    auto config = ConfigManager::createDefaultConfiguration();
    config.audio.deviceOutputSampleRate = 44100;
    config.audio.frameDurationMs = 25;
    config.audio.assetCeiling = 1.5f;
    config.providers["openai"].endpoint = "https://api.openai.com";
    config.providers["gemini"].readyTimeoutMs = 0;

    auto errors = ConfigManager::validateConfiguration(config);
    ASSERT_EQ(errors.size(), 5u);

    auto mentions = [&errors](const std::string& key) {
        for (const auto& error : errors) {
            if (error.find(key) != std::string::npos) {
                return true;
            }
        }
        return false;
    };
    EXPECT_TRUE(mentions("device_output_sample_rate"));
    EXPECT_TRUE(mentions("frame_duration_ms"));
    EXPECT_TRUE(mentions("asset_ceiling"));
    EXPECT_TRUE(mentions("providers.openai.endpoint"));
    EXPECT_TRUE(mentions("providers.gemini.ready_timeout_ms"));
}

TEST_F(ConfigManagerTest, SavedConfigurationMasksKeys) {
    ConfigManager manager;
    manager.loadFromString(R"({"providers": {"openai": {"api_key": "sk-secret"}}})");

    std::string saved = manager.saveToString();
    EXPECT_EQ(saved.find("sk-secret"), std::string::npos);

    auto document = nlohmann::json::parse(saved);
    EXPECT_EQ(document["providers"]["openai"]["api_key"], "***");
    EXPECT_EQ(document["providers"]["gemini"]["api_key"], "");
    EXPECT_EQ(document["server"]["port"], 8000);
}

TEST_F(ConfigManagerTest, SessionSettingsFollowAudioAndUsage) {
    ConfigManager manager;
    manager.loadFromString(R"({
        "audio": {"pacing_margin_ms": 15, "asset_gain_db": 3.0, "pending_queue_capacity": 64},
        "usage": {"tick_interval_seconds": 5, "free_quota_seconds": 900}
    })");
    auto config = manager.getConfiguration();
    auto settings = config.sessionSettings();

    EXPECT_EQ(settings.pipeline.frameBytes, 5760u);
    EXPECT_EQ(settings.pipeline.outputSampleRate, 24000u);
    EXPECT_EQ(settings.deviceInputSampleRate, 16000u);
    EXPECT_EQ(settings.playback.pacingMargin, std::chrono::milliseconds(15));
    EXPECT_FLOAT_EQ(settings.playback.assetGain.gainDb, 3.0f);
    EXPECT_EQ(settings.usage.tickInterval, std::chrono::milliseconds(5000));
    EXPECT_EQ(settings.usage.freeQuotaSeconds, 900u);
    EXPECT_EQ(settings.pendingQueueCapacity, 64u);

    auto encoder = config.encoderConfig();
    EXPECT_EQ(encoder.sampleRate, 24000u);
    EXPECT_EQ(encoder.bitrate, 12000);
}

TEST_F(ConfigManagerTest, InitializeReadsFile) {
    auto path = std::filesystem::temp_directory_path() / "vani_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"server": {"port": 8123}, "directory": {"path": "/tmp/users.json"}})";
    }

    ConfigManager manager;
    manager.initialize(path.string());
    EXPECT_EQ(manager.getConfiguration().server.port, 8123);
    EXPECT_EQ(manager.getConfiguration().directoryPath, "/tmp/users.json");
    std::filesystem::remove(path);

    EXPECT_THROW(manager.initialize("/nonexistent/vani.json"), BridgeError);
}
