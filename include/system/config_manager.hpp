#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/audio/frame_encoder.hpp"
#include "providers/provider_factory.hpp"
#include "session/bridge_session.hpp"

namespace vani {

struct ServerSettings {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8000;
    uint32_t ioThreads = 1;
    size_t maxMessageSize = 1024 * 1024;
};

struct AudioSettings {
    uint32_t deviceInputSampleRate = audio_constants::DEVICE_INPUT_SAMPLE_RATE;
    uint32_t deviceOutputSampleRate = audio_constants::DEVICE_OUTPUT_SAMPLE_RATE;
    uint32_t frameDurationMs = audio_constants::FRAME_DURATION_MS;
    int32_t opusBitrate = 12000;
    int32_t opusComplexity = 0;
    uint32_t pacingMarginMs = 10;
    float assetGainDb = 0.0f;
    float assetCeiling = 0.89f;
    size_t pendingQueueCapacity = session::PendingFrameQueue::DEFAULT_CAPACITY;

    /// PCM16 mono bytes in one outbound frame
    size_t frameBytes() const {
        return static_cast<size_t>(deviceOutputSampleRate) * frameDurationMs / 1000 *
               audio_constants::BYTES_PER_SAMPLE;
    }
};

struct UsageSettings {
    uint32_t tickIntervalSeconds = 30;
    uint64_t freeQuotaSeconds = 600;
    uint64_t premiumQuotaSeconds = 36000;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;
    bool console = true;
};

struct BridgeConfiguration {
    ServerSettings server;
    AudioSettings audio;
    UsageSettings usage;
    std::map<std::string, providers::ProviderSettings> providers;
    std::string directoryPath = "config/users.json";
    std::string assetsDirectory = "assets";
    LoggingSettings logging;

    session::SessionSettings sessionSettings() const;
    core::audio::OpusFrameEncoder::Config encoderConfig() const;
};

/**
 * @brief Loads and validates the bridge configuration
 *
 * Sources are applied in order: built-in defaults, a JSON document, then
 * environment variables. Keys missing from the document keep their current
 * value, so a document only needs to name what it changes.
 */
class ConfigManager {
public:
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

    ConfigManager();

    /**
     * Defaults, then configPath (skipped when empty), then the process
     * environment.
     * @throws BridgeError(InvalidConfiguration) on unreadable, malformed or
     *         invalid configuration
     */
    void initialize(const std::string& configPath = "");

    /// @throws BridgeError(InvalidConfiguration)
    void loadFromFile(const std::string& filePath);
    /// @throws BridgeError(InvalidConfiguration)
    void loadFromString(const std::string& json);

    /// @return number of variables that overrode a setting
    size_t loadFromEnvironment();
    size_t loadFromEnvironment(const EnvironmentLookup& lookup);

    BridgeConfiguration getConfiguration() const;

    /// Serialized configuration with API keys masked
    std::string saveToString() const;

    /// @return one message per problem; empty when the configuration is usable
    static std::vector<std::string> validateConfiguration(const BridgeConfiguration& config);
    static BridgeConfiguration createDefaultConfiguration();

private:
    void validateOrThrow() const;

    mutable std::mutex m_mutex;
    BridgeConfiguration m_configuration;
    std::string m_configFilePath;
};

} // namespace vani
