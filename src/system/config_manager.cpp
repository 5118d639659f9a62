#include "system/config_manager.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace vani {

using json = nlohmann::json;

namespace {

const char* const kProviderTags[] = {
    providers::provider_tag::OPENAI,
    providers::provider_tag::GEMINI,
    providers::provider_tag::ELEVENLABS,
    providers::provider_tag::HUME
};

template<typename T>
void readValue(const json& node, const char* key, T& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void applyProvider(const json& node, providers::ProviderSettings& settings) {
    readValue(node, "endpoint", settings.endpoint);
    readValue(node, "api_key", settings.apiKey);
    readValue(node, "model", settings.model);
    readValue(node, "voice", settings.voice);
    readValue(node, "ready_timeout_ms", settings.readyTimeoutMs);
    readValue(node, "output_gain_db", settings.outputGain.gainDb);
    readValue(node, "output_ceiling", settings.outputGain.ceiling);
}

void applyDocument(const json& root, BridgeConfiguration& config) {
    if (!root.is_object()) {
        throw BridgeError(ErrorCode::InvalidConfiguration, "configuration root must be a JSON object");
    }

    if (auto it = root.find("server"); it != root.end()) {
        readValue(*it, "bind_address", config.server.bindAddress);
        readValue(*it, "port", config.server.port);
        readValue(*it, "io_threads", config.server.ioThreads);
        readValue(*it, "max_message_size", config.server.maxMessageSize);
    }

    if (auto it = root.find("audio"); it != root.end()) {
        readValue(*it, "device_input_sample_rate", config.audio.deviceInputSampleRate);
        readValue(*it, "device_output_sample_rate", config.audio.deviceOutputSampleRate);
        readValue(*it, "frame_duration_ms", config.audio.frameDurationMs);
        readValue(*it, "opus_bitrate", config.audio.opusBitrate);
        readValue(*it, "opus_complexity", config.audio.opusComplexity);
        readValue(*it, "pacing_margin_ms", config.audio.pacingMarginMs);
        readValue(*it, "asset_gain_db", config.audio.assetGainDb);
        readValue(*it, "asset_ceiling", config.audio.assetCeiling);
        readValue(*it, "pending_queue_capacity", config.audio.pendingQueueCapacity);
    }

    if (auto it = root.find("usage"); it != root.end()) {
        readValue(*it, "tick_interval_seconds", config.usage.tickIntervalSeconds);
        readValue(*it, "free_quota_seconds", config.usage.freeQuotaSeconds);
        readValue(*it, "premium_quota_seconds", config.usage.premiumQuotaSeconds);
    }

    if (auto it = root.find("providers"); it != root.end()) {
        if (!it->is_object()) {
            throw BridgeError(ErrorCode::InvalidConfiguration, "'providers' must be an object keyed by provider tag");
        }
        for (auto entry = it->begin(); entry != it->end(); ++entry) {
            auto existing = config.providers.find(entry.key());
            if (existing == config.providers.end()) {
                existing = config.providers.emplace(entry.key(),
                                                    providers::ProviderFactory::defaultSettings(entry.key())).first;
            }
            applyProvider(entry.value(), existing->second);
        }
    }

    if (auto it = root.find("directory"); it != root.end()) {
        readValue(*it, "path", config.directoryPath);
    }
    if (auto it = root.find("assets"); it != root.end()) {
        readValue(*it, "directory", config.assetsDirectory);
    }

    if (auto it = root.find("logging"); it != root.end()) {
        readValue(*it, "level", config.logging.level);
        readValue(*it, "file", config.logging.file);
        readValue(*it, "console", config.logging.console);
    }
}

std::string maskSecret(const std::string& secret) {
    return secret.empty() ? "" : "***";
}

} // namespace

session::SessionSettings BridgeConfiguration::sessionSettings() const {
    session::SessionSettings settings;
    settings.pipeline.outputSampleRate = audio.deviceOutputSampleRate;
    settings.pipeline.frameBytes = audio.frameBytes();
    settings.deviceInputSampleRate = audio.deviceInputSampleRate;
    settings.playback.pacingMargin = std::chrono::milliseconds(audio.pacingMarginMs);
    settings.playback.assetGain.gainDb = audio.assetGainDb;
    settings.playback.assetGain.ceiling = audio.assetCeiling;
    settings.usage.tickInterval = std::chrono::seconds(usage.tickIntervalSeconds);
    settings.usage.freeQuotaSeconds = usage.freeQuotaSeconds;
    settings.usage.premiumQuotaSeconds = usage.premiumQuotaSeconds;
    settings.pendingQueueCapacity = audio.pendingQueueCapacity;
    return settings;
}

core::audio::OpusFrameEncoder::Config BridgeConfiguration::encoderConfig() const {
    core::audio::OpusFrameEncoder::Config config;
    config.sampleRate = audio.deviceOutputSampleRate;
    config.channels = audio_constants::DEVICE_CHANNELS;
    config.bitrate = audio.opusBitrate;
    config.complexity = audio.opusComplexity;
    return config;
}

ConfigManager::ConfigManager() : m_configuration(createDefaultConfiguration()) {}

void ConfigManager::initialize(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configuration = createDefaultConfiguration();
        m_configFilePath = configPath;
    }
    if (!configPath.empty()) {
        loadFromFile(configPath);
    }
    size_t overrides = loadFromEnvironment();
    validateOrThrow();
    Logger::info("ConfigManager: configuration ready ({} environment overrides)", overrides);
}

void ConfigManager::loadFromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw BridgeError(ErrorCode::InvalidConfiguration, "cannot open configuration file " + filePath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
    Logger::info("ConfigManager: loaded {}", filePath);
}

void ConfigManager::loadFromString(const std::string& text) {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        throw BridgeError(ErrorCode::InvalidConfiguration, "configuration is not valid JSON");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    BridgeConfiguration updated = m_configuration;
    try {
        applyDocument(root, updated);
    } catch (const json::exception& e) {
        throw BridgeError(ErrorCode::InvalidConfiguration, std::string("configuration value has wrong type: ") + e.what());
    }
    m_configuration = std::move(updated);
}

size_t ConfigManager::loadFromEnvironment() {
    return loadFromEnvironment([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

size_t ConfigManager::loadFromEnvironment(const EnvironmentLookup& lookup) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t applied = 0;

    if (auto port = lookup("VANI_PORT")) {
        try {
            int value = std::stoi(*port);
            if (value <= 0 || value > 65535) {
                throw BridgeError(ErrorCode::InvalidConfiguration, "VANI_PORT out of range: " + *port);
            }
            m_configuration.server.port = static_cast<uint16_t>(value);
            ++applied;
        } catch (const std::logic_error&) {
            throw BridgeError(ErrorCode::InvalidConfiguration, "VANI_PORT is not a number: " + *port);
        }
    }

    if (auto level = lookup("VANI_LOG_LEVEL")) {
        m_configuration.logging.level = *level;
        ++applied;
    }

    const std::pair<const char*, const char*> keyVariables[] = {
        {providers::provider_tag::OPENAI, "OPENAI_API_KEY"},
        {providers::provider_tag::GEMINI, "GEMINI_API_KEY"},
        {providers::provider_tag::ELEVENLABS, "ELEVENLABS_API_KEY"},
        {providers::provider_tag::HUME, "HUME_API_KEY"}
    };
    for (const auto& entry : keyVariables) {
        if (auto key = lookup(entry.second)) {
            if (!key->empty()) {
                m_configuration.providers[entry.first].apiKey = *key;
                ++applied;
            }
        }
    }
    return applied;
}

BridgeConfiguration ConfigManager::getConfiguration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configuration;
}

std::string ConfigManager::saveToString() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& config = m_configuration;

    json providersNode = json::object();
    for (const auto& entry : config.providers) {
        const auto& settings = entry.second;
        providersNode[entry.first] = {
            {"endpoint", settings.endpoint},
            {"api_key", maskSecret(settings.apiKey)},
            {"model", settings.model},
            {"voice", settings.voice},
            {"ready_timeout_ms", settings.readyTimeoutMs},
            {"output_gain_db", settings.outputGain.gainDb},
            {"output_ceiling", settings.outputGain.ceiling}
        };
    }

    json root = {
        {"server", {
            {"bind_address", config.server.bindAddress},
            {"port", config.server.port},
            {"io_threads", config.server.ioThreads},
            {"max_message_size", config.server.maxMessageSize}
        }},
        {"audio", {
            {"device_input_sample_rate", config.audio.deviceInputSampleRate},
            {"device_output_sample_rate", config.audio.deviceOutputSampleRate},
            {"frame_duration_ms", config.audio.frameDurationMs},
            {"opus_bitrate", config.audio.opusBitrate},
            {"opus_complexity", config.audio.opusComplexity},
            {"pacing_margin_ms", config.audio.pacingMarginMs},
            {"asset_gain_db", config.audio.assetGainDb},
            {"asset_ceiling", config.audio.assetCeiling},
            {"pending_queue_capacity", config.audio.pendingQueueCapacity}
        }},
        {"usage", {
            {"tick_interval_seconds", config.usage.tickIntervalSeconds},
            {"free_quota_seconds", config.usage.freeQuotaSeconds},
            {"premium_quota_seconds", config.usage.premiumQuotaSeconds}
        }},
        {"providers", providersNode},
        {"directory", {{"path", config.directoryPath}}},
        {"assets", {{"directory", config.assetsDirectory}}},
        {"logging", {
            {"level", config.logging.level},
            {"file", config.logging.file},
            {"console", config.logging.console}
        }}
    };
    return root.dump(2);
}

std::vector<std::string> ConfigManager::validateConfiguration(const BridgeConfiguration& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be non-zero");
    }
    if (config.server.ioThreads == 0) {
        errors.push_back("server.io_threads must be at least 1");
    }
    if (config.server.maxMessageSize == 0) {
        errors.push_back("server.max_message_size must be positive");
    }

    if (config.audio.deviceInputSampleRate < 8000 || config.audio.deviceInputSampleRate > 48000) {
        errors.push_back("audio.device_input_sample_rate must be between 8000 and 48000");
    }
    // libopus only accepts these rates
    const uint32_t rate = config.audio.deviceOutputSampleRate;
    if (rate != 8000 && rate != 12000 && rate != 16000 && rate != 24000 && rate != 48000) {
        errors.push_back("audio.device_output_sample_rate must be one of 8000, 12000, 16000, 24000, 48000");
    }
    const uint32_t duration = config.audio.frameDurationMs;
    if (duration != 10 && duration != 20 && duration != 40 && duration != 60 && duration != 80 &&
        duration != 100 && duration != 120) {
        errors.push_back("audio.frame_duration_ms must be a valid Opus frame duration");
    }
    if (config.audio.opusBitrate < 500 || config.audio.opusBitrate > 512000) {
        errors.push_back("audio.opus_bitrate must be between 500 and 512000");
    }
    if (config.audio.opusComplexity < 0 || config.audio.opusComplexity > 10) {
        errors.push_back("audio.opus_complexity must be between 0 and 10");
    }
    if (config.audio.pacingMarginMs >= config.audio.frameDurationMs) {
        errors.push_back("audio.pacing_margin_ms must be shorter than one frame");
    }
    if (config.audio.assetCeiling <= 0.0f || config.audio.assetCeiling > 1.0f) {
        errors.push_back("audio.asset_ceiling must be in (0, 1]");
    }
    if (config.audio.pendingQueueCapacity == 0) {
        errors.push_back("audio.pending_queue_capacity must be positive");
    }

    if (config.usage.tickIntervalSeconds == 0) {
        errors.push_back("usage.tick_interval_seconds must be positive");
    }
    if (config.usage.freeQuotaSeconds == 0 || config.usage.premiumQuotaSeconds == 0) {
        errors.push_back("usage quotas must be positive");
    }

    for (const auto& entry : config.providers) {
        const auto& settings = entry.second;
        if (settings.readyTimeoutMs == 0) {
            errors.push_back("providers." + entry.first + ".ready_timeout_ms must be positive");
        }
        if (settings.outputGain.ceiling <= 0.0f || settings.outputGain.ceiling > 1.0f) {
            errors.push_back("providers." + entry.first + ".output_ceiling must be in (0, 1]");
        }
        if (!settings.endpoint.empty() && settings.endpoint.rfind("ws://", 0) != 0 &&
            settings.endpoint.rfind("wss://", 0) != 0) {
            errors.push_back("providers." + entry.first + ".endpoint must be a ws:// or wss:// URL");
        }
    }

    if (config.directoryPath.empty()) {
        errors.push_back("directory.path is required");
    }

    return errors;
}

BridgeConfiguration ConfigManager::createDefaultConfiguration() {
    BridgeConfiguration config;
    for (const char* tag : kProviderTags) {
        config.providers[tag] = providers::ProviderFactory::defaultSettings(tag);
    }
    return config;
}

void ConfigManager::validateOrThrow() const {
    auto errors = validateConfiguration(getConfiguration());
    if (errors.empty()) {
        return;
    }
    for (const auto& error : errors) {
        Logger::error("ConfigManager: {}", error);
    }
    throw BridgeError(ErrorCode::InvalidConfiguration, errors.front());
}

} // namespace vani
