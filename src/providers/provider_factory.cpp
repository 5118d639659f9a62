#include "providers/provider_factory.hpp"
#include "providers/elevenlabs_adapter.hpp"
#include "providers/gemini_live_adapter.hpp"
#include "providers/hume_evi_adapter.hpp"
#include "providers/openai_realtime_adapter.hpp"
#include "system/logger.hpp"

namespace vani::providers {

namespace {

RealtimeAdapter::Config adapterConfig(const ProviderSettings& settings) {
    RealtimeAdapter::Config config;
    config.readyTimeout = std::chrono::milliseconds(settings.readyTimeoutMs);
    config.outputGain = settings.outputGain;
    return config;
}

} // namespace

ProviderFactory::ProviderFactory(network::UpstreamTransportFactory transportFactory)
    : transportFactory_(std::move(transportFactory)) {
    auto transports = transportFactory_;

    registerProvider(provider_tag::OPENAI, [transports](const ProviderSettings& settings) {
        return std::make_unique<OpenAiRealtimeAdapter>(transports, adapterConfig(settings));
    });
    registerProvider(provider_tag::GEMINI, [transports](const ProviderSettings& settings) {
        return std::make_unique<GeminiLiveAdapter>(transports, adapterConfig(settings));
    });
    registerProvider(provider_tag::ELEVENLABS, [transports](const ProviderSettings& settings) {
        return std::make_unique<ElevenLabsAdapter>(transports, adapterConfig(settings));
    });
    registerProvider(provider_tag::HUME, [transports](const ProviderSettings& settings) {
        return std::make_unique<HumeEviAdapter>(transports, adapterConfig(settings));
    });
}

void ProviderFactory::registerProvider(const std::string& tag, Creator creator) {
    creators_[tag] = std::move(creator);
}

void ProviderFactory::configure(const std::string& tag, const ProviderSettings& settings) {
    if (!isKnown(tag)) {
        throw BridgeError(ErrorCode::UnknownProvider, "cannot configure unknown provider '" + tag + "'");
    }
    settings_[tag] = settings;
}

bool ProviderFactory::isKnown(const std::string& tag) const {
    return creators_.count(tag) > 0;
}

std::vector<std::string> ProviderFactory::tags() const {
    std::vector<std::string> result;
    for (const auto& entry : creators_) {
        result.push_back(entry.first);
    }
    return result;
}

std::unique_ptr<ProviderAdapter> ProviderFactory::create(const std::string& tag) const {
    auto it = creators_.find(tag);
    if (it == creators_.end()) {
        Logger::error("ProviderFactory: unknown provider '{}'", tag);
        throw BridgeError(ErrorCode::UnknownProvider, "unknown provider '" + tag + "'");
    }
    return it->second(settingsFor(tag));
}

ProviderCredentials ProviderFactory::credentialsFor(const std::string& tag, const std::string& voice) const {
    if (!isKnown(tag)) {
        throw BridgeError(ErrorCode::UnknownProvider, "unknown provider '" + tag + "'");
    }
    ProviderSettings settings = settingsFor(tag);

    ProviderCredentials credentials;
    credentials.apiKey = settings.apiKey;
    credentials.endpoint = settings.endpoint;
    credentials.model = settings.model;
    credentials.voice = voice.empty() ? settings.voice : voice;
    return credentials;
}

ProviderSettings ProviderFactory::defaultSettings(const std::string& tag) {
    ProviderSettings settings;
    if (tag == provider_tag::HUME) {
        settings.outputGain.gainDb = 6.0f;
        settings.outputGain.ceiling = 0.89f;
    }
    return settings;
}

ProviderSettings ProviderFactory::settingsFor(const std::string& tag) const {
    auto it = settings_.find(tag);
    return it != settings_.end() ? it->second : defaultSettings(tag);
}

} // namespace vani::providers
