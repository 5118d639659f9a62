#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "network/upstream_transport.hpp"
#include "providers/provider_adapter.hpp"

namespace vani::providers {

struct ProviderSettings {
    std::string endpoint;   // empty: the provider's public endpoint
    std::string apiKey;
    std::string model;
    std::string voice;
    uint32_t readyTimeoutMs = 10000;
    core::audio::GainSettings outputGain;
};

namespace provider_tag {
constexpr const char* OPENAI = "openai";
constexpr const char* GEMINI = "gemini";
constexpr const char* ELEVENLABS = "elevenlabs";
constexpr const char* HUME = "hume";
} // namespace provider_tag

/**
 * @brief Resolves a user's provider tag to a fresh adapter instance
 *
 * The four built-in providers are registered on construction; unknown tags
 * are rejected rather than defaulted.
 */
class ProviderFactory {
public:
    using Creator = std::function<std::unique_ptr<ProviderAdapter>(const ProviderSettings&)>;

    explicit ProviderFactory(network::UpstreamTransportFactory transportFactory);

    void registerProvider(const std::string& tag, Creator creator);
    void configure(const std::string& tag, const ProviderSettings& settings);

    bool isKnown(const std::string& tag) const;
    std::vector<std::string> tags() const;

    /// @throws BridgeError(UnknownProvider)
    std::unique_ptr<ProviderAdapter> create(const std::string& tag) const;

    /// Credentials for tag; a non-empty voice overrides the configured one.
    /// @throws BridgeError(UnknownProvider)
    ProviderCredentials credentialsFor(const std::string& tag, const std::string& voice = "") const;

    /// Built-in defaults for tag (hume: +6 dB gain, 0.89 ceiling)
    static ProviderSettings defaultSettings(const std::string& tag);

private:
    ProviderSettings settingsFor(const std::string& tag) const;

    network::UpstreamTransportFactory transportFactory_;
    std::map<std::string, Creator> creators_;
    std::map<std::string, ProviderSettings> settings_;
};

} // namespace vani::providers
