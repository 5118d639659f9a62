#pragma once

#include <mutex>
#include <optional>

#include "providers/realtime_adapter.hpp"

namespace vani::providers {

/**
 * @brief ElevenLabs Conversational AI agent socket
 *
 * The agent's audio formats are announced in
 * conversation_initiation_metadata, which is also the readiness signal.
 * The model credential carries the agent id.
 */
class ElevenLabsAdapter : public RealtimeAdapter {
public:
    static constexpr const char* DEFAULT_ENDPOINT = "wss://api.elevenlabs.io/v1/convai/conversation";

    ElevenLabsAdapter(network::UpstreamTransportFactory transportFactory, const Config& config);
    ~ElevenLabsAdapter() override;

    AudioFormat inputFormat() const override;
    AudioFormat outputFormat() const override;

    /// "pcm_16000" -> PCM16 16 kHz, "ulaw_8000" -> MULAW 8 kHz
    static std::optional<AudioFormat> parseAudioFormat(const std::string& name);

protected:
    std::string endpointUrl(const ConnectRequest& request) const override;
    network::UpstreamTransport::Headers handshakeHeaders(const ConnectRequest& request) const override;
    void onUpstreamOpen(const ConnectRequest& request) override;
    void onUpstreamMessage(const nlohmann::json& message) override;
    nlohmann::json audioMessage(const std::string& base64Audio) const override;
    void sendInterrupt() override;

private:
    void handleMetadata(const nlohmann::json& metadata);

    mutable std::mutex formatMutex_;
    AudioFormat inputFormat_{AudioEncoding::PCM16, 16000, 1};
    AudioFormat outputFormat_{AudioEncoding::PCM16, 16000, 1};
};

} // namespace vani::providers
