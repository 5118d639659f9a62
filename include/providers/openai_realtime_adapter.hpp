#pragma once

#include "providers/realtime_adapter.hpp"

namespace vani::providers {

/**
 * @brief OpenAI Realtime API
 *
 * PCM16 24 kHz in both directions. Ready on session.updated; turns are
 * bounded by response.created / response.done.
 */
class OpenAiRealtimeAdapter : public RealtimeAdapter {
public:
    static constexpr const char* DEFAULT_ENDPOINT = "wss://api.openai.com/v1/realtime";
    static constexpr const char* DEFAULT_MODEL = "gpt-realtime";
    static constexpr uint32_t SAMPLE_RATE = 24000;

    OpenAiRealtimeAdapter(network::UpstreamTransportFactory transportFactory, const Config& config);
    ~OpenAiRealtimeAdapter() override;

    AudioFormat inputFormat() const override { return {AudioEncoding::PCM16, SAMPLE_RATE, 1}; }
    AudioFormat outputFormat() const override { return {AudioEncoding::PCM16, SAMPLE_RATE, 1}; }

protected:
    std::string endpointUrl(const ConnectRequest& request) const override;
    network::UpstreamTransport::Headers handshakeHeaders(const ConnectRequest& request) const override;
    void onUpstreamOpen(const ConnectRequest& request) override;
    void onUpstreamMessage(const nlohmann::json& message) override;
    nlohmann::json audioMessage(const std::string& base64Audio) const override;
    void sendInitialTurn(const ConnectRequest& request) override;
    void sendInterrupt() override;
};

} // namespace vani::providers
