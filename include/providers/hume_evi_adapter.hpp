#pragma once

#include "providers/realtime_adapter.hpp"

namespace vani::providers {

/**
 * @brief Hume Empathic Voice Interface chat socket
 *
 * Audio output arrives as base64 WAV files (48 kHz); the container header is
 * authoritative, so chunks are tagged AudioEncoding::WAV and parsed by the
 * transcoding pipeline. The voice credential carries the EVI config id.
 */
class HumeEviAdapter : public RealtimeAdapter {
public:
    static constexpr const char* DEFAULT_ENDPOINT = "wss://api.hume.ai/v0/evi/chat";
    static constexpr uint32_t INPUT_SAMPLE_RATE = 16000;
    static constexpr uint32_t OUTPUT_SAMPLE_RATE = 48000;

    HumeEviAdapter(network::UpstreamTransportFactory transportFactory, const Config& config);
    ~HumeEviAdapter() override;

    AudioFormat inputFormat() const override { return {AudioEncoding::PCM16, INPUT_SAMPLE_RATE, 1}; }
    AudioFormat outputFormat() const override { return {AudioEncoding::WAV, OUTPUT_SAMPLE_RATE, 1}; }

protected:
    std::string endpointUrl(const ConnectRequest& request) const override;
    void onUpstreamOpen(const ConnectRequest& request) override;
    void onUpstreamMessage(const nlohmann::json& message) override;
    nlohmann::json audioMessage(const std::string& base64Audio) const override;
    void sendInitialTurn(const ConnectRequest& request) override;
};

} // namespace vani::providers
