#pragma once

#include <mutex>

#include "providers/realtime_adapter.hpp"

namespace vani::providers {

/**
 * @brief Gemini Live (BidiGenerateContent)
 *
 * PCM16 16 kHz in, 24 kHz out. Ready on setupComplete. Transcription
 * fragments are accumulated and reported once per turn.
 */
class GeminiLiveAdapter : public RealtimeAdapter {
public:
    static constexpr const char* DEFAULT_ENDPOINT =
        "wss://generativelanguage.googleapis.com/ws/"
        "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    static constexpr const char* DEFAULT_MODEL = "gemini-2.0-flash-live-001";
    static constexpr uint32_t INPUT_SAMPLE_RATE = 16000;
    static constexpr uint32_t OUTPUT_SAMPLE_RATE = 24000;

    GeminiLiveAdapter(network::UpstreamTransportFactory transportFactory, const Config& config);
    ~GeminiLiveAdapter() override;

    AudioFormat inputFormat() const override { return {AudioEncoding::PCM16, INPUT_SAMPLE_RATE, 1}; }
    AudioFormat outputFormat() const override { return {AudioEncoding::PCM16, OUTPUT_SAMPLE_RATE, 1}; }

protected:
    std::string endpointUrl(const ConnectRequest& request) const override;
    void onUpstreamOpen(const ConnectRequest& request) override;
    void onUpstreamMessage(const nlohmann::json& message) override;
    nlohmann::json audioMessage(const std::string& base64Audio) const override;
    void sendInitialTurn(const ConnectRequest& request) override;

private:
    void handleServerContent(const nlohmann::json& content);
    void flushTranscripts();

    std::mutex transcriptMutex_;
    std::string userTranscript_;
    std::string assistantTranscript_;
};

} // namespace vani::providers
