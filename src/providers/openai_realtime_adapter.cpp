#include "providers/openai_realtime_adapter.hpp"
#include "system/logger.hpp"

namespace vani::providers {

using json = nlohmann::json;

OpenAiRealtimeAdapter::OpenAiRealtimeAdapter(network::UpstreamTransportFactory transportFactory,
                                             const Config& config)
    : RealtimeAdapter("openai", std::move(transportFactory), config) {}

OpenAiRealtimeAdapter::~OpenAiRealtimeAdapter() {
    close();
}

std::string OpenAiRealtimeAdapter::endpointUrl(const ConnectRequest& request) const {
    const auto& credentials = request.credentials;
    std::string endpoint = credentials.endpoint.empty() ? DEFAULT_ENDPOINT : credentials.endpoint;
    std::string model = credentials.model.empty() ? DEFAULT_MODEL : credentials.model;
    return endpoint + "?model=" + model;
}

network::UpstreamTransport::Headers OpenAiRealtimeAdapter::handshakeHeaders(const ConnectRequest& request) const {
    return {{"Authorization", "Bearer " + request.credentials.apiKey}};
}

void OpenAiRealtimeAdapter::onUpstreamOpen(const ConnectRequest& request) {
    json format = {{"type", "audio/pcm"}, {"rate", SAMPLE_RATE}};
    json output = {{"format", format}};
    if (!request.credentials.voice.empty()) {
        output["voice"] = request.credentials.voice;
    }

    json session = {
        {"type", "realtime"},
        {"model", request.credentials.model.empty() ? DEFAULT_MODEL : request.credentials.model},
        {"output_modalities", {"audio"}},
        {"instructions", request.systemContext},
        {"audio", {
            {"input", {
                {"format", format},
                {"transcription", {{"model", "whisper-1"}}},
                {"turn_detection", {{"type", "server_vad"}}}
            }},
            {"output", output}
        }}
    };
    send({{"type", "session.update"}, {"session", session}});
}

void OpenAiRealtimeAdapter::onUpstreamMessage(const json& message) {
    const std::string type = message.value("type", "");

    if (type == "session.updated") {
        markReady();
    } else if (type == "session.created") {
        Logger::debug("openai: session created");
    } else if (type == "response.created") {
        beginTurn();
    } else if (type == "response.output_audio.delta" || type == "response.audio.delta") {
        auto pcm = decodeBase64(message.value("delta", ""));
        emitAudio(AudioFrame(std::move(pcm), outputFormat()));
    } else if (type == "response.output_audio_transcript.done" || type == "response.audio_transcript.done") {
        emitText(ProviderEventType::AssistantUtteranceProduced, message.value("transcript", ""));
    } else if (type == "conversation.item.input_audio_transcription.completed") {
        emitText(ProviderEventType::UserUtteranceTranscribed, message.value("transcript", ""));
    } else if (type == "response.done") {
        completeTurn();
    } else if (type == "input_audio_buffer.speech_started" || type == "input_audio_buffer.speech_stopped") {
        Logger::debug("openai: {}", type);
    } else if (type == "error") {
        std::string text = "unknown error";
        auto error = message.find("error");
        if (error != message.end() && error->is_object()) {
            text = error->value("message", text);
        }
        emitError(ErrorCode::UpstreamUnavailable, text);
    } else {
        Logger::trace("openai: unhandled event {}", type);
    }
}

json OpenAiRealtimeAdapter::audioMessage(const std::string& base64Audio) const {
    return {{"type", "input_audio_buffer.append"}, {"audio", base64Audio}};
}

void OpenAiRealtimeAdapter::sendInitialTurn(const ConnectRequest& request) {
    if (!request.initialTurnText.empty()) {
        json item = {
            {"type", "message"},
            {"role", "user"},
            {"content", json::array({{{"type", "input_text"}, {"text", request.initialTurnText}}})}
        };
        send({{"type", "conversation.item.create"}, {"item", item}});
    }
    send({{"type", "response.create"}});
}

void OpenAiRealtimeAdapter::sendInterrupt() {
    send({{"type", "response.cancel"}});
}

} // namespace vani::providers
