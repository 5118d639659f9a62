#include "providers/elevenlabs_adapter.hpp"
#include "system/logger.hpp"

namespace vani::providers {

using json = nlohmann::json;

ElevenLabsAdapter::ElevenLabsAdapter(network::UpstreamTransportFactory transportFactory, const Config& config)
    : RealtimeAdapter("elevenlabs", std::move(transportFactory), config) {}

ElevenLabsAdapter::~ElevenLabsAdapter() {
    close();
}

AudioFormat ElevenLabsAdapter::inputFormat() const {
    std::lock_guard<std::mutex> lock(formatMutex_);
    return inputFormat_;
}

AudioFormat ElevenLabsAdapter::outputFormat() const {
    std::lock_guard<std::mutex> lock(formatMutex_);
    return outputFormat_;
}

std::optional<AudioFormat> ElevenLabsAdapter::parseAudioFormat(const std::string& name) {
    auto separator = name.find('_');
    if (separator == std::string::npos || separator + 1 >= name.size()) {
        return std::nullopt;
    }

    std::string codec = name.substr(0, separator);
    uint32_t rate = 0;
    try {
        rate = static_cast<uint32_t>(std::stoul(name.substr(separator + 1)));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (rate == 0) {
        return std::nullopt;
    }

    if (codec == "pcm") {
        return AudioFormat{AudioEncoding::PCM16, rate, 1};
    }
    if (codec == "ulaw") {
        return AudioFormat{AudioEncoding::MULAW, rate, 1};
    }
    return std::nullopt;
}

std::string ElevenLabsAdapter::endpointUrl(const ConnectRequest& request) const {
    std::string endpoint = request.credentials.endpoint.empty() ? DEFAULT_ENDPOINT : request.credentials.endpoint;
    return endpoint + "?agent_id=" + request.credentials.model;
}

network::UpstreamTransport::Headers ElevenLabsAdapter::handshakeHeaders(const ConnectRequest& request) const {
    return {{"xi-api-key", request.credentials.apiKey}};
}

void ElevenLabsAdapter::onUpstreamOpen(const ConnectRequest& request) {
    json agent = json::object();
    if (!request.systemContext.empty()) {
        agent["prompt"] = {{"prompt", request.systemContext}};
    }
    if (!request.initialTurnText.empty()) {
        agent["first_message"] = request.initialTurnText;
    }

    json message = {{"type", "conversation_initiation_client_data"}};
    json configOverride = json::object();
    if (!agent.empty()) {
        configOverride["agent"] = agent;
    }
    if (!request.credentials.voice.empty()) {
        configOverride["tts"] = {{"voice_id", request.credentials.voice}};
    }
    if (!configOverride.empty()) {
        message["conversation_config_override"] = configOverride;
    }
    send(message);
}

void ElevenLabsAdapter::handleMetadata(const json& metadata) {
    std::string outputName = metadata.value("agent_output_audio_format", "pcm_16000");
    std::string inputName = metadata.value("user_input_audio_format", "pcm_16000");

    {
        std::lock_guard<std::mutex> lock(formatMutex_);
        if (auto format = parseAudioFormat(outputName)) {
            outputFormat_ = *format;
        } else {
            Logger::warning("elevenlabs: unsupported output format {}, assuming pcm_16000", outputName);
        }
        if (auto format = parseAudioFormat(inputName); format && format->encoding == AudioEncoding::PCM16) {
            inputFormat_ = *format;
        } else {
            Logger::warning("elevenlabs: unsupported input format {}, sending pcm_16000", inputName);
        }
    }

    Logger::info("elevenlabs: conversation {} (in {}, out {})",
                 metadata.value("conversation_id", ""), inputName, outputName);
    markReady();
}

void ElevenLabsAdapter::onUpstreamMessage(const json& message) {
    const std::string type = message.value("type", "");

    if (type == "conversation_initiation_metadata") {
        auto metadata = message.find("conversation_initiation_metadata_event");
        handleMetadata(metadata != message.end() && metadata->is_object() ? *metadata : json::object());
    } else if (type == "ping") {
        auto ping = message.find("ping_event");
        if (ping != message.end() && ping->is_object() && ping->contains("event_id")) {
            send({{"type", "pong"}, {"event_id", (*ping)["event_id"]}});
        }
    } else if (type == "audio") {
        auto audio = message.find("audio_event");
        if (audio != message.end() && audio->is_object()) {
            auto bytes = decodeBase64(audio->value("audio_base_64", ""));
            emitAudio(AudioFrame(std::move(bytes), outputFormat()));
        }
    } else if (type == "user_transcript") {
        auto event = message.find("user_transcription_event");
        if (event != message.end() && event->is_object()) {
            emitText(ProviderEventType::UserUtteranceTranscribed, event->value("user_transcript", ""));
        }
    } else if (type == "agent_response") {
        auto event = message.find("agent_response_event");
        if (event != message.end() && event->is_object()) {
            emitText(ProviderEventType::AssistantUtteranceProduced, event->value("agent_response", ""));
        }
        completeTurn();
    } else if (type == "interruption") {
        completeTurn();
    } else if (type == "conversation_end") {
        Logger::info("elevenlabs: conversation ended by agent");
        emitSessionEnded();
    } else if (type == "vad_score" || type == "internal_tentative_agent_response") {
        Logger::trace("elevenlabs: {}", type);
    } else {
        Logger::debug("elevenlabs: unhandled event {}", type);
    }
}

json ElevenLabsAdapter::audioMessage(const std::string& base64Audio) const {
    return {{"user_audio_chunk", base64Audio}};
}

void ElevenLabsAdapter::sendInterrupt() {
    send({{"type", "user_activity"}});
}

} // namespace vani::providers
