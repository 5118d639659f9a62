#include "providers/hume_evi_adapter.hpp"
#include "system/logger.hpp"

namespace vani::providers {

using json = nlohmann::json;

namespace {

std::string messageContent(const json& message) {
    auto body = message.find("message");
    if (body == message.end() || !body->is_object()) {
        return "";
    }
    return body->value("content", "");
}

} // namespace

HumeEviAdapter::HumeEviAdapter(network::UpstreamTransportFactory transportFactory, const Config& config)
    : RealtimeAdapter("hume", std::move(transportFactory), config) {}

HumeEviAdapter::~HumeEviAdapter() {
    close();
}

std::string HumeEviAdapter::endpointUrl(const ConnectRequest& request) const {
    std::string url = request.credentials.endpoint.empty() ? DEFAULT_ENDPOINT : request.credentials.endpoint;
    url += "?api_key=" + request.credentials.apiKey;
    if (!request.credentials.voice.empty()) {
        url += "&config_id=" + request.credentials.voice;
    }
    return url;
}

void HumeEviAdapter::onUpstreamOpen(const ConnectRequest& request) {
    json settings = {
        {"type", "session_settings"},
        {"audio", {{"encoding", "linear16"}, {"channels", 1}, {"sample_rate", INPUT_SAMPLE_RATE}}}
    };
    if (!request.systemContext.empty()) {
        settings["system_prompt"] = request.systemContext;
    }
    send(settings);
}

void HumeEviAdapter::onUpstreamMessage(const json& message) {
    const std::string type = message.value("type", "");

    if (type == "chat_metadata") {
        Logger::info("hume: chat {} started", message.value("chat_id", ""));
        markReady();
    } else if (type == "audio_output") {
        auto wav = decodeBase64(message.value("data", ""));
        emitAudio(AudioFrame(std::move(wav), outputFormat()));
    } else if (type == "assistant_message") {
        emitText(ProviderEventType::AssistantUtteranceProduced, messageContent(message));
    } else if (type == "user_message") {
        emitText(ProviderEventType::UserUtteranceTranscribed, messageContent(message));
    } else if (type == "assistant_end" || type == "user_interruption") {
        completeTurn();
    } else if (type == "error") {
        std::string text = message.value("message", "unknown error");
        std::string code = message.value("code", "");
        emitError(ErrorCode::UpstreamUnavailable, code.empty() ? text : code + ": " + text);
    } else if (type == "user_input") {
        Logger::debug("hume: user input acknowledged");
    } else {
        Logger::debug("hume: unhandled event {}", type);
    }
}

json HumeEviAdapter::audioMessage(const std::string& base64Audio) const {
    return {{"type", "audio_input"}, {"data", base64Audio}};
}

void HumeEviAdapter::sendInitialTurn(const ConnectRequest& request) {
    if (request.initialTurnText.empty()) {
        return;
    }
    send({{"type", "user_input"}, {"text", request.initialTurnText}});
}

} // namespace vani::providers
