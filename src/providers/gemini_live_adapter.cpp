#include "providers/gemini_live_adapter.hpp"
#include "system/logger.hpp"

namespace vani::providers {

using json = nlohmann::json;

GeminiLiveAdapter::GeminiLiveAdapter(network::UpstreamTransportFactory transportFactory, const Config& config)
    : RealtimeAdapter("gemini", std::move(transportFactory), config) {}

GeminiLiveAdapter::~GeminiLiveAdapter() {
    close();
}

std::string GeminiLiveAdapter::endpointUrl(const ConnectRequest& request) const {
    std::string endpoint = request.credentials.endpoint.empty() ? DEFAULT_ENDPOINT : request.credentials.endpoint;
    return endpoint + "?key=" + request.credentials.apiKey;
}

void GeminiLiveAdapter::onUpstreamOpen(const ConnectRequest& request) {
    std::string model = request.credentials.model.empty() ? DEFAULT_MODEL : request.credentials.model;

    json generationConfig = {{"responseModalities", {"AUDIO"}}};
    if (!request.credentials.voice.empty()) {
        generationConfig["speechConfig"] = {
            {"voiceConfig", {{"prebuiltVoiceConfig", {{"voiceName", request.credentials.voice}}}}}
        };
    }

    json setup = {
        {"model", "models/" + model},
        {"generationConfig", generationConfig},
        {"inputAudioTranscription", json::object()},
        {"outputAudioTranscription", json::object()}
    };
    if (!request.systemContext.empty()) {
        setup["systemInstruction"] = {{"parts", json::array({{{"text", request.systemContext}}})}};
    }
    send({{"setup", setup}});
}

void GeminiLiveAdapter::onUpstreamMessage(const json& message) {
    if (message.contains("setupComplete")) {
        markReady();
        return;
    }

    auto content = message.find("serverContent");
    if (content != message.end() && content->is_object()) {
        handleServerContent(*content);
        return;
    }

    if (message.contains("goAway")) {
        Logger::warning("gemini: server requested disconnect: {}", message["goAway"].dump());
        return;
    }

    auto error = message.find("error");
    if (error != message.end()) {
        std::string text = error->is_object() ? error->value("message", "unknown error") : error->dump();
        emitError(ErrorCode::UpstreamUnavailable, text);
        return;
    }

    Logger::trace("gemini: unhandled message {}", message.dump());
}

void GeminiLiveAdapter::handleServerContent(const json& content) {
    auto input = content.find("inputTranscription");
    if (input != content.end() && input->is_object()) {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        userTranscript_ += input->value("text", "");
    }

    auto output = content.find("outputTranscription");
    if (output != content.end() && output->is_object()) {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        assistantTranscript_ += output->value("text", "");
    }

    auto modelTurn = content.find("modelTurn");
    if (modelTurn != content.end() && modelTurn->is_object()) {
        auto parts = modelTurn->find("parts");
        if (parts != modelTurn->end() && parts->is_array()) {
            for (const auto& part : *parts) {
                auto inlineData = part.find("inlineData");
                if (inlineData == part.end() || !inlineData->is_object()) {
                    continue;
                }
                auto pcm = decodeBase64(inlineData->value("data", ""));
                emitAudio(AudioFrame(std::move(pcm), outputFormat()));
            }
        }
    }

    if (content.value("interrupted", false)) {
        Logger::debug("gemini: generation interrupted by user speech");
        flushTranscripts();
        completeTurn();
    } else if (content.value("turnComplete", false)) {
        flushTranscripts();
        completeTurn();
    }
}

void GeminiLiveAdapter::flushTranscripts() {
    std::string user;
    std::string assistant;
    {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        user.swap(userTranscript_);
        assistant.swap(assistantTranscript_);
    }
    emitText(ProviderEventType::UserUtteranceTranscribed, user);
    emitText(ProviderEventType::AssistantUtteranceProduced, assistant);
}

json GeminiLiveAdapter::audioMessage(const std::string& base64Audio) const {
    return {{"realtimeInput", {
        {"audio", {{"data", base64Audio}, {"mimeType", "audio/pcm;rate=16000"}}}
    }}};
}

void GeminiLiveAdapter::sendInitialTurn(const ConnectRequest& request) {
    if (request.initialTurnText.empty()) {
        return;
    }
    json turn = {{"role", "user"}, {"parts", json::array({{{"text", request.initialTurnText}}})}};
    send({{"clientContent", {{"turns", json::array({turn})}, {"turnComplete", true}}}});
}

} // namespace vani::providers
