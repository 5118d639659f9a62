#include "providers/realtime_adapter.hpp"
#include "system/logger.hpp"

#include <websocketpp/base64/base64.hpp>

namespace vani::providers {

using json = nlohmann::json;

RealtimeAdapter::RealtimeAdapter(std::string name, network::UpstreamTransportFactory transportFactory,
                                 const Config& config)
    : name_(std::move(name)), transportFactory_(std::move(transportFactory)), config_(config) {}

RealtimeAdapter::~RealtimeAdapter() {
    close();
}

network::UpstreamTransport::Headers RealtimeAdapter::handshakeHeaders(const ConnectRequest&) const {
    return {};
}

void RealtimeAdapter::onUpstreamOpen(const ConnectRequest&) {}

void RealtimeAdapter::sendInitialTurn(const ConnectRequest&) {}

void RealtimeAdapter::sendInterrupt() {}

void RealtimeAdapter::connect(const ConnectRequest& request) {
    AdapterState expected = AdapterState::Idle;
    if (!state_.compare_exchange_strong(expected, AdapterState::Connecting)) {
        throw ProviderError(ErrorCode::UpstreamUnavailable, name_,
                            std::string("connect in state ") + adapterStateToString(expected));
    }

    request_ = request;
    transport_ = transportFactory_();

    network::UpstreamTransport::Handlers handlers;
    handlers.onOpen = [this]() {
        Logger::info("{}: upstream socket open", name_);
        onUpstreamOpen(request_);
    };
    handlers.onText = [this](const std::string& payload) { handleText(payload); };
    handlers.onFail = [this](const std::string& reason) { handleFailure(reason); };
    handlers.onClose = [this](uint16_t code, const std::string& reason) { handleClose(code, reason); };

    Logger::info("{}: connecting", name_);
    auto startTime = std::chrono::steady_clock::now();
    transport_->open(endpointUrl(request_), handshakeHeaders(request_), std::move(handlers));

    std::unique_lock<std::mutex> lock(readyMutex_);
    bool settled = readyCv_.wait_for(lock, config_.readyTimeout,
                                     [this]() { return state_.load() != AdapterState::Connecting; });
    if (!settled) {
        lock.unlock();
        Logger::error("{}: no session acknowledgment within {} ms", name_, config_.readyTimeout.count());
        close();
        throw ProviderError(ErrorCode::Timeout, name_, "upstream did not become ready in time");
    }
    if (state_.load() != AdapterState::Ready) {
        std::string reason = failureReason_.empty() ? "connection closed" : failureReason_;
        lock.unlock();
        Logger::error("{}: connect failed: {}", name_, reason);
        close();
        throw ProviderError(ErrorCode::UpstreamUnavailable, name_, reason);
    }
    lock.unlock();

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - startTime);
    Logger::logLatency(name_ + ".connect", elapsed.count());
    Logger::info("{}: session ready", name_);
    sendInitialTurn(request_);
}

bool RealtimeAdapter::sendAudio(const AudioFrame& frame) {
    if (state_.load() != AdapterState::Ready || frame.empty()) {
        return false;
    }
    return send(audioMessage(encodeBase64(frame.data(), frame.size())));
}

void RealtimeAdapter::onEvent(ProviderEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

void RealtimeAdapter::interrupt() {
    if (state_.load() != AdapterState::Ready) {
        return;
    }
    Logger::info("{}: interrupting current turn", name_);
    if (turnOpen_.load()) {
        // Audio still in flight for the cancelled response is dropped until
        // the upstream reports the end of that turn.
        discardingTurn_.store(true);
    }
    sendInterrupt();
    closeTurn();
}

void RealtimeAdapter::close() {
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        AdapterState current = state_.load();
        if (current == AdapterState::Closed && !transport_) {
            return;
        }
        if (current != AdapterState::Closed) {
            state_.store(AdapterState::Closing);
        }
    }
    readyCv_.notify_all();

    if (transport_) {
        transport_->close();
    }
    state_.store(AdapterState::Closed);

    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = nullptr;
}

bool RealtimeAdapter::send(const json& message) {
    if (!transport_) {
        return false;
    }
    try {
        return transport_->sendText(message.dump());
    } catch (const json::exception& e) {
        Logger::error("{}: cannot serialize message: {}", name_, e.what());
        return false;
    }
}

void RealtimeAdapter::markReady() {
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        AdapterState expected = AdapterState::Connecting;
        if (!state_.compare_exchange_strong(expected, AdapterState::Ready)) {
            return;
        }
    }
    readyCv_.notify_all();
}

void RealtimeAdapter::beginTurn() {
    if (discardingTurn_.load()) {
        return;
    }
    if (!turnOpen_.exchange(true)) {
        ProviderEvent event;
        event.type = ProviderEventType::TurnStarted;
        dispatch(event);
    }
}

void RealtimeAdapter::completeTurn() {
    if (discardingTurn_.exchange(false)) {
        Logger::debug("{}: cancelled turn finished upstream", name_);
    }
    closeTurn();
}

void RealtimeAdapter::closeTurn() {
    if (turnOpen_.exchange(false)) {
        ProviderEvent event;
        event.type = ProviderEventType::TurnCompleted;
        dispatch(event);
    }
}

void RealtimeAdapter::emitAudio(AudioFrame audio) {
    if (audio.empty()) {
        return;
    }
    if (discardingTurn_.load()) {
        Logger::trace("{}: dropping {} bytes from interrupted turn", name_, audio.size());
        return;
    }
    beginTurn();
    ProviderEvent event;
    event.type = ProviderEventType::AudioChunkReceived;
    event.audio = std::move(audio);
    dispatch(event);
}

void RealtimeAdapter::emitText(ProviderEventType type, const std::string& text) {
    if (text.empty()) {
        return;
    }
    ProviderEvent event;
    event.type = type;
    event.text = text;
    dispatch(event);
}

void RealtimeAdapter::emitError(ErrorCode code, const std::string& message) {
    Logger::error("{}: upstream error: {}", name_, message);
    Logger::countFailure(name_ + ".upstream");
    ProviderEvent event;
    event.type = ProviderEventType::UpstreamError;
    event.code = code;
    event.text = message;
    dispatch(event);
}

void RealtimeAdapter::emitSessionEnded() {
    if (sessionEndedSent_.exchange(true)) {
        return;
    }
    ProviderEvent event;
    event.type = ProviderEventType::SessionEnded;
    dispatch(event);
}

void RealtimeAdapter::dispatch(const ProviderEvent& event) {
    ProviderEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = callback_;
    }
    if (callback) {
        callback(event);
    }
}

void RealtimeAdapter::handleText(const std::string& payload) {
    json message = json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        Logger::warning("{}: ignoring non-JSON upstream frame ({} bytes)", name_, payload.size());
        return;
    }
    try {
        onUpstreamMessage(message);
    } catch (const json::exception& e) {
        Logger::warning("{}: malformed upstream event: {}", name_, e.what());
    }
}

void RealtimeAdapter::handleFailure(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        if (state_.load() == AdapterState::Connecting) {
            failureReason_ = reason;
            state_.store(AdapterState::Closed);
            readyCv_.notify_all();
            return;
        }
    }
    if (state_.load() == AdapterState::Ready) {
        state_.store(AdapterState::Closed);
        emitError(ErrorCode::UpstreamUnavailable, reason);
        emitSessionEnded();
    }
}

void RealtimeAdapter::handleClose(uint16_t code, const std::string& reason) {
    Logger::info("{}: upstream closed ({}) {}", name_, code, reason);
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        if (state_.load() == AdapterState::Connecting) {
            failureReason_ = "upstream closed during handshake (" + std::to_string(code) + " " + reason + ")";
            state_.store(AdapterState::Closed);
            readyCv_.notify_all();
            return;
        }
    }
    if (state_.load() == AdapterState::Ready) {
        state_.store(AdapterState::Closed);
        emitSessionEnded();
    }
}

std::string RealtimeAdapter::encodeBase64(const uint8_t* data, size_t size) {
    return websocketpp::base64_encode(data, size);
}

std::vector<uint8_t> RealtimeAdapter::decodeBase64(const std::string& encoded) {
    std::string decoded = websocketpp::base64_decode(encoded);
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

} // namespace vani::providers
