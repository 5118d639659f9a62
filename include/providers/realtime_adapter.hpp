#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "network/upstream_transport.hpp"
#include "providers/provider_adapter.hpp"

namespace vani::providers {

/**
 * @brief Shared lifecycle for JSON-over-WebSocket voice services
 *
 * Handles the transport, the readiness wait, turn bookkeeping and event
 * dispatch. Subclasses supply the endpoint, the handshake messages and the
 * mapping from native events to ProviderEvent.
 */
class RealtimeAdapter : public ProviderAdapter {
public:
    struct Config {
        std::chrono::milliseconds readyTimeout{10000};
        core::audio::GainSettings outputGain;
    };

    RealtimeAdapter(std::string name, network::UpstreamTransportFactory transportFactory, const Config& config);
    ~RealtimeAdapter() override;

    RealtimeAdapter(const RealtimeAdapter&) = delete;
    RealtimeAdapter& operator=(const RealtimeAdapter&) = delete;

    std::string name() const override { return name_; }
    void connect(const ConnectRequest& request) override;
    bool sendAudio(const AudioFrame& frame) override;
    void onEvent(ProviderEventCallback callback) override;
    void interrupt() override;
    void close() override;
    AdapterState state() const override { return state_.load(); }
    core::audio::GainSettings outputGain() const override { return config_.outputGain; }

    static std::string encodeBase64(const uint8_t* data, size_t size);
    static std::vector<uint8_t> decodeBase64(const std::string& encoded);

protected:
    virtual std::string endpointUrl(const ConnectRequest& request) const = 0;
    virtual network::UpstreamTransport::Headers handshakeHeaders(const ConnectRequest& request) const;

    /// Socket is open; send session configuration here.
    virtual void onUpstreamOpen(const ConnectRequest& request);
    virtual void onUpstreamMessage(const nlohmann::json& message) = 0;
    virtual nlohmann::json audioMessage(const std::string& base64Audio) const = 0;

    /// Called on the connecting thread once the session is acknowledged.
    virtual void sendInitialTurn(const ConnectRequest& request);
    virtual void sendInterrupt();

    bool send(const nlohmann::json& message);

    // Called by subclasses from onUpstreamMessage
    void markReady();
    void beginTurn();
    /// Upstream's own end of turn; also ends discarding after interrupt().
    void completeTurn();
    void emitAudio(AudioFrame audio);
    void emitText(ProviderEventType type, const std::string& text);
    void emitError(ErrorCode code, const std::string& message);
    void emitSessionEnded();

    bool turnOpen() const { return turnOpen_.load(); }
    const ConnectRequest& request() const { return request_; }

private:
    void handleText(const std::string& payload);
    void handleFailure(const std::string& reason);
    void handleClose(uint16_t code, const std::string& reason);
    void dispatch(const ProviderEvent& event);
    void closeTurn();

    std::string name_;
    network::UpstreamTransportFactory transportFactory_;
    Config config_;
    ConnectRequest request_;
    std::unique_ptr<network::UpstreamTransport> transport_;

    std::atomic<AdapterState> state_{AdapterState::Idle};
    std::atomic<bool> turnOpen_{false};
    std::atomic<bool> discardingTurn_{false};
    std::atomic<bool> sessionEndedSent_{false};

    std::mutex readyMutex_;
    std::condition_variable readyCv_;
    std::string failureReason_;

    std::mutex callbackMutex_;
    ProviderEventCallback callback_;
};

} // namespace vani::providers
