#pragma once

#include <functional>
#include <string>

#include "audio_types.hpp"
#include "core/audio/transcoding_pipeline.hpp"
#include "system/errors.hpp"

namespace vani::providers {

// Normalized upstream events; every provider maps its vocabulary onto these
enum class ProviderEventType {
    AudioChunkReceived,
    UserUtteranceTranscribed,
    AssistantUtteranceProduced,
    TurnStarted,
    TurnCompleted,
    SessionEnded,
    UpstreamError
};

const char* providerEventTypeToString(ProviderEventType type);

struct ProviderEvent {
    ProviderEventType type = ProviderEventType::UpstreamError;
    AudioFrame audio;       // AudioChunkReceived
    std::string text;       // utterances, error message
    ErrorCode code = ErrorCode::UpstreamUnavailable;  // UpstreamError
};

using ProviderEventCallback = std::function<void(const ProviderEvent&)>;

struct ProviderCredentials {
    std::string apiKey;
    std::string endpoint;
    std::string model;
    std::string voice;
};

struct ConnectRequest {
    ProviderCredentials credentials;
    std::string initialTurnText;
    std::string systemContext;
};

enum class AdapterState {
    Idle,
    Connecting,
    Ready,
    Closing,
    Closed
};

const char* adapterStateToString(AdapterState state);

/**
 * @brief One upstream realtime voice service behind a common lifecycle
 *
 * Connecting -> Ready -> Closing -> Closed, or straight to Closed when the
 * upstream fails. The adapter instance itself is the connection handle.
 *
 * Events are delivered on the adapter's I/O thread. TurnStarted and
 * TurnCompleted are emitted at most once per assistant turn regardless of how
 * many intermediate events the upstream produces.
 */
class ProviderAdapter {
public:
    virtual ~ProviderAdapter() = default;

    virtual std::string name() const = 0;

    /**
     * Open the upstream socket and block until the service acknowledges the
     * session, then send the initial turn.
     * @throws ProviderError UpstreamUnavailable on network/auth failure,
     *         Timeout when no acknowledgment arrives in time
     */
    virtual void connect(const ConnectRequest& request) = 0;

    /// Only valid once Ready; returns false otherwise or when the write fails.
    virtual bool sendAudio(const AudioFrame& frame) = 0;

    virtual void onEvent(ProviderEventCallback callback) = 0;

    /// Cancel the assistant turn in progress.
    virtual void interrupt() = 0;

    /// Idempotent. No events are delivered after close() returns.
    virtual void close() = 0;

    virtual AdapterState state() const = 0;

    /// Format the provider expects for inbound (device) audio
    virtual AudioFormat inputFormat() const = 0;
    /// Format of audio chunks the provider produces
    virtual AudioFormat outputFormat() const = 0;
    virtual core::audio::GainSettings outputGain() const = 0;
};

} // namespace vani::providers
