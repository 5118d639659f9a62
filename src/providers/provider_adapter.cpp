#include "providers/provider_adapter.hpp"

namespace vani::providers {

const char* providerEventTypeToString(ProviderEventType type) {
    switch (type) {
        case ProviderEventType::AudioChunkReceived: return "audioChunkReceived";
        case ProviderEventType::UserUtteranceTranscribed: return "userUtteranceTranscribed";
        case ProviderEventType::AssistantUtteranceProduced: return "assistantUtteranceProduced";
        case ProviderEventType::TurnStarted: return "turnStarted";
        case ProviderEventType::TurnCompleted: return "turnCompleted";
        case ProviderEventType::SessionEnded: return "sessionEnded";
        case ProviderEventType::UpstreamError: return "upstreamError";
    }
    return "unknown";
}

const char* adapterStateToString(AdapterState state) {
    switch (state) {
        case AdapterState::Idle: return "Idle";
        case AdapterState::Connecting: return "Connecting";
        case AdapterState::Ready: return "Ready";
        case AdapterState::Closing: return "Closing";
        case AdapterState::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace vani::providers
