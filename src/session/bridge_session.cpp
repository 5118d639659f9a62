#include "session/bridge_session.hpp"
#include "system/logger.hpp"

namespace vani::session {

using json = nlohmann::json;
namespace protocol = network::protocol;

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::AwaitingAuth: return "AwaitingAuth";
        case SessionState::AwaitingProvider: return "AwaitingProvider";
        case SessionState::Bridging: return "Bridging";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

BridgeSession::BridgeSession(UserRecord user,
                             std::string providerTag,
                             std::unique_ptr<providers::ProviderAdapter> adapter,
                             providers::ConnectRequest connectRequest,
                             std::shared_ptr<network::DeviceChannel> channel,
                             SessionDependencies dependencies,
                             const SessionSettings& settings)
    : user_(std::move(user)),
      providerTag_(std::move(providerTag)),
      createdAt_(std::chrono::system_clock::now()),
      adapter_(std::move(adapter)),
      connectRequest_(std::move(connectRequest)),
      channel_(std::move(channel)),
      deps_(std::move(dependencies)),
      settings_(settings),
      pipeline_(settings.pipeline),
      pending_(settings.pendingQueueCapacity),
      framer_(settings.pipeline.frameBytes) {
    deviceId_ = user_.device && !user_.device->deviceId.empty() ? user_.device->deviceId : user_.userId;

    usageRecord_.userId = user_.userId;
    usageRecord_.cumulativeSeconds = user_.cumulativeUsageSeconds;
    usageRecord_.premium = user_.isPremium;
    usageRecord_.quotaSeconds = UsageMeter::quotaFor(user_.isPremium, settings_.usage);

    playback_ = std::make_unique<PlaybackController>(channel_, pipeline_, deps_.encoderFactory, settings_.playback);
}

BridgeSession::~BridgeSession() {
    close("session released");
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (connectThread_.joinable()) {
        if (connectThread_.get_id() == std::this_thread::get_id()) {
            connectThread_.detach();
        } else {
            connectThread_.join();
        }
    }
}

bool BridgeSession::isClosing() const {
    SessionState current = state_.load();
    return current == SessionState::Closing || current == SessionState::Closed;
}

bool BridgeSession::sendJson(const json& message) {
    if (!channel_->sendText(message.dump())) {
        Logger::debug("BridgeSession[{}]: device write failed", deviceId_);
        return false;
    }
    return true;
}

std::optional<int> BridgeSession::volume() const {
    if (user_.device) {
        return user_.device->volume;
    }
    return std::nullopt;
}

void BridgeSession::start() {
    protocol::AuthPayload auth;
    auth.pitchFactor = user_.pitchFactor;
    if (user_.device) {
        auth.volume = user_.device->volume;
        auth.isOta = user_.device->isOta;
        auth.isReset = user_.device->isReset;
        auth.selectedAssetId = user_.device->selectedAssetId;
        auth.playbackStatus = user_.device->playbackStatus;
    }
    sendJson(protocol::makeAuthMessage(auth));

    if (UsageMeter::isOverQuota(usageRecord_)) {
        Logger::warning("BridgeSession[{}]: user {} already at quota ({}s of {}s)", deviceId_,
                        usageRecord_.userId, usageRecord_.cumulativeSeconds, usageRecord_.quotaSeconds);
        sendJson(protocol::makeErrorMessage(ErrorCode::QuotaExceeded, "usage quota exhausted"));
        close("quota exhausted");
        return;
    }

    try {
        encoder_ = deps_.encoderFactory();
    } catch (const BridgeError& e) {
        fail(e.code(), e.what());
        return;
    }

    deps_.registry->registerChannel(network::ConnectionRegistry::primaryKey(deviceId_), channel_);

    std::weak_ptr<BridgeSession> weak = shared_from_this();
    adapter_->onEvent([weak](const providers::ProviderEvent& event) {
        if (auto self = weak.lock()) {
            self->handleProviderEvent(event);
        }
    });

    auto directory = deps_.directory;
    std::string userId = user_.userId;
    playback_->setStatusCallback([weak, directory, userId](const std::string& status,
                                                          const std::optional<std::string>& assetId) {
        if (auto self = weak.lock()) {
            self->sendJson(protocol::makePlaybackStatus(status, assetId));
        }
        directory->recordPlaybackStatus(userId, status, assetId);
    });

    meter_ = std::make_unique<UsageMeter>(
        usageRecord_, settings_.usage,
        [directory](const std::string& id, uint64_t seconds) {
            if (!directory->persistUsageSeconds(id, seconds)) {
                Logger::warning("BridgeSession: usage for {} not persisted", id);
            }
        },
        [weak](uint64_t elapsed) {
            if (auto self = weak.lock()) {
                self->onQuotaExceeded(elapsed);
            }
        },
        deps_.clock);
    meter_->start();

    Logger::info("BridgeSession[{}]: user {} bridging to {}", deviceId_, user_.userId, providerTag_);

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (isClosing()) {
        return;
    }
    auto self = shared_from_this();
    connectThread_ = std::thread([self]() { self->connectUpstream(); });
}

void BridgeSession::connectUpstream() {
    try {
        adapter_->connect(connectRequest_);
    } catch (const BridgeError& e) {
        if (!isClosing()) {
            fail(e.code(), e.what());
        }
        return;
    }

    SessionState expected = SessionState::AwaitingProvider;
    if (!state_.compare_exchange_strong(expected, SessionState::Bridging)) {
        return;
    }

    sendJson(protocol::makeServerMessage(protocol::ServerSignal::SessionCreated));
    size_t drained = pending_.drainOnce([this](const AudioFrame& frame) { forwardToProvider(frame); });
    Logger::info("BridgeSession[{}]: {} ready, {} buffered frames forwarded", deviceId_, adapter_->name(), drained);
}

void BridgeSession::onDeviceBinary(const std::vector<uint8_t>& payload) {
    if (isClosing() || payload.empty()) {
        return;
    }

    AudioFrame frame(payload, {AudioEncoding::PCM16, settings_.deviceInputSampleRate, audio_constants::DEVICE_CHANNELS});
    switch (pending_.enqueue(frame)) {
        case PendingFrameQueue::EnqueueResult::Forward:
            forwardToProvider(frame);
            break;
        case PendingFrameQueue::EnqueueResult::Queued:
        case PendingFrameQueue::EnqueueResult::Overflow:
            break;
    }
}

void BridgeSession::forwardToProvider(const AudioFrame& frame) {
    uint32_t targetRate = adapter_->inputFormat().sampleRate;
    const AudioFrame& outbound = frame.format().sampleRate == targetRate ? frame
                                                                        : pipeline_.toProviderFormat(frame, targetRate);
    if (adapter_->sendAudio(outbound)) {
        ++framesForwarded_;
    } else {
        Logger::debug("BridgeSession[{}]: provider rejected audio frame", deviceId_);
    }
}

void BridgeSession::onDeviceText(const std::string& text) {
    if (isClosing()) {
        return;
    }

    auto message = protocol::parseDeviceMessage(text);
    switch (message.kind) {
        case protocol::DeviceMessage::Kind::Instruction:
            handleInstruction(message.instruction);
            break;
        case protocol::DeviceMessage::Kind::Action:
            handleAction(message);
            break;
        case protocol::DeviceMessage::Kind::PlaybackStatus:
            Logger::debug("BridgeSession[{}]: playback {} at {}s", deviceId_, message.status, message.position);
            deps_.directory->recordPlaybackStatus(user_.userId, message.status, message.assetId);
            break;
        case protocol::DeviceMessage::Kind::Unknown:
            Logger::debug("BridgeSession[{}]: ignoring message type '{}'", deviceId_, message.type);
            break;
        case protocol::DeviceMessage::Kind::Invalid:
            Logger::warning("BridgeSession[{}]: malformed device message", deviceId_);
            break;
    }
}

void BridgeSession::handleInstruction(const std::string& instruction) {
    if (instruction == protocol::instruction::INTERRUPT) {
        Logger::info("BridgeSession[{}]: interrupt", deviceId_);
        resetFramer();
        adapter_->interrupt();
    } else if (instruction == protocol::instruction::END_SESSION) {
        Logger::info("BridgeSession[{}]: device ended session", deviceId_);
        sendJson(protocol::makeServerMessage(protocol::ServerSignal::SessionEnd));
        close("ended by device");
    } else if (instruction == protocol::instruction::END_OF_SPEECH) {
        Logger::debug("BridgeSession[{}]: end of speech", deviceId_);
    } else {
        Logger::debug("BridgeSession[{}]: unknown instruction '{}'", deviceId_, instruction);
    }
}

void BridgeSession::handleAction(const protocol::DeviceMessage& message) {
    const std::string& action = message.action;

    if (action == "play") {
        if (!message.assetId) {
            Logger::warning("BridgeSession[{}]: play without an asset id", deviceId_);
            return;
        }
        auto asset = deps_.assets->load(*message.assetId);
        if (!asset) {
            sendJson(protocol::makePlaybackStatus(playback_status::FAILED, message.assetId));
            return;
        }
        playback_->play(*asset, message.assetId);
    } else if (action == "pause") {
        playback_->stop(playback_status::PAUSED);
    } else if (action == "stop") {
        playback_->stop(playback_status::STOPPED);
    } else if (action == "resume") {
        if (!playback_->resume()) {
            Logger::info("BridgeSession[{}]: nothing to resume", deviceId_);
        }
    } else {
        Logger::debug("BridgeSession[{}]: unknown action '{}'", deviceId_, action);
    }
}

void BridgeSession::handleProviderEvent(const providers::ProviderEvent& event) {
    if (isClosing()) {
        return;
    }

    using providers::ProviderEventType;
    switch (event.type) {
        case ProviderEventType::TurnStarted:
            sendJson(protocol::makeServerMessage(protocol::ServerSignal::ResponseCreated, volume()));
            break;
        case ProviderEventType::AudioChunkReceived:
            sendAudioToDevice(event.audio);
            break;
        case ProviderEventType::TurnCompleted:
            flushFramer();
            sendJson(protocol::makeServerMessage(protocol::ServerSignal::ResponseComplete, volume()));
            break;
        case ProviderEventType::UserUtteranceTranscribed:
            Logger::info("BridgeSession[{}]: user: {}", deviceId_, event.text);
            deps_.directory->recordConversation(user_.userId, "user", event.text);
            break;
        case ProviderEventType::AssistantUtteranceProduced:
            Logger::info("BridgeSession[{}]: assistant: {}", deviceId_, event.text);
            deps_.directory->recordConversation(user_.userId, "assistant", event.text);
            break;
        case ProviderEventType::SessionEnded:
            sendJson(protocol::makeServerMessage(protocol::ServerSignal::SessionEnd));
            close("provider session ended");
            break;
        case ProviderEventType::UpstreamError:
            sendJson(protocol::makeErrorMessage(event.code, event.text));
            sendJson(protocol::makeServerMessage(protocol::ServerSignal::ResponseError));
            break;
    }
}

void BridgeSession::sendAudioToDevice(const AudioFrame& chunk) {
    std::vector<uint8_t> pcm;
    try {
        pcm = pipeline_.toDeviceBytes(chunk, adapter_->outputGain());
    } catch (const BridgeError& e) {
        Logger::countFailure("transcode");
        Logger::warning("BridgeSession[{}]: dropping upstream chunk: {}", deviceId_, e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(outboundMutex_);
    sendFramesLocked(framer_.append(pcm));
}

void BridgeSession::sendFramesLocked(const std::vector<std::vector<uint8_t>>& frames) {
    if (frames.empty() || !encoder_) {
        return;
    }
    for (const auto& packet : pipeline_.encodeFrames(frames, *encoder_, &encodeStats_)) {
        if (channel_->sendBinary(packet)) {
            ++framesSentToDevice_;
        } else {
            Logger::debug("BridgeSession[{}]: audio frame not delivered", deviceId_);
        }
    }
}

void BridgeSession::flushFramer() {
    std::lock_guard<std::mutex> lock(outboundMutex_);
    sendFramesLocked(framer_.flush());
}

void BridgeSession::resetFramer() {
    std::lock_guard<std::mutex> lock(outboundMutex_);
    framer_.reset();
}

void BridgeSession::onQuotaExceeded(uint64_t elapsedSeconds) {
    Logger::warning("BridgeSession[{}]: quota exceeded after {}s", deviceId_, elapsedSeconds);
    sendJson(protocol::makeErrorMessage(ErrorCode::QuotaExceeded, "usage quota reached"));
    sendJson(protocol::makeServerMessage(protocol::ServerSignal::SessionEnd));
    close("quota exceeded");
}

void BridgeSession::fail(ErrorCode code, const std::string& message) {
    Logger::error("BridgeSession[{}]: {} ({})", deviceId_, message, errorCodeToString(code));
    sendJson(protocol::makeErrorMessage(code, message));
    sendJson(protocol::makeServerMessage(protocol::ServerSignal::ResponseError));
    close(message, network::close_code::INTERNAL_ERROR);
}

void BridgeSession::close(const std::string& reason, uint16_t closeCode) {
    SessionState current = state_.load();
    do {
        if (current == SessionState::Closing || current == SessionState::Closed) {
            return;
        }
    } while (!state_.compare_exchange_weak(current, SessionState::Closing));

    Logger::info("BridgeSession[{}]: closing ({})", deviceId_, reason);

    playback_->shutdown();
    if (meter_) {
        meter_->stop();
    }
    adapter_->close();
    deps_.registry->unregisterChannel(network::ConnectionRegistry::primaryKey(deviceId_), channel_.get());

    if (channel_->isOpen()) {
        channel_->close(closeCode, reason);
    }

    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (connectThread_.joinable()) {
            if (connectThread_.get_id() == std::this_thread::get_id()) {
                connectThread_.detach();
            } else {
                connectThread_.join();
            }
        }
    }

    state_.store(SessionState::Closed);
    Logger::info("BridgeSession[{}]: closed, {} frames up, {} frames down", deviceId_,
                 framesForwarded_.load(), framesSentToDevice_.load());
}

} // namespace vani::session
