#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/audio/frame_encoder.hpp"
#include "core/audio/frame_slicer.hpp"
#include "core/audio/transcoding_pipeline.hpp"
#include "network/connection_registry.hpp"
#include "network/device_channel.hpp"
#include "network/device_protocol.hpp"
#include "providers/provider_adapter.hpp"
#include "session/asset_store.hpp"
#include "session/pending_frame_queue.hpp"
#include "session/playback_controller.hpp"
#include "session/usage_meter.hpp"
#include "session/user_directory.hpp"

namespace vani::session {

enum class SessionState {
    AwaitingAuth,
    AwaitingProvider,
    Bridging,
    Closing,
    Closed
};

const char* sessionStateToString(SessionState state);

struct SessionSettings {
    core::audio::TranscodingPipeline::Config pipeline;
    uint32_t deviceInputSampleRate = audio_constants::DEVICE_INPUT_SAMPLE_RATE;
    PlaybackController::Config playback;
    UsageMeter::Config usage;
    size_t pendingQueueCapacity = PendingFrameQueue::DEFAULT_CAPACITY;
};

struct SessionDependencies {
    std::shared_ptr<network::ConnectionRegistry> registry;
    std::shared_ptr<UserDirectory> directory;
    std::shared_ptr<AssetStore> assets;
    core::audio::FrameEncoderFactory encoderFactory;
    UsageMeter::Clock clock;    // empty: steady_clock
};

/**
 * @brief One bridged device connection
 *
 * AwaitingProvider -> Bridging -> Closing -> Closed. Owns the provider
 * adapter, the pending-frame queue, the playback controller and the usage
 * meter; close() tears all of them down and never lets any of them touch the
 * device afterwards.
 *
 * Device callbacks (onDeviceBinary/onDeviceText) come from the server thread,
 * provider events from the adapter thread.
 */
class BridgeSession : public std::enable_shared_from_this<BridgeSession> {
public:
    BridgeSession(UserRecord user,
                  std::string providerTag,
                  std::unique_ptr<providers::ProviderAdapter> adapter,
                  providers::ConnectRequest connectRequest,
                  std::shared_ptr<network::DeviceChannel> channel,
                  SessionDependencies dependencies,
                  const SessionSettings& settings);
    ~BridgeSession();

    BridgeSession(const BridgeSession&) = delete;
    BridgeSession& operator=(const BridgeSession&) = delete;

    /// Send auth, enforce quota, register and start connecting upstream.
    void start();

    void onDeviceBinary(const std::vector<uint8_t>& payload);
    void onDeviceText(const std::string& text);

    /// Idempotent teardown.
    void close(const std::string& reason, uint16_t closeCode = network::close_code::NORMAL);

    SessionState state() const { return state_.load(); }
    const std::string& deviceId() const { return deviceId_; }
    const std::string& providerTag() const { return providerTag_; }
    const UserRecord& user() const { return user_; }
    const UsageRecord& usageRecord() const { return usageRecord_; }
    std::chrono::system_clock::time_point createdAt() const { return createdAt_; }

    uint64_t framesForwarded() const { return framesForwarded_.load(); }
    uint64_t framesSentToDevice() const { return framesSentToDevice_.load(); }
    PlaybackController& playback() { return *playback_; }

private:
    void connectUpstream();
    void forwardToProvider(const AudioFrame& frame);
    void handleProviderEvent(const providers::ProviderEvent& event);
    void handleInstruction(const std::string& instruction);
    void handleAction(const network::protocol::DeviceMessage& message);
    void sendAudioToDevice(const AudioFrame& chunk);
    void sendFramesLocked(const std::vector<std::vector<uint8_t>>& frames);
    void flushFramer();
    void resetFramer();
    void onQuotaExceeded(uint64_t elapsedSeconds);
    void fail(ErrorCode code, const std::string& message);
    bool sendJson(const nlohmann::json& message);
    std::optional<int> volume() const;
    bool isClosing() const;

    UserRecord user_;
    std::string providerTag_;
    std::string deviceId_;
    UsageRecord usageRecord_;
    std::chrono::system_clock::time_point createdAt_;

    std::unique_ptr<providers::ProviderAdapter> adapter_;
    providers::ConnectRequest connectRequest_;
    std::shared_ptr<network::DeviceChannel> channel_;
    SessionDependencies deps_;
    SessionSettings settings_;

    std::atomic<SessionState> state_{SessionState::AwaitingProvider};
    core::audio::TranscodingPipeline pipeline_;
    PendingFrameQueue pending_;
    std::unique_ptr<PlaybackController> playback_;
    std::unique_ptr<UsageMeter> meter_;

    // Provider -> device path
    std::mutex outboundMutex_;
    core::audio::StreamingFramer framer_;
    std::unique_ptr<core::audio::FrameEncoder> encoder_;
    core::audio::TranscodingPipeline::EncodeStats encodeStats_;

    std::atomic<uint64_t> framesForwarded_{0};
    std::atomic<uint64_t> framesSentToDevice_{0};

    std::mutex lifecycleMutex_;
    std::thread connectThread_;
};

} // namespace vani::session
