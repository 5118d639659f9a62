#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "audio_types.hpp"
#include "core/audio/frame_encoder.hpp"
#include "core/audio/transcoding_pipeline.hpp"
#include "network/device_channel.hpp"

namespace vani::session {

namespace playback_status {
constexpr const char* PLAYING = "playing";
constexpr const char* PAUSED = "paused";
constexpr const char* STOPPED = "stopped";
constexpr const char* COMPLETED = "completed";
constexpr const char* FAILED = "error";
} // namespace playback_status

/**
 * @brief Real-time paced, cancellable delivery of an audio asset
 *
 * Each play() takes the next stream token. The streaming loop compares its
 * token with the current one before every frame and exits as soon as it has
 * been superseded. The token is advanced under the same lock that guards each
 * frame write, so once play() or stop() returns no frame of an older stream
 * reaches the device.
 */
class PlaybackController {
public:
    struct Config {
        std::chrono::milliseconds pacingMargin{10};
        core::audio::GainSettings assetGain;
    };

    using StatusCallback = std::function<void(const std::string& status, const std::optional<std::string>& assetId)>;

    PlaybackController(std::shared_ptr<network::DeviceChannel> channel,
                       core::audio::TranscodingPipeline pipeline,
                       core::audio::FrameEncoderFactory encoderFactory,
                       const Config& config);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /// Start streaming asset; never blocks on a running stream.
    uint64_t play(const AudioFrame& asset, const std::optional<std::string>& assetId = std::nullopt);

    /// Supersede the running stream and report status (stopped or paused).
    void stop(const std::string& status = playback_status::STOPPED);

    /// Restart the most recently played asset. @return false if there is none
    bool resume();

    /// Supersede everything and wait for the stream threads to exit.
    void shutdown();

    void setStatusCallback(StatusCallback callback);

    uint64_t currentToken() const { return token_.load(); }
    bool isPlaying() const { return activeStreams_.load() > 0; }
    uint64_t framesSent() const { return framesSent_.load(); }
    std::chrono::milliseconds pacingInterval() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void runStream(uint64_t token, AudioFrame asset, std::optional<std::string> assetId);
    bool isCurrent(uint64_t token) const { return token_.load() == token && !shuttingDown_.load(); }
    void reportStatus(uint64_t token, const std::string& status, const std::optional<std::string>& assetId);
    void reapFinishedWorkers();
    void wakeStreams();

    std::shared_ptr<network::DeviceChannel> channel_;
    core::audio::TranscodingPipeline pipeline_;
    core::audio::FrameEncoderFactory encoderFactory_;
    Config config_;

    std::atomic<uint64_t> token_{0};
    std::atomic<bool> shuttingDown_{false};
    std::atomic<int> activeStreams_{0};
    std::atomic<uint64_t> framesSent_{0};

    // Held for every frame write and every token change
    std::mutex sendMutex_;
    // Orders status reports; never held while the token changes
    std::mutex statusMutex_;

    std::mutex waitMutex_;
    std::condition_variable waitCv_;

    std::mutex stateMutex_;
    std::vector<Worker> workers_;
    std::optional<AudioFrame> lastAsset_;
    std::optional<std::string> lastAssetId_;
    StatusCallback statusCallback_;
};

} // namespace vani::session
