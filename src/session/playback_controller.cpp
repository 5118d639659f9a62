#include "session/playback_controller.hpp"
#include "core/audio/frame_slicer.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

namespace vani::session {

PlaybackController::PlaybackController(std::shared_ptr<network::DeviceChannel> channel,
                                       core::audio::TranscodingPipeline pipeline,
                                       core::audio::FrameEncoderFactory encoderFactory,
                                       const Config& config)
    : channel_(std::move(channel)),
      pipeline_(std::move(pipeline)),
      encoderFactory_(std::move(encoderFactory)),
      config_(config) {}

PlaybackController::~PlaybackController() {
    shutdown();
}

std::chrono::milliseconds PlaybackController::pacingInterval() const {
    auto frame = std::chrono::milliseconds(pipeline_.frameDurationMs());
    auto interval = frame - config_.pacingMargin;
    return interval.count() > 0 ? interval : std::chrono::milliseconds(1);
}

void PlaybackController::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    statusCallback_ = std::move(callback);
}

uint64_t PlaybackController::play(const AudioFrame& asset, const std::optional<std::string>& assetId) {
    if (shuttingDown_.load()) {
        return token_.load();
    }

    uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        token = ++token_;
    }
    wakeStreams();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        reapFinishedWorkers();
        lastAsset_ = asset;
        lastAssetId_ = assetId;

        Worker worker;
        worker.finished = std::make_shared<std::atomic<bool>>(false);
        auto finished = worker.finished;
        worker.thread = std::thread([this, token, asset, assetId, finished]() {
            runStream(token, asset, assetId);
            finished->store(true);
        });
        workers_.push_back(std::move(worker));
    }

    Logger::info("PlaybackController: stream {} started for asset {}", token, assetId.value_or("<inline>"));
    return token;
}

void PlaybackController::stop(const std::string& status) {
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        ++token_;
    }
    wakeStreams();

    StatusCallback callback;
    std::optional<std::string> assetId;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        callback = statusCallback_;
        assetId = lastAssetId_;
    }
    Logger::info("PlaybackController: playback {}", status);
    if (callback && !shuttingDown_.load()) {
        std::lock_guard<std::mutex> lock(statusMutex_);
        callback(status, assetId);
    }
}

bool PlaybackController::resume() {
    std::optional<AudioFrame> asset;
    std::optional<std::string> assetId;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        asset = lastAsset_;
        assetId = lastAssetId_;
    }
    if (!asset) {
        return false;
    }
    play(*asset, assetId);
    return true;
}

void PlaybackController::shutdown() {
    if (shuttingDown_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        ++token_;
    }
    wakeStreams();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        workers.swap(workers_);
        statusCallback_ = nullptr;
    }
    for (auto& worker : workers) {
        if (!worker.thread.joinable()) {
            continue;
        }
        if (worker.thread.get_id() == std::this_thread::get_id()) {
            worker.thread.detach();
        } else {
            worker.thread.join();
        }
    }
}

void PlaybackController::wakeStreams() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
    }
    waitCv_.notify_all();
}

void PlaybackController::reapFinishedWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load() && it->thread.joinable()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void PlaybackController::reportStatus(uint64_t token, const std::string& status,
                                      const std::optional<std::string>& assetId) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        callback = statusCallback_;
    }
    if (!callback) {
        return;
    }
    // Only statusMutex_ is held here, so play() and stop() can advance the
    // token while a slow callback runs.
    std::lock_guard<std::mutex> lock(statusMutex_);
    if (isCurrent(token)) {
        callback(status, assetId);
    }
}

void PlaybackController::runStream(uint64_t token, AudioFrame asset, std::optional<std::string> assetId) {
    ++activeStreams_;

    std::vector<std::vector<uint8_t>> frames;
    std::unique_ptr<core::audio::FrameEncoder> encoder;
    try {
        frames = core::audio::sliceFrames(pipeline_.toDeviceBytes(asset, config_.assetGain), pipeline_.frameBytes());
        encoder = encoderFactory_();
    } catch (const BridgeError& e) {
        Logger::error("PlaybackController: stream {} cannot start: {}", token, e.what());
        reportStatus(token, playback_status::FAILED, assetId);
        --activeStreams_;
        return;
    }

    reportStatus(token, playback_status::PLAYING, assetId);

    const auto interval = pacingInterval();
    core::audio::TranscodingPipeline::EncodeStats stats;
    size_t sent = 0;
    bool interrupted = false;

    for (const auto& frame : frames) {
        if (!isCurrent(token)) {
            interrupted = true;
            break;
        }

        auto packets = pipeline_.encodeFrames({frame}, *encoder, &stats);
        if (packets.empty()) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(sendMutex_);
            if (!isCurrent(token)) {
                interrupted = true;
                break;
            }
            if (!channel_->sendBinary(packets.front())) {
                Logger::warning("PlaybackController: device write failed, ending stream {}", token);
                interrupted = true;
                break;
            }
        }
        ++sent;
        ++framesSent_;

        std::unique_lock<std::mutex> lock(waitMutex_);
        waitCv_.wait_for(lock, interval, [this, token]() { return !isCurrent(token); });
    }

    if (!interrupted) {
        reportStatus(token, playback_status::COMPLETED, assetId);
    }
    Logger::info("PlaybackController: stream {} {} after {}/{} frames ({} skipped)", token,
                 interrupted ? "ended early" : "completed", sent, frames.size(), stats.framesSkipped);
    --activeStreams_;
}

} // namespace vani::session
