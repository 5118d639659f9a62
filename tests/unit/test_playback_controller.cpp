#include <gtest/gtest.h>
#include "core/audio/pcm_dsp.hpp"
#include "session/playback_controller.hpp"
#include "support/test_fakes.hpp"
#include "system/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace vani;
using namespace vani::session;
using vani::testing::FakeDeviceChannel;
using vani::testing::fakeEncoderFactory;
using vani::testing::pcmBytes;
using vani::testing::sineSamples;
using vani::testing::waitUntil;

class PlaybackControllerTest : public ::testing::Test {
protected:
    struct StatusEntry {
        std::string status;
        std::optional<std::string> assetId;
    };

    void SetUp() override {
        Logger::initialize("", Logger::Level::Critical, false);
        channel_ = std::make_shared<FakeDeviceChannel>();

        // 10 ms frames keep the pacing short
        core::audio::TranscodingPipeline::Config pipelineConfig;
        pipelineConfig.outputSampleRate = 24000;
        pipelineConfig.frameBytes = 480;
        PlaybackController::Config config;
        config.pacingMargin = std::chrono::milliseconds(5);

        controller_ = std::make_unique<PlaybackController>(
            channel_, core::audio::TranscodingPipeline(pipelineConfig), fakeEncoderFactory(), config);
        controller_->setStatusCallback([this](const std::string& status, const std::optional<std::string>& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            statuses_.push_back({status, id});
        });
    }

    void TearDown() override {
        controller_.reset();
        Logger::shutdown();
    }

    AudioFrame asset(size_t frames, int16_t marker) {
        std::vector<int16_t> samples(frames * 240, marker);
        return AudioFrame(pcmBytes(samples), {AudioEncoding::PCM16, 24000, 1});
    }

    std::vector<StatusEntry> statuses() {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    bool sawStatus(const std::string& status) {
        for (const auto& entry : statuses()) {
            if (entry.status == status) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<FakeDeviceChannel> channel_;
    std::unique_ptr<PlaybackController> controller_;
    std::mutex mutex_;
    std::vector<StatusEntry> statuses_;
};

TEST_F(PlaybackControllerTest, PacingIntervalIsFrameMinusMargin) {
    EXPECT_EQ(controller_->pacingInterval(), std::chrono::milliseconds(5));

    PlaybackController defaults(channel_, core::audio::TranscodingPipeline(), fakeEncoderFactory(), {});
    EXPECT_EQ(defaults.pacingInterval(), std::chrono::milliseconds(110));
}

TEST_F(PlaybackControllerTest, StreamsEveryFrameAndReportsCompletion) {
    controller_->play(asset(6, 1000), std::string("b1"));

    ASSERT_TRUE(waitUntil([this]() { return sawStatus(playback_status::COMPLETED); }));
    EXPECT_EQ(channel_->binaryCount(), 6u);
    EXPECT_EQ(controller_->framesSent(), 6u);

    auto entries = statuses();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].status, playback_status::PLAYING);
    EXPECT_EQ(entries[1].status, playback_status::COMPLETED);
    EXPECT_EQ(entries[1].assetId, std::optional<std::string>("b1"));
}

TEST_F(PlaybackControllerTest, NewPlaySupersedesRunningStream) {
    controller_->play(asset(400, 1111), std::string("old"));
    ASSERT_TRUE(waitUntil([this]() { return channel_->binaryCount() >= 3; }));

    controller_->play(asset(4, 2222), std::string("new"));
    size_t sentAtSwitch = channel_->binaryCount();

    ASSERT_TRUE(waitUntil([this]() {
        for (const auto& entry : statuses()) {
            if (entry.status == playback_status::COMPLETED && entry.assetId == std::optional<std::string>("new")) {
                return true;
            }
        }
        return false;
    }));

    // After play() returned, only frames of the new asset reach the device
    auto frames = channel_->binaries();
    for (size_t i = sentAtSwitch; i < frames.size(); ++i) {
        auto samples = core::audio::bytesToSamples(frames[i].data(), frames[i].size());
        EXPECT_EQ(samples.front(), 2222) << "frame " << i;
    }
    EXPECT_LT(frames.size(), 400u);

    for (const auto& entry : statuses()) {
        if (entry.assetId == std::optional<std::string>("old")) {
            EXPECT_NE(entry.status, playback_status::COMPLETED);
        }
    }
}

TEST_F(PlaybackControllerTest, PlayDoesNotWaitForSlowStatusCallback) {
    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool entered = false;
    bool released = false;

    controller_->setStatusCallback([&](const std::string& status, const std::optional<std::string>& id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            statuses_.push_back({status, id});
        }
        std::unique_lock<std::mutex> lock(gateMutex);
        if (!entered) {
            // First report stands in for a slow directory write
            entered = true;
            gateCv.wait(lock, [&released]() { return released; });
        }
    });

    controller_->play(asset(400, 1111), std::string("old"));
    ASSERT_TRUE(waitUntil([&]() {
        std::lock_guard<std::mutex> lock(gateMutex);
        return entered;
    }));

    std::atomic<uint64_t> newToken{0};
    std::thread requester([&]() { newToken = controller_->play(asset(2, 2222), std::string("new")); });
    bool returned = waitUntil([&newToken]() { return newToken.load() != 0; });

    {
        std::lock_guard<std::mutex> lock(gateMutex);
        released = true;
    }
    gateCv.notify_all();
    requester.join();

    ASSERT_TRUE(returned);
    EXPECT_EQ(controller_->currentToken(), newToken.load());
    ASSERT_TRUE(waitUntil([this]() { return sawStatus(playback_status::COMPLETED); }));

    for (const auto& entry : statuses()) {
        if (entry.status == playback_status::COMPLETED) {
            EXPECT_EQ(entry.assetId, std::optional<std::string>("new"));
        }
    }
    // Join the workers before the gate goes out of scope
    controller_->shutdown();
}

TEST_F(PlaybackControllerTest, StopEndsStreamAndReportsStatus) {
    controller_->play(asset(400, 500), std::string("b9"));
    ASSERT_TRUE(waitUntil([this]() { return channel_->binaryCount() >= 2; }));

    controller_->stop(playback_status::PAUSED);
    size_t sent = channel_->binaryCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(channel_->binaryCount(), sent);
    EXPECT_TRUE(sawStatus(playback_status::PAUSED));
    EXPECT_FALSE(sawStatus(playback_status::COMPLETED));
}

TEST_F(PlaybackControllerTest, ResumeReplaysLastAsset) {
    EXPECT_FALSE(controller_->resume());

    controller_->play(asset(2, 700), std::string("b2"));
    ASSERT_TRUE(waitUntil([this]() { return sawStatus(playback_status::COMPLETED); }));

    EXPECT_TRUE(controller_->resume());
    ASSERT_TRUE(waitUntil([this]() { return channel_->binaryCount() == 4; }));
}

TEST_F(PlaybackControllerTest, UndecodableAssetReportsFailure) {
    AudioFrame broken(std::vector<uint8_t>(64, 1), {AudioEncoding::OPUS, 24000, 1});
    controller_->play(broken, std::string("bad"));

    ASSERT_TRUE(waitUntil([this]() { return sawStatus(playback_status::FAILED); }));
    EXPECT_EQ(channel_->binaryCount(), 0u);
}

TEST_F(PlaybackControllerTest, ShutdownStopsStreamsWithoutStatus) {
    controller_->play(asset(400, 1), std::string("long"));
    ASSERT_TRUE(waitUntil([this]() { return channel_->binaryCount() >= 1; }));

    controller_->shutdown();
    size_t sent = channel_->binaryCount();
    size_t reported = statuses().size();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_EQ(channel_->binaryCount(), sent);
    EXPECT_EQ(statuses().size(), reported);
    EXPECT_FALSE(controller_->isPlaying());
}
