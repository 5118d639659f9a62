#include <gtest/gtest.h>
#include "core/audio/pcm_dsp.hpp"
#include "network/connection_registry.hpp"
#include "providers/realtime_adapter.hpp"
#include "session/session_orchestrator.hpp"
#include "support/test_fakes.hpp"
#include "system/logger.hpp"

using namespace vani;
using namespace vani::session;
using vani::testing::FakeDeviceChannel;
using vani::testing::FakeUpstream;
using vani::testing::InMemoryAssetStore;
using vani::testing::InMemoryUserDirectory;
using vani::testing::ManualClock;
using vani::testing::fakeEncoderFactory;
using vani::testing::json;
using vani::testing::makeUser;
using vani::testing::pcmBytes;
using vani::testing::waitUntil;

namespace {

constexpr const char* kSessionUpdated = R"({"type":"session.updated"})";

std::string audioDelta(size_t samples, int16_t value) {
    auto bytes = pcmBytes(std::vector<int16_t>(samples, value));
    return json{{"type", "response.output_audio.delta"},
                {"delta", providers::RealtimeAdapter::encodeBase64(bytes.data(), bytes.size())}}
        .dump();
}

std::string geminiAudio(size_t samples, int16_t value) {
    auto bytes = pcmBytes(std::vector<int16_t>(samples, value));
    json part = {{"inlineData", {{"mimeType", "audio/pcm;rate=24000"},
                                 {"data", providers::RealtimeAdapter::encodeBase64(bytes.data(), bytes.size())}}}};
    return json{{"serverContent", {{"modelTurn", {{"parts", json::array({part})}}}}}}.dump();
}

std::string instruction(const std::string& msg) {
    return json{{"type", "instruction"}, {"msg", msg}}.dump();
}

} // namespace

class BridgeSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("", Logger::Level::Critical, false);
        Logger::resetCounters();

        directory_ = std::make_shared<InMemoryUserDirectory>();
        assets_ = std::make_shared<InMemoryAssetStore>();
        channel_ = std::make_shared<FakeDeviceChannel>("esp-test");

        // 10 ms device frames so playback pacing stays short
        settings_.pipeline.outputSampleRate = 24000;
        settings_.pipeline.frameBytes = 480;
        settings_.playback.pacingMargin = std::chrono::milliseconds(5);
        settings_.usage.tickInterval = std::chrono::hours(1);
    }

    void TearDown() override {
        if (session_) {
            session_->close("test finished");
        }
        // A connect thread may still hold the last reference
        std::weak_ptr<BridgeSession> released = session_;
        session_.reset();
        EXPECT_TRUE(waitUntil([&released]() { return released.expired(); }));
        orchestrator_.reset();
        upstream_.reset();
        Logger::shutdown();
    }

    void start(const session::UserRecord& user, FakeUpstream::Options options = readyOptions()) {
        upstream_ = std::make_unique<FakeUpstream>(std::move(options));

        SessionDependencies deps;
        deps.registry = std::make_shared<network::ConnectionRegistry>();
        deps.directory = directory_;
        deps.assets = assets_;
        deps.encoderFactory = fakeEncoderFactory();
        deps.clock = clock_.asFunction();

        auto providerFactory = std::make_shared<providers::ProviderFactory>(upstream_->factory());
        orchestrator_ = std::make_unique<SessionOrchestrator>(providerFactory, deps, settings_);
        session_ = orchestrator_->openSession(user, channel_);
        ASSERT_NE(session_, nullptr);
    }

    void startReady(const session::UserRecord& user) {
        start(user);
        ASSERT_TRUE(waitUntil([this]() { return channel_->hasServerSignal("SESSION.CREATED"); }));
    }

    static FakeUpstream::Options readyOptions() {
        FakeUpstream::Options options;
        options.repliesOnOpen = {kSessionUpdated};
        return options;
    }

    std::vector<json> messagesOfType(const std::string& type) const {
        std::vector<json> result;
        for (const auto& message : channel_->messages()) {
            if (message.value("type", "") == type) {
                result.push_back(message);
            }
        }
        return result;
    }

    size_t signalCount(const std::string& signal) const {
        size_t count = 0;
        for (const auto& current : channel_->serverSignals()) {
            count += current == signal ? 1 : 0;
        }
        return count;
    }

    bool hasPlaybackStatus(const std::string& status) const {
        for (const auto& message : messagesOfType("bhajan_status")) {
            if (message["status"] == status) {
                return true;
            }
        }
        return false;
    }

    ManualClock clock_;
    SessionSettings settings_;
    std::shared_ptr<InMemoryUserDirectory> directory_;
    std::shared_ptr<InMemoryAssetStore> assets_;
    std::shared_ptr<FakeDeviceChannel> channel_;
    std::unique_ptr<FakeUpstream> upstream_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
    std::shared_ptr<BridgeSession> session_;
};

TEST_F(BridgeSessionTest, AuthIsFirstThenSessionCreated) {
    auto user = makeUser("u1", "openai");
    user.pitchFactor = 1.25;
    startReady(user);

    auto messages = channel_->messages();
    ASSERT_GE(messages.size(), 2u);
    EXPECT_EQ(messages[0]["type"], "auth");
    EXPECT_EQ(messages[0]["volume_control"], 42);
    EXPECT_DOUBLE_EQ(messages[0]["pitch_factor"].get<double>(), 1.25);
    EXPECT_EQ(messages[1]["type"], "server");
    EXPECT_EQ(messages[1]["msg"], "SESSION.CREATED");
    EXPECT_EQ(session_->state(), SessionState::Bridging);
}

TEST_F(BridgeSessionTest, FramesBufferedBeforeReadyAreForwardedInOrder) {
    FakeUpstream::Options options;
    options.autoOpen = false;
    start(makeUser("u1", "openai"), options);
    ASSERT_TRUE(waitUntil([this]() { return upstream_->openCount() == 1; }));

    // 20 ms of 16 kHz audio per frame, each frame a distinct constant level
    for (int16_t level = 1; level <= 5; ++level) {
        session_->onDeviceBinary(pcmBytes(std::vector<int16_t>(320, static_cast<int16_t>(level * 100))));
    }
    EXPECT_TRUE(upstream_->sentOfType("input_audio_buffer.append").empty());
    EXPECT_EQ(session_->state(), SessionState::AwaitingProvider);

    upstream_->deliver(std::string(kSessionUpdated));
    ASSERT_TRUE(waitUntil([this]() { return session_->framesForwarded() == 5; }));

    session_->onDeviceBinary(pcmBytes(std::vector<int16_t>(320, 600)));
    ASSERT_TRUE(waitUntil([this]() { return session_->framesForwarded() == 6; }));

    auto appends = upstream_->sentOfType("input_audio_buffer.append");
    ASSERT_EQ(appends.size(), 6u);
    for (size_t i = 0; i < appends.size(); ++i) {
        auto bytes = providers::RealtimeAdapter::decodeBase64(appends[i]["audio"].get<std::string>());
        auto samples = core::audio::bytesToSamples(bytes.data(), bytes.size());
        // Resampled 16 kHz -> 24 kHz
        ASSERT_EQ(samples.size(), 480u);
        EXPECT_EQ(samples.front(), static_cast<int16_t>((i + 1) * 100)) << "frame " << i;
    }

    // The initial turn goes out before buffered audio
    auto sent = upstream_->sentJson();
    size_t responseCreate = 0;
    size_t firstAppend = 0;
    for (size_t i = 0; i < sent.size(); ++i) {
        if (sent[i]["type"] == "response.create") {
            responseCreate = i;
        }
        if (sent[i]["type"] == "input_audio_buffer.append" && firstAppend == 0) {
            firstAppend = i;
        }
    }
    EXPECT_LT(responseCreate, firstAppend);
}

TEST_F(BridgeSessionTest, AssistantTurnStreamsFramedAudio) {
    startReady(makeUser("u1", "openai"));

    upstream_->deliver(std::string(R"({"type":"response.created"})"));
    upstream_->deliver(audioDelta(480, 1000));
    upstream_->deliver(audioDelta(300, 2000));
    upstream_->deliver(json{{"type", "response.output_audio_transcript.done"}, {"transcript", "Radhe Radhe"}});
    upstream_->deliver(std::string(R"({"type":"response.done"})"));

    // 780 samples: three full 240-sample frames, then the padded remainder on completion
    ASSERT_EQ(channel_->binaryCount(), 4u);
    for (const auto& frame : channel_->binaries()) {
        EXPECT_EQ(frame.size(), 480u);
    }
    auto last = channel_->binaries().back();
    auto tail = core::audio::bytesToSamples(last.data(), last.size());
    EXPECT_EQ(tail[59], 2000);
    EXPECT_EQ(tail[60], 0);

    auto signals = channel_->serverSignals();
    ASSERT_EQ(signals.size(), 3u);
    EXPECT_EQ(signals[1], "RESPONSE.CREATED");
    EXPECT_EQ(signals[2], "RESPONSE.COMPLETE");

    auto servers = messagesOfType("server");
    EXPECT_EQ(servers[1]["volume_control"], 42);
    EXPECT_EQ(servers[2]["volume_control"], 42);

    auto conversations = directory_->conversations();
    ASSERT_EQ(conversations.size(), 1u);
    EXPECT_EQ(conversations[0].role, "assistant");
    EXPECT_EQ(conversations[0].text, "Radhe Radhe");
}

TEST_F(BridgeSessionTest, InterruptCancelsTurnAndDropsPartialFrame) {
    startReady(makeUser("u1", "openai"));

    upstream_->deliver(std::string(R"({"type":"response.created"})"));
    upstream_->deliver(audioDelta(100, 500));
    EXPECT_EQ(channel_->binaryCount(), 0u);

    session_->onDeviceText(instruction("INTERRUPT"));

    EXPECT_EQ(upstream_->sentOfType("response.cancel").size(), 1u);
    EXPECT_TRUE(channel_->hasServerSignal("RESPONSE.COMPLETE"));
    EXPECT_EQ(channel_->binaryCount(), 0u);

    upstream_->deliver(std::string(R"({"type":"response.done"})"));
    size_t completes = 0;
    for (const auto& signal : channel_->serverSignals()) {
        completes += signal == "RESPONSE.COMPLETE" ? 1 : 0;
    }
    EXPECT_EQ(completes, 1u);
}

TEST_F(BridgeSessionTest, LateAudioFromInterruptedTurnIsDiscarded) {
    startReady(makeUser("u1", "openai"));

    upstream_->deliver(std::string(R"({"type":"response.created"})"));
    upstream_->deliver(audioDelta(100, 500));
    session_->onDeviceText(instruction("INTERRUPT"));

    // The cancelled response keeps streaming until the upstream acknowledges it
    upstream_->deliver(audioDelta(600, 700));
    upstream_->deliver(std::string(R"({"type":"response.done","response":{"status":"cancelled"}})"));

    EXPECT_EQ(signalCount("RESPONSE.CREATED"), 1u);
    EXPECT_EQ(signalCount("RESPONSE.COMPLETE"), 1u);
    EXPECT_EQ(channel_->binaryCount(), 0u);

    // The next response streams normally
    upstream_->deliver(std::string(R"({"type":"response.created"})"));
    upstream_->deliver(audioDelta(480, 300));
    EXPECT_EQ(signalCount("RESPONSE.CREATED"), 2u);
    EXPECT_EQ(channel_->binaryCount(), 2u);
}

TEST_F(BridgeSessionTest, GeminiInterruptDiscardsRestOfTurn) {
    FakeUpstream::Options options;
    options.repliesOnOpen = {R"({"setupComplete":{}})"};
    start(makeUser("u1", "gemini"), options);
    ASSERT_TRUE(waitUntil([this]() { return channel_->hasServerSignal("SESSION.CREATED"); }));

    upstream_->deliver(geminiAudio(100, 500));
    EXPECT_EQ(signalCount("RESPONSE.CREATED"), 1u);
    session_->onDeviceText(instruction("INTERRUPT"));
    EXPECT_EQ(signalCount("RESPONSE.COMPLETE"), 1u);

    upstream_->deliver(geminiAudio(600, 700));
    upstream_->deliver(std::string(R"({"serverContent":{"turnComplete":true}})"));

    EXPECT_EQ(signalCount("RESPONSE.CREATED"), 1u);
    EXPECT_EQ(signalCount("RESPONSE.COMPLETE"), 1u);
    EXPECT_EQ(channel_->binaryCount(), 0u);

    upstream_->deliver(geminiAudio(480, 300));
    EXPECT_EQ(signalCount("RESPONSE.CREATED"), 2u);
    EXPECT_EQ(channel_->binaryCount(), 2u);
}

TEST_F(BridgeSessionTest, EndSessionClosesEverything) {
    startReady(makeUser("u1", "openai"));
    clock_.advance(std::chrono::seconds(42));

    session_->onDeviceText(instruction("END_SESSION"));

    EXPECT_EQ(channel_->serverSignals().back(), "SESSION.END");
    EXPECT_EQ(session_->state(), SessionState::Closed);
    EXPECT_EQ(channel_->closeCode(), std::optional<uint16_t>(network::close_code::NORMAL));
    EXPECT_TRUE(upstream_->isClosed());
    EXPECT_EQ(directory_->persistedUsage("u1"), std::vector<uint64_t>({42}));

    // Nothing reaches the device after close
    size_t textCount = channel_->texts().size();
    session_->onDeviceText(instruction("INTERRUPT"));
    session_->onDeviceBinary(pcmBytes({1, 2, 3}));
    EXPECT_EQ(channel_->texts().size(), textCount);
    EXPECT_EQ(session_->framesForwarded(), 0u);
}

TEST_F(BridgeSessionTest, ExhaustedQuotaRefusesSession) {
    auto user = makeUser("u1", "openai");
    user.cumulativeUsageSeconds = 600;
    start(user);

    auto errors = messagesOfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["code"], "QUOTA_EXCEEDED");
    EXPECT_EQ(channel_->messages().front()["type"], "auth");
    EXPECT_EQ(session_->state(), SessionState::Closed);
    EXPECT_EQ(upstream_->openCount(), 0);
}

TEST_F(BridgeSessionTest, QuotaReachedMidSessionEndsIt) {
    settings_.usage.tickInterval = std::chrono::milliseconds(10);
    auto user = makeUser("u1", "openai");
    user.cumulativeUsageSeconds = 590;
    startReady(user);

    clock_.advance(std::chrono::seconds(10));
    ASSERT_TRUE(waitUntil([this]() { return session_->state() == SessionState::Closed; }));

    auto errors = messagesOfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["code"], "QUOTA_EXCEEDED");
    EXPECT_TRUE(channel_->hasServerSignal("SESSION.END"));
    EXPECT_GE(directory_->persistedUsage("u1").back(), 600u);
}

TEST_F(BridgeSessionTest, PremiumUserGetsLargerQuota) {
    auto user = makeUser("u1", "openai");
    user.isPremium = true;
    user.cumulativeUsageSeconds = 600;
    startReady(user);
    EXPECT_EQ(session_->usageRecord().quotaSeconds, 36000u);
    EXPECT_TRUE(messagesOfType("error").empty());
}

TEST_F(BridgeSessionTest, ProviderCloseEndsSession) {
    startReady(makeUser("u1", "openai"));

    upstream_->remoteClose(1000, "idle");

    EXPECT_TRUE(channel_->hasServerSignal("SESSION.END"));
    EXPECT_EQ(session_->state(), SessionState::Closed);
    EXPECT_FALSE(channel_->isOpen());
}

TEST_F(BridgeSessionTest, UpstreamErrorIsReportedWithoutClosing) {
    startReady(makeUser("u1", "openai"));

    upstream_->deliver(json{{"type", "error"}, {"error", {{"message", "invalid audio"}}}});

    auto errors = messagesOfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["code"], "UPSTREAM_UNAVAILABLE");
    EXPECT_EQ(errors[0]["message"], "invalid audio");
    EXPECT_TRUE(channel_->hasServerSignal("RESPONSE.ERROR"));
    EXPECT_EQ(session_->state(), SessionState::Bridging);
}

TEST_F(BridgeSessionTest, ProviderConnectFailureClosesDevice) {
    FakeUpstream::Options options;
    options.failOnOpen = true;
    options.failReason = "HTTP 403";
    start(makeUser("u1", "openai"), options);

    ASSERT_TRUE(waitUntil([this]() { return session_->state() == SessionState::Closed; }));
    auto errors = messagesOfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["code"], "UPSTREAM_UNAVAILABLE");
    EXPECT_EQ(channel_->closeCode(), std::optional<uint16_t>(network::close_code::INTERNAL_ERROR));
    EXPECT_FALSE(channel_->hasServerSignal("SESSION.CREATED"));
}

TEST_F(BridgeSessionTest, PlayActionStreamsAsset) {
    std::vector<int16_t> samples(960, 3000);
    assets_->add("7", AudioFrame(pcmBytes(samples), {AudioEncoding::PCM16, 24000, 1}));
    startReady(makeUser("u1", "openai"));

    session_->onDeviceText(R"({"type":"action","action":"play","bhajan_id":7})");

    ASSERT_TRUE(waitUntil([this]() { return hasPlaybackStatus("completed"); }));
    EXPECT_TRUE(hasPlaybackStatus("playing"));
    EXPECT_EQ(channel_->binaryCount(), 4u);

    auto statuses = messagesOfType("bhajan_status");
    EXPECT_EQ(statuses.front()["bhajan_id"], "7");

    bool recorded = false;
    for (const auto& entry : directory_->playbackEntries()) {
        recorded = recorded || (entry.status == "completed" && entry.assetId == std::optional<std::string>("7"));
    }
    EXPECT_TRUE(recorded);
}

TEST_F(BridgeSessionTest, UnknownAssetReportsError) {
    startReady(makeUser("u1", "openai"));

    session_->onDeviceText(R"({"type":"action","action":"play","bhajan_id":"missing"})");

    ASSERT_TRUE(hasPlaybackStatus("error"));
    EXPECT_EQ(channel_->binaryCount(), 0u);
}

TEST_F(BridgeSessionTest, DevicePlaybackReportIsRecorded) {
    startReady(makeUser("u1", "openai"));

    session_->onDeviceText(R"({"type":"bhajan_status","status":"paused","bhajan_id":"3","position":12.5})");
    session_->onDeviceText("{broken");

    auto entries = directory_->playbackEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].status, "paused");
    EXPECT_EQ(session_->state(), SessionState::Bridging);
}
