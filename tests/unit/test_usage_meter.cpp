#include <gtest/gtest.h>
#include "session/usage_meter.hpp"
#include "support/test_fakes.hpp"
#include "system/logger.hpp"

#include <atomic>
#include <mutex>

using namespace vani;
using namespace vani::session;
using vani::testing::ManualClock;
using vani::testing::waitUntil;

class UsageMeterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("", Logger::Level::Critical, false);
        config_.tickInterval = std::chrono::milliseconds(10);
    }

    void TearDown() override {
        Logger::shutdown();
    }

    UsageRecord record(uint64_t cumulative, bool premium = false) {
        UsageRecord r;
        r.userId = "user-1";
        r.cumulativeSeconds = cumulative;
        r.premium = premium;
        r.quotaSeconds = UsageMeter::quotaFor(premium, config_);
        return r;
    }

    void persist(const std::string&, uint64_t seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        persisted_.push_back(seconds);
    }

    std::vector<uint64_t> persisted() {
        std::lock_guard<std::mutex> lock(mutex_);
        return persisted_;
    }

    UsageMeter::Config config_;
    ManualClock clock_;
    std::mutex mutex_;
    std::vector<uint64_t> persisted_;
};

TEST_F(UsageMeterTest, QuotaDependsOnPremium) {
    UsageMeter::Config defaults;
    EXPECT_EQ(UsageMeter::quotaFor(false, defaults), 600u);
    EXPECT_EQ(UsageMeter::quotaFor(true, defaults), 36000u);
    EXPECT_EQ(defaults.tickInterval, std::chrono::milliseconds(30000));

    EXPECT_TRUE(UsageMeter::isOverQuota(record(600)));
    EXPECT_FALSE(UsageMeter::isOverQuota(record(599)));
}

TEST_F(UsageMeterTest, ElapsedAddsConnectedTimeToPriorUsage) {
    UsageMeter meter(record(100), config_, nullptr, nullptr, clock_.asFunction());
    EXPECT_EQ(meter.elapsedSeconds(), 100u);

    meter.start();
    clock_.advance(std::chrono::milliseconds(2500));
    EXPECT_EQ(meter.elapsedSeconds(), 102u);
    clock_.advance(std::chrono::milliseconds(1000));
    EXPECT_EQ(meter.elapsedSeconds(), 103u);
    meter.stop();
}

TEST_F(UsageMeterTest, FiresQuotaOnceWhenLimitReached) {
    std::atomic<int> quotaCalls{0};
    std::atomic<uint64_t> quotaElapsed{0};

    UsageMeter meter(
        record(590), config_,
        [this](const std::string& id, uint64_t seconds) { persist(id, seconds); },
        [&](uint64_t elapsed) {
            ++quotaCalls;
            quotaElapsed.store(elapsed);
        },
        clock_.asFunction());

    meter.start();
    ASSERT_TRUE(waitUntil([&]() { return !persisted().empty(); }));
    EXPECT_EQ(quotaCalls.load(), 0);

    clock_.advance(std::chrono::seconds(10));
    ASSERT_TRUE(waitUntil([&]() { return quotaCalls.load() == 1; }));
    EXPECT_EQ(quotaElapsed.load(), 600u);

    // Ticking ends after the quota fires
    clock_.advance(std::chrono::seconds(10));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(quotaCalls.load(), 1);
    EXPECT_FALSE(meter.isRunning());

    meter.stop();
    EXPECT_EQ(persisted().back(), 610u);
}

TEST_F(UsageMeterTest, StopPersistsOnceAndNeverAgain) {
    config_.tickInterval = std::chrono::hours(1);
    UsageMeter meter(record(42), config_,
                     [this](const std::string& id, uint64_t seconds) { persist(id, seconds); },
                     nullptr, clock_.asFunction());

    meter.start();
    clock_.advance(std::chrono::seconds(8));
    meter.stop();
    meter.stop();

    EXPECT_EQ(persisted(), std::vector<uint64_t>({50}));
    EXPECT_EQ(meter.persistCount(), 1u);
}

TEST_F(UsageMeterTest, StopWithoutStartPersistsNothing) {
    UsageMeter meter(record(10), config_,
                     [this](const std::string& id, uint64_t seconds) { persist(id, seconds); },
                     nullptr, clock_.asFunction());
    meter.stop();
    EXPECT_TRUE(persisted().empty());
}

TEST_F(UsageMeterTest, StopFromQuotaCallbackDoesNotDeadlock) {
    std::atomic<bool> fired{false};
    std::unique_ptr<UsageMeter> meter;
    meter = std::make_unique<UsageMeter>(
        record(600), config_,
        [this](const std::string& id, uint64_t seconds) { persist(id, seconds); },
        [&](uint64_t) {
            meter->stop();
            fired.store(true);
        },
        clock_.asFunction());

    meter->start();
    ASSERT_TRUE(waitUntil([&]() { return fired.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    meter.reset();
    EXPECT_GE(persisted().size(), 2u);
}
