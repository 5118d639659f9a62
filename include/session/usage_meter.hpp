#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace vani::session {

struct UsageRecord {
    std::string userId;
    uint64_t cumulativeSeconds = 0;
    uint64_t quotaSeconds = 0;
    bool premium = false;
};

/**
 * @brief Connected-time accounting for one session
 *
 * elapsed = prior cumulative + seconds since start(). Persisted on every tick
 * and once more on stop(); nothing is persisted after stop() returns. When a
 * tick observes elapsed >= quota the quota callback fires once and ticking
 * ends.
 */
class UsageMeter {
public:
    struct Config {
        std::chrono::milliseconds tickInterval{30000};
        uint64_t freeQuotaSeconds = 600;
        uint64_t premiumQuotaSeconds = 36000;
    };

    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using PersistCallback = std::function<void(const std::string& userId, uint64_t seconds)>;
    using QuotaCallback = std::function<void(uint64_t elapsedSeconds)>;

    UsageMeter(UsageRecord record, const Config& config, PersistCallback persist,
               QuotaCallback onQuotaExceeded, Clock clock = {});
    ~UsageMeter();

    UsageMeter(const UsageMeter&) = delete;
    UsageMeter& operator=(const UsageMeter&) = delete;

    static uint64_t quotaFor(bool premium, const Config& config);
    static bool isOverQuota(const UsageRecord& record) { return record.cumulativeSeconds >= record.quotaSeconds; }

    void start();

    /// Final persist (once) and stop ticking. Safe to call from the quota callback.
    void stop();

    uint64_t elapsedSeconds() const;
    const UsageRecord& record() const { return record_; }
    bool isRunning() const { return running_.load(); }
    uint64_t persistCount() const { return persistCount_.load(); }

private:
    void tickLoop();
    void persistLocked(uint64_t seconds);

    UsageRecord record_;
    Config config_;
    PersistCallback persist_;
    QuotaCallback onQuotaExceeded_;
    Clock clock_;

    std::chrono::steady_clock::time_point startTime_;
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> persistCount_{0};
    mutable std::atomic<uint64_t> lastElapsed_{0};

    // Guards persistence and the stopped flag
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::thread thread_;
};

} // namespace vani::session
