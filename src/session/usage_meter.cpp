#include "session/usage_meter.hpp"
#include "system/logger.hpp"

namespace vani::session {

UsageMeter::UsageMeter(UsageRecord record, const Config& config, PersistCallback persist,
                       QuotaCallback onQuotaExceeded, Clock clock)
    : record_(std::move(record)),
      config_(config),
      persist_(std::move(persist)),
      onQuotaExceeded_(std::move(onQuotaExceeded)),
      clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::steady_clock::now(); })) {
    lastElapsed_.store(record_.cumulativeSeconds);
}

UsageMeter::~UsageMeter() {
    stop();
}

uint64_t UsageMeter::quotaFor(bool premium, const Config& config) {
    return premium ? config.premiumQuotaSeconds : config.freeQuotaSeconds;
}

void UsageMeter::start() {
    if (started_.exchange(true)) {
        return;
    }
    startTime_ = clock_();
    running_.store(true);
    Logger::info("UsageMeter: {} starts at {}s of {}s", record_.userId, record_.cumulativeSeconds,
                 record_.quotaSeconds);
    thread_ = std::thread(&UsageMeter::tickLoop, this);
}

uint64_t UsageMeter::elapsedSeconds() const {
    if (!started_.load()) {
        return record_.cumulativeSeconds;
    }

    auto connected = std::chrono::duration_cast<std::chrono::seconds>(clock_() - startTime_).count();
    uint64_t value = record_.cumulativeSeconds + static_cast<uint64_t>(connected > 0 ? connected : 0);

    uint64_t previous = lastElapsed_.load();
    while (value > previous && !lastElapsed_.compare_exchange_weak(previous, value)) {
    }
    return value > previous ? value : previous;
}

void UsageMeter::persistLocked(uint64_t seconds) {
    ++persistCount_;
    if (persist_) {
        persist_(record_.userId, seconds);
    }
}

void UsageMeter::tickLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        cv_.wait_for(lock, config_.tickInterval, [this]() { return stopped_; });
        if (stopped_) {
            break;
        }

        uint64_t elapsed = elapsedSeconds();
        persistLocked(elapsed);
        Logger::debug("UsageMeter: {} at {}s", record_.userId, elapsed);

        if (elapsed >= record_.quotaSeconds) {
            Logger::warning("UsageMeter: {} reached quota ({}s >= {}s)", record_.userId, elapsed,
                            record_.quotaSeconds);
            running_.store(false);
            QuotaCallback callback = onQuotaExceeded_;
            lock.unlock();
            if (callback) {
                callback(elapsed);
            }
            return;
        }
    }
    running_.store(false);
}

void UsageMeter::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopped_) {
            stopped_ = true;
            if (started_.load()) {
                uint64_t elapsed = elapsedSeconds();
                persistLocked(elapsed);
                Logger::info("UsageMeter: {} final usage {}s", record_.userId, elapsed);
            }
        }
        worker = std::move(thread_);
    }
    cv_.notify_all();

    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    running_.store(false);
}

} // namespace vani::session
