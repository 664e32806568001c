#include <metricstream/core/retention/retention_sweeper.hpp>
#include <metricstream/core/errors.hpp>
#include <metricstream/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <numeric>

namespace MetricStream {

RetentionSweeper::RetentionSweeper(RetentionPolicy policy, MetricStore& store)
    : store_(store), policy_(policy) {
    RetentionUtils::validatePolicy(policy_);
    store_.setRetentionPolicy(policy_);
}

RetentionSweeper::~RetentionSweeper() noexcept {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("[DESTRUCTOR] RetentionSweeper failed to stop cleanly: {}", e.what());
    }
}

void RetentionSweeper::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (loop_) {
        spdlog::warn("[RetentionSweeper] Already running");
        return;
    }
    startLoopLocked();
    running_.store(true, std::memory_order_release);

    RetentionPolicy p = policy();
    spdlog::info("RetentionSweeper started (max age: {}ms, max count: {}, interval: {}ms)",
                 p.maxAge.count(), p.maxCount, p.cleanupInterval.count());
}

void RetentionSweeper::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!loop_) {
        return;
    }
    stopLoopLocked();
    running_.store(false, std::memory_order_release);

    try {
        size_t removed = runOnce();
        spdlog::info("RetentionSweeper stopped (final cleanup removed {} metrics)", removed);
    } catch (const RetentionError& e) {
        spdlog::error("RetentionSweeper stopped, final cleanup failed: {}", e.what());
    }
}

size_t RetentionSweeper::runOnce() {
    RetentionPolicy current = policy();

    uint64_t start = Clock::now_us();
    size_t removed = 0;
    try {
        removed = store_.cleanup(current);
    } catch (const std::exception&) {
        throw RetentionError("runCleanup", "Retention cleanup failed", std::current_exception());
    }
    double elapsedMs = (Clock::now_us() - start) / 1000.0;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_.totalRuns++;
        stats_.totalRemoved += removed;
        stats_.lastRemoved = removed;
        stats_.lastRunTime = Clock::wall_now();
        stats_.lastDurationMs = elapsedMs;

        recent_durations_.push_back(elapsedMs);
        if (recent_durations_.size() > DURATION_WINDOW) {
            recent_durations_.pop_front();
        }
        stats_.averageDurationMs = std::accumulate(recent_durations_.begin(), recent_durations_.end(), 0.0) /
                                   static_cast<double>(recent_durations_.size());
    }

    if (removed > 0) {
        spdlog::info("[RetentionSweeper] Removed {} metrics in {:.2f}ms", removed, elapsedMs);
    } else {
        spdlog::debug("[RetentionSweeper] Nothing to remove ({:.2f}ms)", elapsedMs);
    }
    return removed;
}

void RetentionSweeper::scheduledRun() {
    if (paused_.load(std::memory_order_acquire)) {
        spdlog::debug("[RetentionSweeper] Paused, skipping scheduled cleanup");
        return;
    }
    runOnce();
}

void RetentionSweeper::updatePolicy(const RetentionPolicy& policy) {
    RetentionUtils::validatePolicy(policy);

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        policy_ = policy;
    }
    store_.setRetentionPolicy(policy);

    if (loop_) {
        stopLoopLocked();
        startLoopLocked();
    }
    spdlog::info("[RetentionSweeper] Policy updated (max age: {}ms, max count: {}, interval: {}ms)",
                 policy.maxAge.count(), policy.maxCount, policy.cleanupInterval.count());
}

void RetentionSweeper::pause() {
    paused_.store(true, std::memory_order_release);
    spdlog::info("[RetentionSweeper] Paused");
}

void RetentionSweeper::resume() {
    paused_.store(false, std::memory_order_release);
    spdlog::info("[RetentionSweeper] Resumed");
}

RetentionStats RetentionSweeper::getStats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    RetentionStats snapshot = stats_;
    snapshot.isRunning = isRunning();
    snapshot.isPaused = paused_.load(std::memory_order_acquire);
    return snapshot;
}

RetentionPolicy RetentionSweeper::policy() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return policy_;
}

bool RetentionSweeper::isRunning() const {
    return running_.load(std::memory_order_acquire);
}

void RetentionSweeper::startLoopLocked() {
    loop_ = std::make_unique<PeriodicTask>("retention", policy().cleanupInterval,
                                           [this]() { scheduledRun(); },
                                           /*runImmediately=*/true);
    loop_->start();
}

void RetentionSweeper::stopLoopLocked() {
    loop_->stop();
    loop_.reset();
}

namespace RetentionUtils {

RetentionPolicy defaultPolicy() {
    return RetentionPolicy{};
}

RetentionPolicy highThroughputPolicy() {
    RetentionPolicy policy;
    policy.maxAge = std::chrono::hours(6);
    policy.maxCount = 50000;
    policy.cleanupInterval = std::chrono::minutes(15);
    return policy;
}

RetentionPolicy lowResourcePolicy() {
    RetentionPolicy policy;
    policy.maxAge = std::chrono::hours(12);
    policy.maxCount = 5000;
    policy.cleanupInterval = std::chrono::hours(1);
    return policy;
}

void validatePolicy(const RetentionPolicy& policy) {
    if (policy.maxAge.count() <= 0) {
        throw RetentionError("validatePolicy", "maxAge must be positive");
    }
    if (policy.maxCount == 0) {
        throw RetentionError("validatePolicy", "maxCount must be positive");
    }
    if (policy.cleanupInterval.count() <= 0) {
        throw RetentionError("validatePolicy", "cleanupInterval must be positive");
    }

    if (policy.cleanupInterval < std::chrono::minutes(1)) {
        spdlog::warn("Cleanup interval is very frequent (< 1 minute), this may impact performance");
    }
    if (policy.maxAge < std::chrono::minutes(5)) {
        spdlog::warn("Max age is very short (< 5 minutes), metrics may be removed before they are read");
    }
}

double estimateCleanupTime(size_t metricCount, const RetentionPolicy& policy, double avgCleanupDurationMs) {
    if (metricCount == 0 || metricCount <= policy.maxCount) {
        return 0.0;
    }
    double ratio = static_cast<double>(metricCount - policy.maxCount) / static_cast<double>(metricCount);
    return avgCleanupDurationMs * ratio;
}

} // namespace RetentionUtils

} // namespace MetricStream
