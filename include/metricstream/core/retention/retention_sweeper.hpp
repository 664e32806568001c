#pragma once

#include <metricstream/core/config/app_config.hpp>
#include <metricstream/core/storage/metric_store.hpp>
#include <metricstream/core/utils/periodic_task.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace MetricStream {

struct RetentionStats {
    uint64_t totalRuns = 0;
    uint64_t totalRemoved = 0;
    std::optional<Timestamp> lastRunTime;
    double lastDurationMs = 0.0;
    double averageDurationMs = 0.0;
    size_t lastRemoved = 0;
    bool isRunning = false;
    bool isPaused = false;
};

/**
 * @brief Applies a RetentionPolicy to a MetricStore on a fixed schedule.
 *
 * The loop runs a cleanup as soon as it starts and then every
 * cleanupInterval. A failed run is logged and the schedule continues.
 */
class RetentionSweeper {
public:
    static constexpr size_t DURATION_WINDOW = 100;

    /**
     * @throws RetentionError if the policy is invalid
     */
    RetentionSweeper(RetentionPolicy policy, MetricStore& store);
    ~RetentionSweeper() noexcept;

    RetentionSweeper(const RetentionSweeper&) = delete;
    RetentionSweeper& operator=(const RetentionSweeper&) = delete;

    void start();

    // Cancels the loop, then runs one last cleanup
    void stop();

    /**
     * @brief Run a single cleanup now, paused or not
     * @return Number of metrics removed
     * @throws RetentionError wrapping the storage failure
     */
    size_t runOnce();

    void updatePolicy(const RetentionPolicy& policy);

    // Scheduled runs are skipped while paused
    void pause();
    void resume();

    RetentionStats getStats() const;
    RetentionPolicy policy() const;
    bool isRunning() const;

private:
    void scheduledRun();
    void startLoopLocked();
    void stopLoopLocked();

    MetricStore& store_;

    mutable std::mutex state_mutex_;
    RetentionPolicy policy_;
    RetentionStats stats_;
    std::deque<double> recent_durations_;

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};

    std::mutex lifecycle_mutex_;
    std::unique_ptr<PeriodicTask> loop_;
};

namespace RetentionUtils {

RetentionPolicy defaultPolicy();

// 6h / 50000 / 15m
RetentionPolicy highThroughputPolicy();

// 12h / 5000 / 1h
RetentionPolicy lowResourcePolicy();

/**
 * @throws RetentionError on a non-positive value; warns on aggressive settings
 */
void validatePolicy(const RetentionPolicy& policy);

// Scales the observed average run time by the share of metrics above maxCount
double estimateCleanupTime(size_t metricCount, const RetentionPolicy& policy, double avgCleanupDurationMs);

} // namespace RetentionUtils

} // namespace MetricStream
