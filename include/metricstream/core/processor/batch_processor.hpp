#pragma once

#include <metricstream/core/config/app_config.hpp>
#include <metricstream/core/metrics/metric.hpp>
#include <metricstream/core/queues/mpsc_queue.hpp>
#include <metricstream/core/storage/metric_store.hpp>
#include <metricstream/core/utils/periodic_task.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <vector>

namespace MetricStream {

struct BatchItem {
    Metric metric;
    uint64_t addedAtMs = 0;     // monotonic, for maxWaitTime
    std::string correlationId;
    uint32_t deliveryAttempts = 0;
};

struct BatchStats {
    uint64_t totalBatches = 0;
    uint64_t totalMetrics = 0;
    uint64_t successfulBatches = 0;
    uint64_t failedBatches = 0;
    uint64_t partiallyFailedBatches = 0;
    uint64_t retriedBatches = 0;
    double averageBatchSize = 0.0;
    double averageProcessingTimeMs = 0.0;
    std::optional<Timestamp> lastFlushTime;
    size_t pendingMetrics = 0;
    bool isRunning = false;
    double failureRate = 0.0;
    double retrySuccessRate = 1.0;
};

enum class HealthLevel : uint8_t {
    HEALTHY = 0,
    DEGRADED = 1,
    UNHEALTHY = 2
};

const char* toString(HealthLevel level);

struct BatchHealthStatus {
    HealthLevel status = HealthLevel::HEALTHY;
    bool isRunning = false;
    size_t queueSize = 0;
    double failureRate = 0.0;
    double averageLatencyMs = 0.0;
    std::optional<int64_t> lastFlushAgeMs;
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
};

// Fields left empty keep their current value
struct BatchConfigurationUpdate {
    std::optional<size_t> maxBatchSize;
    std::optional<Millis> flushInterval;
    std::optional<Millis> maxWaitTime;
    std::optional<bool> enableAutoFlush;
    std::optional<bool> enableBatching;
    std::optional<bool> enablePartialFailureRecovery;
    std::optional<BatchRetryConfig> retryConfig;
};

/**
 * @brief Accumulates metrics and writes them to a MetricStore in batches.
 *
 * add() may be called from any thread. Flushes are serialized: a size-triggered
 * flush and a scheduled flush never drain the same items. A failed flush puts
 * its items back in the queue (at-least-once delivery).
 */
class BatchProcessor {
public:
    BatchProcessor(BatchConfiguration config, MetricStore& store);
    ~BatchProcessor() noexcept;

    BatchProcessor(const BatchProcessor&) = delete;
    BatchProcessor& operator=(const BatchProcessor&) = delete;

    /**
     * @throws BatchError when the processor is not running or a metric is malformed
     */
    void add(const Metric& metric);
    void addMany(const std::vector<Metric>& metrics);

    /**
     * @brief Drain the pending queue into the store
     * @throws BatchError when the store rejects the batch; the failed items
     *         are back in the queue when it is thrown
     */
    void flush();

    // flush() retried with backoff while the failure is listed as retryable
    void flushWithRetry();

    void configure(const BatchConfiguration& config);
    void updateConfiguration(const BatchConfigurationUpdate& update);
    BatchConfiguration getConfiguration() const;

    /**
     * @brief Derive batch size and flush interval from a latency target and
     *        observed throughput, then apply them
     * @return The configuration now in effect
     */
    BatchConfiguration autoTune(Millis targetLatency, double metricsPerSecond);

    BatchStats stats() const;
    BatchHealthStatus healthStatus() const;

    void start();
    void stop();
    bool isRunning() const;
    bool hasScheduler() const;

    size_t pendingCount() const { return pending_.size(); }

private:
    struct BatchState {
        BatchConfiguration config;
        BatchStats stats;
        bool isRunning = false;
        bool hasScheduler = false;
        std::optional<uint64_t> oldestPendingMs;
        uint64_t redeliveryBatches = 0;
        uint64_t successfulRedeliveries = 0;
    };

    void validateForAdd(const std::vector<Metric>& metrics) const;
    void flushIfDue();
    void enqueue(const Metric& metric, uint64_t nowMs);
    void requeue(std::vector<BatchItem>& items);
    bool shouldFlushLocked(const BatchState& state) const;

    // Caller holds lifecycle_mutex_
    void applyConfigurationLocked(const BatchConfiguration& config);
    void startSchedulerLocked();
    void stopSchedulerLocked();

    void recordSuccess(size_t count, double elapsedMs, bool redelivery);
    std::string nextBatchId();

    MetricStore& store_;
    MpscQueue<BatchItem> pending_;

    // Serializes drains
    std::mutex flush_mutex_;

    mutable std::mutex state_mutex_;
    BatchState state_;

    // Producers hold it shared from the running check through the enqueue;
    // stop() takes it exclusively to close admission before the final drain
    std::shared_mutex admission_mutex_;

    // Guards start/stop/configure and the scheduler handle
    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<PeriodicTask> scheduler_;

    std::atomic<uint64_t> batch_counter_{0};
    std::atomic<uint64_t> correlation_counter_{0};
};

namespace BatchProcessorUtils {

BatchRetryConfig defaultRetryConfig();
BatchConfiguration defaultConfig();

/**
 * @throws BatchError (batch id "validation") on the first violated rule
 */
void validateConfig(const BatchConfiguration& config);

// ceil(throughput * latency / 1000) clamped to [10, 1000]
size_t calculateOptimalBatchSize(double metricsPerSecond, Millis targetLatency);

// batchSize / throughput clamped to [1s, 300s]; 30s when throughput <= 0
Millis calculateOptimalFlushInterval(size_t batchSize, double metricsPerSecond);

// initialDelay * multiplier^attempt, capped at maxDelay
Millis retryDelay(const BatchRetryConfig& retry, uint32_t attempt);

} // namespace BatchProcessorUtils

} // namespace MetricStream
