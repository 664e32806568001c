#include <metricstream/core/processor/batch_processor.hpp>
#include <metricstream/core/errors.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include <metricstream/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace MetricStream {

namespace {
constexpr size_t HIGH_QUEUE_SIZE = 1000;
constexpr double HIGH_FAILURE_RATE = 0.1;
constexpr int64_t STALE_FLUSH_MS = 5 * 60 * 1000;
}

const char* toString(HealthLevel level) {
    switch (level) {
        case HealthLevel::HEALTHY: return "healthy";
        case HealthLevel::DEGRADED: return "degraded";
        case HealthLevel::UNHEALTHY: return "unhealthy";
        default: return "unknown";
    }
}

BatchProcessor::BatchProcessor(BatchConfiguration config, MetricStore& store)
    : store_(store) {
    BatchProcessorUtils::validateConfig(config);
    state_.config = std::move(config);
}

BatchProcessor::~BatchProcessor() noexcept {
    try {
        if (isRunning()) {
            stop();
        }
    } catch (const std::exception& e) {
        spdlog::error("[DESTRUCTOR] BatchProcessor failed to stop cleanly: {}", e.what());
    }
}

void BatchProcessor::add(const Metric& metric) {
    validateForAdd({metric});
    {
        std::shared_lock<std::shared_mutex> admission(admission_mutex_);
        BatchConfiguration cfg;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!state_.isRunning) {
                throw BatchError("add", "", "Batch processor is not running");
            }
            cfg = state_.config;
        }

        if (!cfg.enableBatching) {
            try {
                store_.recordOne(metric);
            } catch (const std::exception&) {
                throw BatchError("add", "direct", "Failed to store metric " + metric.name,
                                 std::current_exception());
            }
            return;
        }

        enqueue(metric, Clock::now_ms());
    }
    flushIfDue();
}

void BatchProcessor::addMany(const std::vector<Metric>& metrics) {
    validateForAdd(metrics);
    {
        std::shared_lock<std::shared_mutex> admission(admission_mutex_);
        BatchConfiguration cfg;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!state_.isRunning) {
                throw BatchError("add", "", "Batch processor is not running");
            }
            cfg = state_.config;
        }
        if (metrics.empty()) return;

        if (!cfg.enableBatching) {
            try {
                store_.recordMany(metrics);
            } catch (const std::exception&) {
                throw BatchError("add", "direct", "Failed to store " + std::to_string(metrics.size()) + " metrics",
                                 std::current_exception());
            }
            return;
        }

        uint64_t now = Clock::now_ms();
        for (const auto& metric : metrics) {
            enqueue(metric, now);
        }
    }
    flushIfDue();
}

void BatchProcessor::validateForAdd(const std::vector<Metric>& metrics) const {
    for (const auto& metric : metrics) {
        try {
            MetricFactory::validate(metric);
        } catch (const std::invalid_argument& e) {
            throw BatchError("add", "", e.what());
        }
    }
}

void BatchProcessor::flushIfDue() {
    bool trigger = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        trigger = shouldFlushLocked(state_);
    }
    if (trigger) {
        try {
            flush();
        } catch (const BatchError& e) {
            spdlog::warn("[BatchProcessor] Triggered flush failed: {}", e.what());
        }
    }
}

void BatchProcessor::enqueue(const Metric& metric, uint64_t nowMs) {
    BatchItem item;
    item.metric = metric;
    item.addedAtMs = nowMs;
    item.correlationId = "corr-" + std::to_string(correlation_counter_.fetch_add(1, std::memory_order_relaxed) + 1);
    pending_.push(std::move(item));

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.oldestPendingMs) {
        state_.oldestPendingMs = nowMs;
    }
}

void BatchProcessor::requeue(std::vector<BatchItem>& items) {
    if (items.empty()) return;
    uint64_t oldest = items.front().addedAtMs;
    for (auto& item : items) {
        oldest = std::min(oldest, item.addedAtMs);
        ++item.deliveryAttempts;
        pending_.push(std::move(item));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.oldestPendingMs || *state_.oldestPendingMs > oldest) {
        state_.oldestPendingMs = oldest;
    }
}

bool BatchProcessor::shouldFlushLocked(const BatchState& state) const {
    if (pending_.size() >= state.config.maxBatchSize) {
        return true;
    }
    if (state.oldestPendingMs) {
        uint64_t waited = Clock::now_ms() - *state.oldestPendingMs;
        return waited >= static_cast<uint64_t>(state.config.maxWaitTime.count());
    }
    return false;
}

void BatchProcessor::flush() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    bool partialRecovery = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.oldestPendingMs.reset();
        partialRecovery = state_.config.enablePartialFailureRecovery;
    }

    std::vector<BatchItem> items;
    pending_.drain(items);
    if (items.empty()) {
        return;
    }

    const std::string batchId = nextBatchId();
    const bool redelivery = std::any_of(items.begin(), items.end(),
                                        [](const BatchItem& item) { return item.deliveryAttempts > 0; });

    std::vector<Metric> metrics;
    metrics.reserve(items.size());
    for (const auto& item : items) {
        metrics.push_back(item.metric);
    }

    uint64_t start = Clock::now_us();
    std::exception_ptr cause;
    try {
        store_.recordMany(metrics);
    } catch (const std::exception&) {
        cause = std::current_exception();
    }

    if (!cause) {
        double elapsedMs = (Clock::now_us() - start) / 1000.0;
        recordSuccess(items.size(), elapsedMs, redelivery);
        spdlog::debug("[BATCH FLUSH] id={} count={} ({:.2f}ms)", batchId, items.size(), elapsedMs);
        return;
    }

    // Whole-batch write failed: optionally salvage what can be stored one by one
    const size_t batchSize = items.size();
    std::vector<BatchItem> failed;
    size_t stored = 0;
    if (partialRecovery) {
        for (auto& item : items) {
            try {
                store_.recordOne(item.metric);
                ++stored;
            } catch (const std::exception& e) {
                spdlog::debug("[BatchProcessor] Item {} failed: {}", item.correlationId, e.what());
                failed.push_back(std::move(item));
            }
        }
    } else {
        failed = std::move(items);
    }

    std::vector<std::string> failedIds;
    failedIds.reserve(failed.size());
    for (const auto& item : failed) {
        failedIds.push_back(item.correlationId);
    }
    requeue(failed);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto& s = state_.stats;
        s.totalBatches++;
        if (redelivery) {
            s.retriedBatches++;
            state_.redeliveryBatches++;
        }
        if (stored > 0) {
            s.partiallyFailedBatches++;
            s.totalMetrics += stored;
            s.lastFlushTime = Clock::wall_now();
        } else {
            s.failedBatches++;
        }
        s.failureRate = static_cast<double>(s.failedBatches) / static_cast<double>(s.totalBatches);
        s.retrySuccessRate = state_.redeliveryBatches == 0
            ? 1.0
            : static_cast<double>(state_.successfulRedeliveries) / static_cast<double>(state_.redeliveryBatches);
    }

    std::string causeText;
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        causeText = e.what();
    }

    if (stored > 0) {
        spdlog::warn("[BatchProcessor] Batch {} partially failed: {} of {} metrics re-enqueued ({})",
                     batchId, failedIds.size(), batchSize, causeText);
        throw BatchError("flush", batchId,
                         std::to_string(failedIds.size()) + " of " + std::to_string(batchSize) +
                         " metrics failed and were re-enqueued",
                         cause, std::move(failedIds));
    }

    spdlog::error("[BatchProcessor] Batch {} failed, {} metrics re-enqueued ({})",
                  batchId, batchSize, causeText);
    throw BatchError("flush", batchId,
                     "Failed to store " + std::to_string(batchSize) + " metrics; re-enqueued",
                     cause, std::move(failedIds));
}

void BatchProcessor::flushWithRetry() {
    BatchRetryConfig retry = getConfiguration().retryConfig;
    for (uint32_t attempt = 0;; ++attempt) {
        try {
            flush();
            return;
        } catch (const BatchError& e) {
            const std::string kind = errorKindOf(e.cause());
            bool retryable = std::find(retry.retryableErrors.begin(), retry.retryableErrors.end(), kind)
                             != retry.retryableErrors.end();
            if (!retryable || attempt >= retry.maxRetries) {
                throw;
            }
            Millis delay = BatchProcessorUtils::retryDelay(retry, attempt);
            spdlog::warn("[BatchProcessor] Flush attempt {} failed ({}), retrying in {}ms",
                         attempt + 1, kind, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }
}

void BatchProcessor::recordSuccess(size_t count, double elapsedMs, bool redelivery) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& s = state_.stats;
    s.totalBatches++;
    s.successfulBatches++;
    s.totalMetrics += count;

    // Incremental means over successful batches
    const double n = static_cast<double>(s.successfulBatches);
    s.averageBatchSize += (static_cast<double>(count) - s.averageBatchSize) / n;
    s.averageProcessingTimeMs += (elapsedMs - s.averageProcessingTimeMs) / n;
    s.lastFlushTime = Clock::wall_now();

    if (redelivery) {
        s.retriedBatches++;
        state_.redeliveryBatches++;
        state_.successfulRedeliveries++;
    }
    s.failureRate = static_cast<double>(s.failedBatches) / static_cast<double>(s.totalBatches);
    s.retrySuccessRate = state_.redeliveryBatches == 0
        ? 1.0
        : static_cast<double>(state_.successfulRedeliveries) / static_cast<double>(state_.redeliveryBatches);
}

std::string BatchProcessor::nextBatchId() {
    return "batch-" + std::to_string(batch_counter_.fetch_add(1, std::memory_order_relaxed) + 1);
}

void BatchProcessor::configure(const BatchConfiguration& config) {
    BatchProcessorUtils::validateConfig(config);
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    applyConfigurationLocked(config);
}

void BatchProcessor::updateConfiguration(const BatchConfigurationUpdate& update) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    BatchConfiguration merged = getConfiguration();
    if (update.maxBatchSize) merged.maxBatchSize = *update.maxBatchSize;
    if (update.flushInterval) merged.flushInterval = *update.flushInterval;
    if (update.maxWaitTime) merged.maxWaitTime = *update.maxWaitTime;
    if (update.enableAutoFlush) merged.enableAutoFlush = *update.enableAutoFlush;
    if (update.enableBatching) merged.enableBatching = *update.enableBatching;
    if (update.enablePartialFailureRecovery) merged.enablePartialFailureRecovery = *update.enablePartialFailureRecovery;
    if (update.retryConfig) merged.retryConfig = *update.retryConfig;

    BatchProcessorUtils::validateConfig(merged);
    applyConfigurationLocked(merged);
}

void BatchProcessor::applyConfigurationLocked(const BatchConfiguration& config) {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.config = config;
        running = state_.isRunning;
    }

    if (running) {
        stopSchedulerLocked();
        if (config.enableAutoFlush) {
            startSchedulerLocked();
        }
    }
    spdlog::info("[BatchProcessor] Configured (batch size: {}, flush interval: {}ms, max wait: {}ms)",
                 config.maxBatchSize, config.flushInterval.count(), config.maxWaitTime.count());
}

BatchConfiguration BatchProcessor::getConfiguration() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.config;
}

BatchConfiguration BatchProcessor::autoTune(Millis targetLatency, double metricsPerSecond) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    BatchConfiguration tuned = getConfiguration();
    tuned.maxBatchSize = BatchProcessorUtils::calculateOptimalBatchSize(metricsPerSecond, targetLatency);
    tuned.flushInterval = BatchProcessorUtils::calculateOptimalFlushInterval(tuned.maxBatchSize, metricsPerSecond);
    tuned.maxWaitTime = std::max(tuned.maxWaitTime, tuned.flushInterval);

    spdlog::info("[BatchProcessor] Auto-tuned for {:.1f} metrics/s, {}ms target latency",
                 metricsPerSecond, targetLatency.count());
    applyConfigurationLocked(tuned);
    return tuned;
}

BatchStats BatchProcessor::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    BatchStats snapshot = state_.stats;
    snapshot.pendingMetrics = pending_.size();
    snapshot.isRunning = state_.isRunning;
    return snapshot;
}

BatchHealthStatus BatchProcessor::healthStatus() const {
    BatchStats s = stats();

    BatchHealthStatus health;
    health.isRunning = s.isRunning;
    health.queueSize = s.pendingMetrics;
    health.failureRate = s.failureRate;
    health.averageLatencyMs = s.averageProcessingTimeMs;

    if (!s.isRunning) {
        health.issues.push_back("Batch processor is not running");
        health.recommendations.push_back("Start the batch processor");
    }
    if (s.pendingMetrics > HIGH_QUEUE_SIZE) {
        health.issues.push_back("High queue size: " + std::to_string(s.pendingMetrics) + " pending metrics");
        health.recommendations.push_back("Consider increasing batch size or flush frequency");
    }
    if (s.failureRate > HIGH_FAILURE_RATE) {
        health.issues.push_back(fmt::format("High failure rate: {:.1f}%", s.failureRate * 100.0));
        health.recommendations.push_back("Check storage backend health and retry configuration");
    }
    if (s.lastFlushTime) {
        int64_t age = Clock::to_epoch_ms(Clock::wall_now()) - Clock::to_epoch_ms(*s.lastFlushTime);
        health.lastFlushAgeMs = age;
        if (age > STALE_FLUSH_MS) {
            health.issues.push_back("Last flush was " + std::to_string(age / 1000) + "s ago");
            health.recommendations.push_back("Check if auto-flush is enabled and working");
        }
    }

    if (health.issues.empty()) {
        health.status = HealthLevel::HEALTHY;
    } else if (health.issues.size() <= 2 && s.isRunning) {
        health.status = HealthLevel::DEGRADED;
    } else {
        health.status = HealthLevel::UNHEALTHY;
    }
    return health;
}

void BatchProcessor::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    BatchConfiguration cfg;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.isRunning) {
            spdlog::warn("[BatchProcessor] Already running");
            return;
        }
        state_.isRunning = true;
        cfg = state_.config;
    }

    if (cfg.enableAutoFlush) {
        startSchedulerLocked();
    }
    spdlog::info("BatchProcessor started (batch size: {}, flush interval: {}ms, auto-flush: {})",
                 cfg.maxBatchSize, cfg.flushInterval.count(), cfg.enableAutoFlush ? "enabled" : "disabled");
}

void BatchProcessor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        // Waits for in-flight producers; nothing is admitted afterwards
        std::unique_lock<std::shared_mutex> admission(admission_mutex_);
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!state_.isRunning) {
            spdlog::warn("[BatchProcessor] Already stopped");
            return;
        }
        state_.isRunning = false;
    }

    stopSchedulerLocked();

    // Drain whatever is still queued
    try {
        flush();
    } catch (const BatchError& e) {
        spdlog::error("[BatchProcessor] Final flush failed, {} metrics remain queued: {}",
                      pending_.size(), e.what());
    }
    spdlog::info("BatchProcessor stopped");
}

bool BatchProcessor::isRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.isRunning;
}

bool BatchProcessor::hasScheduler() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.hasScheduler;
}

void BatchProcessor::startSchedulerLocked() {
    Millis interval = getConfiguration().flushInterval;
    scheduler_ = std::make_unique<PeriodicTask>("batch-flush", interval, [this]() { flush(); });
    scheduler_->start();

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.hasScheduler = true;
}

void BatchProcessor::stopSchedulerLocked() {
    if (scheduler_) {
        scheduler_->stop();
        scheduler_.reset();
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.hasScheduler = false;
}

namespace BatchProcessorUtils {

BatchRetryConfig defaultRetryConfig() {
    return BatchRetryConfig{};
}

BatchConfiguration defaultConfig() {
    BatchConfiguration config;
    config.retryConfig = defaultRetryConfig();
    return config;
}

void validateConfig(const BatchConfiguration& config) {
    if (config.maxBatchSize == 0) {
        throw BatchError("validate", "validation", "maxBatchSize must be greater than 0");
    }
    if (config.flushInterval.count() <= 0) {
        throw BatchError("validate", "validation", "flushInterval must be greater than 0");
    }
    if (config.maxWaitTime < config.flushInterval) {
        throw BatchError("validate", "validation", "maxWaitTime must be greater than or equal to flushInterval");
    }
}

size_t calculateOptimalBatchSize(double metricsPerSecond, Millis targetLatency) {
    double optimal = 0.0;
    if (metricsPerSecond > 0.0) {
        optimal = std::ceil(metricsPerSecond * static_cast<double>(targetLatency.count()) / 1000.0);
    }
    return static_cast<size_t>(std::clamp(optimal, 10.0, 1000.0));
}

Millis calculateOptimalFlushInterval(size_t batchSize, double metricsPerSecond) {
    if (!(metricsPerSecond > 0.0)) {
        return std::chrono::seconds(30);
    }
    double seconds = std::clamp(static_cast<double>(batchSize) / metricsPerSecond, 1.0, 300.0);
    return Millis(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

Millis retryDelay(const BatchRetryConfig& retry, uint32_t attempt) {
    double delay = static_cast<double>(retry.initialDelay.count()) *
                   std::pow(retry.backoffMultiplier, static_cast<double>(attempt));
    if (delay >= static_cast<double>(retry.maxDelay.count())) {
        return retry.maxDelay;
    }
    return Millis(static_cast<int64_t>(delay));
}

} // namespace BatchProcessorUtils

} // namespace MetricStream
