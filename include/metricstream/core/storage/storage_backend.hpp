#pragma once

#include <metricstream/core/metrics/metric.hpp>
#include <metricstream/core/metrics/metric_filter.hpp>
#include <metricstream/core/errors.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace MetricStream {

// Read-only snapshot, recomputed on every stats() call
struct StorageStats {
    size_t totalMetrics = 0;
    size_t approximateMemoryBytes = 0;
    std::optional<Timestamp> oldestTimestamp;
    std::optional<Timestamp> newestTimestamp;
    std::string backendLabel;
};

/**
 * @brief Pluggable metric storage.
 *
 * Every operation reports failure by throwing StorageError; lower-level
 * exceptions are wrapped with the original preserved as the cause.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual void store(const std::vector<Metric>& metrics) = 0;
    virtual std::vector<Metric> retrieve(const MetricFilter& filter) = 0;

    /**
     * @brief Remove metrics with timestamp < maxAge, then trim the oldest
     *        survivors down to maxCount
     * @return Number of metrics removed
     */
    virtual size_t cleanup(Timestamp maxAge, size_t maxCount) = 0;
    virtual StorageStats stats() = 0;

    // backend type (debug / stats)
    virtual const char* name() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace MetricStream
