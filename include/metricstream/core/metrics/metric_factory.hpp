#pragma once

#include <metricstream/core/metrics/metric.hpp>
#include <atomic>
#include <string>

namespace MetricStream {

/**
 * @brief Builds validated metrics.
 *
 * Names must match ^[a-zA-Z][a-zA-Z0-9._-]*$ (1..255 chars) and label keys
 * ^[a-zA-Z][a-zA-Z0-9_]*$ (1..100 chars). Violations throw
 * std::invalid_argument; names are never rewritten.
 */
class MetricFactory {
public:
    static constexpr size_t MAX_NAME_LENGTH = 255;
    static constexpr size_t MAX_LABEL_KEY_LENGTH = 100;

    static Metric createMetric(std::string name,
                               MetricValue value,
                               MetricType type,
                               MetricLabels labels = {},
                               std::optional<MetricMetadata> metadata = std::nullopt,
                               std::optional<Timestamp> timestamp = std::nullopt);

    /**
     * @brief Check an already-built metric against the name and label-key grammar
     * @throws std::invalid_argument on the first violation
     */
    static void validate(const Metric& metric);

    static bool isValidName(const std::string& name);
    static bool isValidLabelKey(const std::string& key);

    static MetricValue number(double value);
    static MetricValue numberWithUnit(double value, std::string unit);

    /**
     * @throws std::invalid_argument if counts and boundaries differ in length
     *         or any count is negative
     */
    static MetricValue histogram(HistogramBuckets buckets, std::vector<double> samples = {});
    static MetricValue distribution(std::vector<double> values,
                                    std::map<std::string, double> percentiles = {});

    // Unique id, "m-<sequence>"
    static std::string nextId();

private:
    static void validateBuckets(const HistogramBuckets& buckets);
    static std::atomic<uint64_t> global_metric_id;
};

} // namespace MetricStream
