#pragma once

#include <metricstream/core/utils/clock.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace MetricStream {

enum class MetricType : uint8_t {
    COUNTER = 0,
    GAUGE = 1,
    HISTOGRAM = 2,
    DISTRIBUTION = 3,
    TIMER = 4,
    SUMMARY = 5
};

struct HistogramBuckets {
    std::vector<double> boundaries;
    std::vector<int64_t> counts;    // counts.size() == boundaries.size(), all >= 0
    double sum = 0.0;
    int64_t count = 0;
};

// MetricValue alternatives
struct NumberValue {
    double value = 0.0;
};

struct NumberWithUnitValue {
    double value = 0.0;
    std::string unit;
};

struct HistogramValue {
    HistogramBuckets buckets;
    std::vector<double> samples;
};

struct DistributionValue {
    std::vector<double> values;
    std::map<std::string, double> percentiles;
};

using MetricValue = std::variant<NumberValue, NumberWithUnitValue, HistogramValue, DistributionValue>;

using MetricLabels = std::map<std::string, std::string>;

struct MetricMetadata {
    std::optional<std::string> source;
    std::optional<std::string> correlationId;
    std::optional<std::string> environment;
    std::optional<std::string> version;
    std::optional<std::string> component;
    std::optional<std::string> service;
    std::optional<std::string> traceId;
    std::optional<std::string> spanId;

    /**
     * @brief Look up a field by its name ("source", "correlationId", ...)
     * @return std::nullopt for unset or unknown fields
     */
    std::optional<std::string> field(const std::string& name) const;
};

/**
 * A single recorded measurement. Immutable once created: the pipeline copies
 * metrics around but never edits one in place. Use MetricFactory to build
 * metrics so names and label keys are validated.
 */
struct Metric {
    std::string id;
    std::string name;
    MetricValue value;
    MetricType type = MetricType::GAUGE;
    MetricLabels labels;
    Timestamp timestamp{};
    std::optional<MetricMetadata> metadata;
};

const char* toString(MetricType type);
std::optional<MetricType> parseMetricType(const std::string& text);

/**
 * @brief Scalar view of a value used by value filters and sorting.
 *
 * Number / NumberWithUnit: the value. Histogram: buckets.sum.
 * Distribution: arithmetic mean of values (0 for an empty distribution).
 */
double numericValue(const MetricValue& value);

inline bool isNumericValue(const MetricValue& value) {
    return std::holds_alternative<NumberValue>(value) ||
           std::holds_alternative<NumberWithUnitValue>(value);
}

inline bool isHistogramValue(const MetricValue& value) {
    return std::holds_alternative<HistogramValue>(value);
}

inline bool isDistributionValue(const MetricValue& value) {
    return std::holds_alternative<DistributionValue>(value);
}

} // namespace MetricStream
