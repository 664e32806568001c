#pragma once

#include <metricstream/core/metrics/metric.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MetricStream {

enum class StringOperator : uint8_t {
    EQUALS,
    NOT_EQUALS,
    CONTAINS,
    NOT_CONTAINS,
    STARTS_WITH,
    ENDS_WITH,
    REGEX,
    IN,
    NOT_IN
};

enum class ValueOperator : uint8_t {
    EQUALS,
    NOT_EQUALS,
    GREATER_THAN,
    GREATER_THAN_OR_EQUAL,
    LESS_THAN,
    LESS_THAN_OR_EQUAL,
    BETWEEN,
    NOT_BETWEEN
};

// Matches a label value by key
struct LabelFilter {
    std::string key;
    StringOperator op = StringOperator::EQUALS;
    std::string value;
    std::vector<std::string> values;   // IN / NOT_IN
    bool caseSensitive = true;
};

// Matches a MetricMetadata field by name ("source", "service", ...)
struct MetadataFilter {
    std::string field;
    StringOperator op = StringOperator::EQUALS;
    std::string value;
    std::vector<std::string> values;   // IN / NOT_IN
    bool caseSensitive = true;
};

// Matches numericValue(metric.value)
struct ValueFilter {
    ValueOperator op = ValueOperator::EQUALS;
    double value = 0.0;
    std::optional<std::pair<double, double>> range;   // BETWEEN / NOT_BETWEEN, inclusive
    std::optional<std::string> unit;                  // restricts NumberWithUnit metrics
};

struct TimeRange {
    Timestamp start;
    Timestamp end;
};

enum class SortField : uint8_t { NAME, TIMESTAMP, TYPE, VALUE, SOURCE };
enum class SortDirection : uint8_t { ASC, DESC };

struct SortCriteria {
    SortField field = SortField::TIMESTAMP;
    SortDirection direction = SortDirection::ASC;
    std::shared_ptr<SortCriteria> secondarySort;
};

/**
 * Query over stored metrics. Every unset member is a no-op; set members are
 * combined with AND. See FilterPipeline for the evaluation order.
 */
struct MetricFilter {
    std::vector<std::string> names;
    std::optional<std::string> namePattern;
    std::vector<MetricType> types;
    std::optional<TimeRange> timeRange;
    MetricLabels labels;
    std::vector<LabelFilter> labelFilters;
    std::vector<MetadataFilter> metadataFilters;
    std::vector<ValueFilter> valueFilters;
    std::vector<std::string> sources;
    std::vector<std::string> correlationIds;
    std::optional<SortCriteria> sortBy;
    std::optional<size_t> limit;    // 0 = unbounded
    std::optional<size_t> offset;
};

} // namespace MetricStream
