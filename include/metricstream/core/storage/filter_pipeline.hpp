#pragma once

#include <metricstream/core/metrics/metric.hpp>
#include <metricstream/core/metrics/metric_filter.hpp>
#include <vector>

namespace MetricStream {

/**
 * @brief Evaluates a MetricFilter over a chronologically ordered slice.
 *
 * Stages run in a fixed order:
 *   names -> namePattern -> types -> timeRange (inclusive) -> labels (exact)
 *   -> labelFilters -> metadataFilters -> valueFilters -> sources
 *   -> correlationIds -> sort (stable) -> offset / limit
 *
 * An invalid namePattern is ignored; an invalid REGEX operand never matches.
 */
class FilterPipeline {
public:
    static std::vector<Metric> apply(std::vector<Metric> metrics, const MetricFilter& filter);

    static bool matchesLabelFilter(const Metric& metric, const LabelFilter& filter);
    static bool matchesMetadataFilter(const Metric& metric, const MetadataFilter& filter);
    static bool matchesValueFilter(const Metric& metric, const ValueFilter& filter);

    // <0, 0, >0 according to criteria (secondary sort not consulted)
    static int compare(const Metric& a, const Metric& b, const SortCriteria& criteria);
};

} // namespace MetricStream
