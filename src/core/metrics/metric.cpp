#include <metricstream/core/metrics/metric.hpp>
#include <numeric>

namespace MetricStream {

std::optional<std::string> MetricMetadata::field(const std::string& name) const {
    if (name == "source") return source;
    if (name == "correlationId") return correlationId;
    if (name == "environment") return environment;
    if (name == "version") return version;
    if (name == "component") return component;
    if (name == "service") return service;
    if (name == "traceId") return traceId;
    if (name == "spanId") return spanId;
    return std::nullopt;
}

const char* toString(MetricType type) {
    switch (type) {
        case MetricType::COUNTER:      return "counter";
        case MetricType::GAUGE:        return "gauge";
        case MetricType::HISTOGRAM:    return "histogram";
        case MetricType::DISTRIBUTION: return "distribution";
        case MetricType::TIMER:        return "timer";
        case MetricType::SUMMARY:      return "summary";
        default:                       return "unknown";
    }
}

std::optional<MetricType> parseMetricType(const std::string& text) {
    static const MetricType all[] = {
        MetricType::COUNTER, MetricType::GAUGE, MetricType::HISTOGRAM,
        MetricType::DISTRIBUTION, MetricType::TIMER, MetricType::SUMMARY
    };
    for (MetricType type : all) {
        if (text == toString(type)) return type;
    }
    return std::nullopt;
}

namespace {

struct NumericVisitor {
    double operator()(const NumberValue& v) const { return v.value; }
    double operator()(const NumberWithUnitValue& v) const { return v.value; }
    double operator()(const HistogramValue& v) const { return v.buckets.sum; }
    double operator()(const DistributionValue& v) const {
        if (v.values.empty()) return 0.0;
        double total = std::accumulate(v.values.begin(), v.values.end(), 0.0);
        return total / static_cast<double>(v.values.size());
    }
};

} // namespace

double numericValue(const MetricValue& value) {
    return std::visit(NumericVisitor{}, value);
}

} // namespace MetricStream
