#include <metricstream/core/metrics/metric_factory.hpp>
#include <cctype>
#include <stdexcept>

namespace MetricStream {

std::atomic<uint64_t> MetricFactory::global_metric_id{0};

namespace {

bool matchesGrammar(const std::string& text, size_t maxLength, bool allowDotDash) {
    if (text.empty() || text.size() > maxLength) return false;
    if (!std::isalpha(static_cast<unsigned char>(text.front()))) return false;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '_') continue;
        if (allowDotDash && (c == '.' || c == '-')) continue;
        return false;
    }
    return true;
}

void checkNameAndLabels(const std::string& name, const MetricLabels& labels) {
    if (!MetricFactory::isValidName(name)) {
        throw std::invalid_argument("Invalid metric name: '" + name + "'");
    }
    for (const auto& label : labels) {
        if (!MetricFactory::isValidLabelKey(label.first)) {
            throw std::invalid_argument("Invalid label key '" + label.first + "' on metric " + name);
        }
    }
}

} // namespace

void MetricFactory::validate(const Metric& metric) {
    checkNameAndLabels(metric.name, metric.labels);
}

bool MetricFactory::isValidName(const std::string& name) {
    return matchesGrammar(name, MAX_NAME_LENGTH, true);
}

bool MetricFactory::isValidLabelKey(const std::string& key) {
    return matchesGrammar(key, MAX_LABEL_KEY_LENGTH, false);
}

std::string MetricFactory::nextId() {
    return "m-" + std::to_string(global_metric_id.fetch_add(1, std::memory_order_relaxed));
}

Metric MetricFactory::createMetric(std::string name,
                                   MetricValue value,
                                   MetricType type,
                                   MetricLabels labels,
                                   std::optional<MetricMetadata> metadata,
                                   std::optional<Timestamp> timestamp) {
    checkNameAndLabels(name, labels);
    if (const auto* hist = std::get_if<HistogramValue>(&value)) {
        validateBuckets(hist->buckets);
    }

    Metric m;
    m.id = nextId();
    m.name = std::move(name);
    m.value = std::move(value);
    m.type = type;
    m.labels = std::move(labels);
    m.timestamp = timestamp ? *timestamp : Clock::wall_now();
    m.metadata = std::move(metadata);
    return m;
}

MetricValue MetricFactory::number(double value) {
    return NumberValue{value};
}

MetricValue MetricFactory::numberWithUnit(double value, std::string unit) {
    return NumberWithUnitValue{value, std::move(unit)};
}

MetricValue MetricFactory::histogram(HistogramBuckets buckets, std::vector<double> samples) {
    validateBuckets(buckets);
    return HistogramValue{std::move(buckets), std::move(samples)};
}

MetricValue MetricFactory::distribution(std::vector<double> values,
                                        std::map<std::string, double> percentiles) {
    return DistributionValue{std::move(values), std::move(percentiles)};
}

void MetricFactory::validateBuckets(const HistogramBuckets& buckets) {
    if (buckets.counts.size() != buckets.boundaries.size()) {
        throw std::invalid_argument("Histogram counts and boundaries must have the same length");
    }
    for (int64_t c : buckets.counts) {
        if (c < 0) {
            throw std::invalid_argument("Histogram bucket counts must be non-negative");
        }
    }
    if (buckets.count < 0) {
        throw std::invalid_argument("Histogram total count must be non-negative");
    }
}

} // namespace MetricStream
