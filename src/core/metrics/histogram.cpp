#include <metricstream/core/metrics/histogram.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace MetricStream {

namespace {

const std::vector<double> DEFAULT_PERCENTILES{50.0, 95.0, 99.0};

void requireValidName(const std::string& name) {
    if (!MetricFactory::isValidName(name)) {
        throw std::invalid_argument("Invalid metric name: '" + name + "'");
    }
}

} // namespace

// ============================================================================
// HistogramMetric
// ============================================================================

HistogramMetric::HistogramMetric(HistogramConfig config)
    : config_(std::move(config)) {
    requireValidName(config_.name);
    if (config_.boundaries.empty()) {
        throw std::invalid_argument("Histogram boundaries cannot be empty");
    }
    if (!std::is_sorted(config_.boundaries.begin(), config_.boundaries.end())) {
        throw std::invalid_argument("Histogram boundaries must be sorted in ascending order");
    }
    counts_.assign(config_.boundaries.size(), 0);
}

void HistogramMetric::observe(double value) {
    auto it = std::lower_bound(config_.boundaries.begin(), config_.boundaries.end(), value);

    std::lock_guard<std::mutex> lock(mutex_);
    sum_ += value;
    ++count_;
    if (it != config_.boundaries.end()) {
        ++counts_[static_cast<size_t>(it - config_.boundaries.begin())];
    }
}

void HistogramMetric::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(counts_.begin(), counts_.end(), 0);
    sum_ = 0.0;
    count_ = 0;
}

HistogramBuckets HistogramMetric::buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return HistogramBuckets{config_.boundaries, counts_, sum_, count_};
}

PercentileMap HistogramMetric::percentiles() const {
    return HistogramUtils::bucketPercentiles(buckets());
}

MetricValue HistogramMetric::value() const {
    return HistogramValue{buckets(), {}};
}

Metric HistogramMetric::toMetric() const {
    return MetricFactory::createMetric(config_.name, value(), MetricType::HISTOGRAM, config_.labels);
}

// ============================================================================
// DistributionMetric
// ============================================================================

DistributionMetric::DistributionMetric(DistributionConfig config)
    : config_(std::move(config)) {
    requireValidName(config_.name);
    if (config_.maxSamples == 0) {
        throw std::invalid_argument("Distribution maxSamples must be greater than 0");
    }
    if (config_.percentiles.empty()) {
        config_.percentiles = DEFAULT_PERCENTILES;
    }
}

void DistributionMetric::record(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(value);
    while (samples_.size() > config_.maxSamples) {
        samples_.pop_front();
    }
}

void DistributionMetric::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

std::vector<double> DistributionMetric::sortedValues() const {
    std::vector<double> values;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values.assign(samples_.begin(), samples_.end());
    }
    std::sort(values.begin(), values.end());
    return values;
}

size_t DistributionMetric::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

PercentileMap DistributionMetric::percentiles() const {
    return percentiles(config_.percentiles);
}

PercentileMap DistributionMetric::percentiles(const std::vector<double>& wanted) const {
    return DistributionUtils::exactPercentiles(sortedValues(), wanted);
}

DistributionSummary DistributionMetric::summary() const {
    return DistributionUtils::summarize(sortedValues());
}

MetricValue DistributionMetric::value() const {
    std::vector<double> sorted = sortedValues();
    PercentileMap computed = DistributionUtils::exactPercentiles(sorted, config_.percentiles);
    return DistributionValue{std::move(sorted), std::move(computed)};
}

Metric DistributionMetric::toMetric() const {
    return MetricFactory::createMetric(config_.name, value(), MetricType::DISTRIBUTION, config_.labels);
}

// ============================================================================
// HistogramUtils
// ============================================================================

namespace HistogramUtils {

std::vector<double> linearBuckets(double start, double width, size_t count) {
    std::vector<double> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(start + static_cast<double>(i) * width);
    }
    return out;
}

std::vector<double> exponentialBuckets(double start, double factor, size_t count) {
    std::vector<double> out;
    out.reserve(count);
    double current = start;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(current);
        current *= factor;
    }
    return out;
}

std::vector<double> logarithmicBuckets(double start, double end, size_t count) {
    if (start <= 0.0 || end <= 0.0 || start >= end || count < 2) {
        throw std::invalid_argument("Invalid parameters for logarithmic buckets");
    }
    const double logStart = std::log(start);
    const double step = (std::log(end) - logStart) / static_cast<double>(count - 1);

    std::vector<double> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(std::exp(logStart + static_cast<double>(i) * step));
    }
    return out;
}

std::vector<double> httpResponseTimeBuckets() {
    return {1, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};
}

std::vector<double> databaseQueryTimeBuckets() {
    return {0.1, 0.5, 1, 5, 10, 25, 50, 100, 250, 500, 1000, 5000};
}

std::vector<double> memoryUsageBuckets() {
    return {1, 5, 10, 25, 50, 100, 250, 500, 1000, 2000, 4000, 8000};
}

std::vector<double> cpuUsageBuckets() {
    return {1, 5, 10, 20, 30, 40, 50, 60, 70, 80, 90, 95, 99};
}

HistogramConfig httpResponseTimeHistogram(std::string name, MetricLabels labels) {
    return HistogramConfig{std::move(name), httpResponseTimeBuckets(), std::move(labels)};
}

HistogramConfig databaseQueryTimeHistogram(std::string name, MetricLabels labels) {
    return HistogramConfig{std::move(name), databaseQueryTimeBuckets(), std::move(labels)};
}

HistogramConfig memoryUsageHistogram(std::string name, MetricLabels labels) {
    return HistogramConfig{std::move(name), memoryUsageBuckets(), std::move(labels)};
}

HistogramConfig cpuUsageHistogram(std::string name, MetricLabels labels) {
    return HistogramConfig{std::move(name), cpuUsageBuckets(), std::move(labels)};
}

std::string percentileKey(double percentile) {
    std::ostringstream out;
    out << percentile;
    return out.str();
}

PercentileMap bucketPercentiles(const HistogramBuckets& buckets, const std::vector<double>& wanted) {
    PercentileMap result;
    const auto& bounds = buckets.boundaries;
    if (buckets.count <= 0 || bounds.empty()) {
        for (double p : wanted) result[percentileKey(p)] = 0.0;
        return result;
    }

    std::vector<int64_t> cumulative(buckets.counts.size());
    std::partial_sum(buckets.counts.begin(), buckets.counts.end(), cumulative.begin());

    for (double p : wanted) {
        const double target = (p / 100.0) * static_cast<double>(buckets.count);
        auto it = std::find_if(cumulative.begin(), cumulative.end(),
                               [target](int64_t c) { return static_cast<double>(c) >= target; });

        double estimate;
        if (it == cumulative.end()) {
            // Overflow bucket: clamp to the last boundary
            estimate = bounds.back();
        } else if (it == cumulative.begin()) {
            estimate = bounds.front();
        } else {
            const size_t i = static_cast<size_t>(it - cumulative.begin());
            const double lowerCount = static_cast<double>(cumulative[i - 1]);
            const double upperCount = static_cast<double>(cumulative[i]);
            if (upperCount > lowerCount) {
                const double ratio = (target - lowerCount) / (upperCount - lowerCount);
                estimate = bounds[i - 1] + ratio * (bounds[i] - bounds[i - 1]);
            } else {
                estimate = bounds[i];
            }
        }
        result[percentileKey(p)] = estimate;
    }
    return result;
}

HistogramBuckets mergeHistograms(const std::vector<HistogramBuckets>& histograms) {
    if (histograms.empty()) {
        throw std::invalid_argument("Cannot merge an empty set of histograms");
    }

    HistogramBuckets merged;
    merged.boundaries = histograms.front().boundaries;
    merged.counts.assign(merged.boundaries.size(), 0);

    for (const auto& h : histograms) {
        if (h.boundaries != merged.boundaries) {
            throw std::invalid_argument("Cannot merge histograms with different bucket boundaries");
        }
        if (h.counts.size() != merged.counts.size()) {
            throw std::invalid_argument("Histogram counts and boundaries must have the same length");
        }
        for (size_t i = 0; i < h.counts.size(); ++i) {
            merged.counts[i] += h.counts[i];
        }
        merged.sum += h.sum;
        merged.count += h.count;
    }
    return merged;
}

} // namespace HistogramUtils

// ============================================================================
// DistributionUtils
// ============================================================================

namespace DistributionUtils {

DistributionConfig responseTimeDistribution(std::string name, MetricLabels labels) {
    return DistributionConfig{std::move(name), std::move(labels), 10000, {50.0, 90.0, 95.0, 99.0, 99.9}};
}

DistributionConfig requestSizeDistribution(std::string name, MetricLabels labels) {
    return DistributionConfig{std::move(name), std::move(labels), 5000, {50.0, 90.0, 95.0, 99.0}};
}

DistributionConfig errorRateDistribution(std::string name, MetricLabels labels) {
    return DistributionConfig{std::move(name), std::move(labels), 1000, {50.0, 75.0, 90.0, 95.0, 99.0}};
}

PercentileMap exactPercentiles(const std::vector<double>& sorted, const std::vector<double>& wanted) {
    PercentileMap result;
    const size_t n = sorted.size();

    for (double p : wanted) {
        const std::string key = HistogramUtils::percentileKey(p);
        if (n == 0) {
            result[key] = 0.0;
            continue;
        }
        if (n == 1) {
            result[key] = sorted.front();
            continue;
        }

        const double h = static_cast<double>(n + 1) * (p / 100.0);
        const double hFloor = std::floor(h);
        const double hCeil = std::ceil(h);

        if (hFloor <= 0.0) {
            result[key] = sorted.front();
        } else if (hFloor >= static_cast<double>(n)) {
            result[key] = sorted.back();
        } else {
            const double lower = sorted[static_cast<size_t>(hFloor) - 1];
            const double upper = sorted[static_cast<size_t>(hCeil) - 1];
            result[key] = lower + (h - hFloor) * (upper - lower);
        }
    }
    return result;
}

DistributionSummary summarize(const std::vector<double>& values) {
    DistributionSummary s;
    if (values.empty()) {
        return s;
    }
    s.count = values.size();
    s.sum = std::accumulate(values.begin(), values.end(), 0.0);
    s.mean = s.sum / static_cast<double>(s.count);
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    s.min = *lo;
    s.max = *hi;

    double squares = 0.0;
    for (double v : values) {
        squares += (v - s.mean) * (v - s.mean);
    }
    s.stddev = std::sqrt(squares / static_cast<double>(s.count));
    return s;
}

DistributionValue mergeDistributions(const std::vector<DistributionValue>& distributions) {
    if (distributions.empty()) {
        throw std::invalid_argument("Cannot merge an empty set of distributions");
    }

    std::vector<double> pooled;
    for (const auto& d : distributions) {
        pooled.insert(pooled.end(), d.values.begin(), d.values.end());
    }
    std::sort(pooled.begin(), pooled.end());

    PercentileMap computed = exactPercentiles(pooled, DEFAULT_PERCENTILES);
    return DistributionValue{std::move(pooled), std::move(computed)};
}

Significance compare(const DistributionSummary& a, const DistributionSummary& b) {
    if (a.count < 2 || b.count < 2) {
        throw std::invalid_argument("Significance needs at least 2 samples per distribution");
    }

    const double n1 = static_cast<double>(a.count);
    const double n2 = static_cast<double>(b.count);
    const double pooledVariance =
        ((n1 - 1.0) * a.stddev * a.stddev + (n2 - 1.0) * b.stddev * b.stddev) / (n1 + n2 - 2.0);
    const double standardError = std::sqrt(pooledVariance) * std::sqrt(1.0 / n1 + 1.0 / n2);
    if (standardError == 0.0) {
        throw std::invalid_argument("Cannot compare distributions with zero standard error");
    }

    Significance result;
    result.meanDifference = a.mean - b.mean;
    const double t = result.meanDifference / standardError;
    // Two-sided tail of the standard normal
    result.pValue = std::erfc(std::fabs(t) / std::sqrt(2.0));
    result.isSignificant = result.pValue < 0.05;
    return result;
}

} // namespace DistributionUtils

} // namespace MetricStream
