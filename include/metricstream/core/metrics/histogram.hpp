#pragma once

#include <metricstream/core/metrics/metric.hpp>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace MetricStream {

using PercentileMap = std::map<std::string, double>;

struct HistogramConfig {
    std::string name;
    std::vector<double> boundaries;
    MetricLabels labels;
};

struct DistributionConfig {
    std::string name;
    MetricLabels labels;
    size_t maxSamples = 10000;
    std::vector<double> percentiles{50.0, 95.0, 99.0};
};

struct DistributionSummary {
    size_t count = 0;
    double sum = 0.0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;    // population
};

/**
 * @brief Bucketed histogram fed one observation at a time.
 *
 * A value lands in the first bucket whose upper boundary is >= value.
 * Values above the last boundary only count toward count/sum, so
 * count - sum(counts) is the overflow bucket.
 *
 * Thread-safe: observe() and the snapshot accessors may race.
 */
class HistogramMetric {
public:
    /**
     * @throws std::invalid_argument on an invalid name, empty boundaries or
     *         boundaries not in ascending order
     */
    explicit HistogramMetric(HistogramConfig config);

    void observe(double value);
    void reset();

    HistogramBuckets buckets() const;

    // "50", "95", "99" interpolated from the buckets
    PercentileMap percentiles() const;

    MetricValue value() const;
    Metric toMetric() const;

    const std::string& name() const { return config_.name; }
    const std::vector<double>& boundaries() const { return config_.boundaries; }
    const MetricLabels& labels() const { return config_.labels; }

private:
    HistogramConfig config_;

    mutable std::mutex mutex_;
    std::vector<int64_t> counts_;
    double sum_ = 0.0;
    int64_t count_ = 0;
};

/**
 * @brief Keeps the most recent maxSamples raw values for exact percentiles.
 */
class DistributionMetric {
public:
    // @throws std::invalid_argument on an invalid name or maxSamples == 0
    explicit DistributionMetric(DistributionConfig config);

    void record(double value);
    void reset();

    std::vector<double> sortedValues() const;
    size_t sampleCount() const;

    // The configured percentiles
    PercentileMap percentiles() const;
    PercentileMap percentiles(const std::vector<double>& wanted) const;
    DistributionSummary summary() const;

    MetricValue value() const;
    Metric toMetric() const;

    const std::string& name() const { return config_.name; }
    const MetricLabels& labels() const { return config_.labels; }

private:
    DistributionConfig config_;

    mutable std::mutex mutex_;
    std::deque<double> samples_;
};

namespace HistogramUtils {

std::vector<double> linearBuckets(double start, double width, size_t count);
std::vector<double> exponentialBuckets(double start, double factor, size_t count);

// @throws std::invalid_argument unless 0 < start < end and count >= 2
std::vector<double> logarithmicBuckets(double start, double end, size_t count);

std::vector<double> httpResponseTimeBuckets();     // ms
std::vector<double> databaseQueryTimeBuckets();    // ms
std::vector<double> memoryUsageBuckets();          // MB
std::vector<double> cpuUsageBuckets();             // percent

HistogramConfig httpResponseTimeHistogram(std::string name, MetricLabels labels = {});
HistogramConfig databaseQueryTimeHistogram(std::string name, MetricLabels labels = {});
HistogramConfig memoryUsageHistogram(std::string name, MetricLabels labels = {});
HistogramConfig cpuUsageHistogram(std::string name, MetricLabels labels = {});

// Key used in percentile maps: 50 -> "50", 99.9 -> "99.9"
std::string percentileKey(double percentile);

PercentileMap bucketPercentiles(const HistogramBuckets& buckets,
                                const std::vector<double>& wanted = {50.0, 95.0, 99.0});

/**
 * @throws std::invalid_argument for an empty input or differing boundaries
 */
HistogramBuckets mergeHistograms(const std::vector<HistogramBuckets>& histograms);

} // namespace HistogramUtils

namespace DistributionUtils {

DistributionConfig responseTimeDistribution(std::string name, MetricLabels labels = {});
DistributionConfig requestSizeDistribution(std::string name, MetricLabels labels = {});
DistributionConfig errorRateDistribution(std::string name, MetricLabels labels = {});

// R-6 quantiles (linear interpolation at (n + 1) * p) over sorted values
PercentileMap exactPercentiles(const std::vector<double>& sorted, const std::vector<double>& wanted);

DistributionSummary summarize(const std::vector<double>& values);

/**
 * @brief Pool the raw values of several distributions
 * @return Sorted values with percentiles 50/95/99
 * @throws std::invalid_argument for an empty input
 */
DistributionValue mergeDistributions(const std::vector<DistributionValue>& distributions);

struct Significance {
    double meanDifference = 0.0;
    double pValue = 1.0;
    bool isSignificant = false;    // pValue < 0.05
};

/**
 * @brief Pooled-variance two-sample t statistic with a normal approximation
 * @throws std::invalid_argument when either side has fewer than 2 samples
 *         or the standard error is zero
 */
Significance compare(const DistributionSummary& a, const DistributionSummary& b);

} // namespace DistributionUtils

} // namespace MetricStream
