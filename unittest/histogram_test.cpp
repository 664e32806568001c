// ============================================================================
// HISTOGRAM / DISTRIBUTION UNIT TESTS
// ============================================================================
// Tests for bucketed histograms, sample distributions and their helpers
// ============================================================================

#include <gtest/gtest.h>
#include <metricstream/core/metrics/histogram.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

using namespace MetricStream;

namespace {

HistogramConfig histogramConfig(std::vector<double> boundaries) {
    return HistogramConfig{"request.latency", std::move(boundaries), {{"route", "checkout"}}};
}

DistributionConfig distributionConfig(size_t maxSamples = 100) {
    DistributionConfig config;
    config.name = "payload.size";
    config.maxSamples = maxSamples;
    return config;
}

} // namespace

// ============================================================================
// HISTOGRAM METRIC
// ============================================================================

TEST(HistogramMetric, ObservePlacesValuesInBuckets) {
    HistogramMetric hist(histogramConfig({10, 20, 30}));
    for (double v : {5.0, 10.0, 15.0, 25.0, 100.0}) {
        hist.observe(v);
    }

    auto b = hist.buckets();
    EXPECT_EQ(b.counts, (std::vector<int64_t>{2, 1, 1}));
    EXPECT_EQ(b.count, 5);
    EXPECT_DOUBLE_EQ(b.sum, 155.0);
    EXPECT_EQ(b.boundaries, (std::vector<double>{10, 20, 30}));
}

TEST(HistogramMetric, RejectsBadConfiguration) {
    EXPECT_THROW(HistogramMetric{histogramConfig({})}, std::invalid_argument);
    EXPECT_THROW(HistogramMetric{histogramConfig({10, 5, 20})}, std::invalid_argument);

    HistogramConfig badName = histogramConfig({1, 2});
    badName.name = "request latency";
    EXPECT_THROW(HistogramMetric{badName}, std::invalid_argument);
}

TEST(HistogramMetric, PercentilesInterpolateWithinBuckets) {
    HistogramMetric hist(histogramConfig({10, 20, 30, 40}));
    for (int i = 0; i < 2; ++i) hist.observe(5);
    for (int i = 0; i < 4; ++i) hist.observe(15);
    for (int i = 0; i < 4; ++i) hist.observe(25);

    auto p = hist.percentiles();
    ASSERT_EQ(p.size(), 3u);
    EXPECT_NEAR(p.at("50"), 17.5, 1e-9);
    EXPECT_NEAR(p.at("95"), 28.75, 1e-9);
    EXPECT_NEAR(p.at("99"), 29.75, 1e-9);
}

TEST(HistogramMetric, OverflowClampsToLastBoundary) {
    HistogramMetric hist(histogramConfig({10}));
    hist.observe(50);
    hist.observe(60);
    hist.observe(70);

    auto b = hist.buckets();
    EXPECT_EQ(b.counts, (std::vector<int64_t>{0}));
    EXPECT_EQ(b.count, 3);
    EXPECT_DOUBLE_EQ(hist.percentiles().at("99"), 10.0);
}

TEST(HistogramMetric, EmptyHistogramReportsZeroPercentiles) {
    HistogramMetric hist(histogramConfig({1, 2, 3}));
    for (const auto& [key, value] : hist.percentiles()) {
        EXPECT_EQ(value, 0.0) << key;
    }
}

TEST(HistogramMetric, ResetClearsState) {
    HistogramMetric hist(histogramConfig({1, 2}));
    hist.observe(1);
    hist.observe(2);
    hist.reset();

    auto b = hist.buckets();
    EXPECT_EQ(b.count, 0);
    EXPECT_EQ(b.sum, 0.0);
    EXPECT_EQ(b.counts, (std::vector<int64_t>{0, 0}));
}

TEST(HistogramMetric, ToMetricCarriesBucketsAndLabels) {
    HistogramMetric hist(histogramConfig({10, 20}));
    hist.observe(4);
    hist.observe(16);

    Metric m = hist.toMetric();
    EXPECT_EQ(m.name, "request.latency");
    EXPECT_EQ(m.type, MetricType::HISTOGRAM);
    EXPECT_EQ(m.labels.at("route"), "checkout");
    ASSERT_TRUE(isHistogramValue(m.value));
    EXPECT_DOUBLE_EQ(numericValue(m.value), 20.0);
}

TEST(HistogramMetric, ConcurrentObservationsAreCounted) {
    HistogramMetric hist(histogramConfig(HistogramUtils::httpResponseTimeBuckets()));
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&hist]() {
            for (int i = 0; i < 1000; ++i) hist.observe(static_cast<double>(i % 300));
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(hist.buckets().count, 4000);
}

// ============================================================================
// DISTRIBUTION METRIC
// ============================================================================

TEST(DistributionMetric, ExactPercentilesAndSummary) {
    DistributionMetric dist(distributionConfig());
    for (int v = 10; v >= 1; --v) {
        dist.record(v);
    }

    auto p = dist.percentiles({25, 50, 95});
    EXPECT_NEAR(p.at("25"), 2.75, 1e-9);
    EXPECT_NEAR(p.at("50"), 5.5, 1e-9);
    EXPECT_NEAR(p.at("95"), 10.0, 1e-9);

    auto s = dist.summary();
    EXPECT_EQ(s.count, 10u);
    EXPECT_DOUBLE_EQ(s.sum, 55.0);
    EXPECT_DOUBLE_EQ(s.mean, 5.5);
    EXPECT_DOUBLE_EQ(s.min, 1.0);
    EXPECT_DOUBLE_EQ(s.max, 10.0);
    EXPECT_NEAR(s.stddev, std::sqrt(8.25), 1e-9);
}

TEST(DistributionMetric, KeepsOnlyMostRecentSamples) {
    DistributionMetric dist(distributionConfig(3));
    for (int v = 1; v <= 5; ++v) {
        dist.record(v);
    }
    EXPECT_EQ(dist.sampleCount(), 3u);
    EXPECT_EQ(dist.sortedValues(), (std::vector<double>{3, 4, 5}));
}

TEST(DistributionMetric, EmptyAndSingleSample) {
    DistributionMetric dist(distributionConfig());
    EXPECT_EQ(dist.percentiles().at("50"), 0.0);
    EXPECT_EQ(dist.summary().count, 0u);

    dist.record(42);
    for (const auto& [key, value] : dist.percentiles()) {
        EXPECT_EQ(value, 42.0) << key;
    }
}

TEST(DistributionMetric, RejectsBadConfiguration) {
    EXPECT_THROW(DistributionMetric{distributionConfig(0)}, std::invalid_argument);

    DistributionConfig badName = distributionConfig();
    badName.name = "9lives";
    EXPECT_THROW(DistributionMetric{badName}, std::invalid_argument);
}

TEST(DistributionMetric, ToMetricUsesConfiguredPercentiles) {
    DistributionMetric dist(DistributionUtils::responseTimeDistribution("api.response_time"));
    for (int v = 1; v <= 100; ++v) {
        dist.record(v);
    }

    Metric m = dist.toMetric();
    EXPECT_EQ(m.type, MetricType::DISTRIBUTION);
    const auto& value = std::get<DistributionValue>(m.value);
    EXPECT_EQ(value.values.size(), 100u);
    EXPECT_EQ(value.percentiles.size(), 5u);
    EXPECT_EQ(value.percentiles.count("99.9"), 1u);
    EXPECT_DOUBLE_EQ(numericValue(m.value), 50.5);
}

// ============================================================================
// HELPERS
// ============================================================================

TEST(HistogramUtils, BucketGenerators) {
    EXPECT_EQ(HistogramUtils::linearBuckets(0, 10, 4), (std::vector<double>{0, 10, 20, 30}));
    EXPECT_EQ(HistogramUtils::exponentialBuckets(1, 2, 4), (std::vector<double>{1, 2, 4, 8}));

    auto logBuckets = HistogramUtils::logarithmicBuckets(1, 1000, 4);
    ASSERT_EQ(logBuckets.size(), 4u);
    EXPECT_NEAR(logBuckets[0], 1.0, 1e-9);
    EXPECT_NEAR(logBuckets[1], 10.0, 1e-9);
    EXPECT_NEAR(logBuckets[2], 100.0, 1e-9);
    EXPECT_NEAR(logBuckets[3], 1000.0, 1e-6);

    EXPECT_THROW(HistogramUtils::logarithmicBuckets(0, 10, 3), std::invalid_argument);
    EXPECT_THROW(HistogramUtils::logarithmicBuckets(10, 1, 3), std::invalid_argument);
    EXPECT_THROW(HistogramUtils::logarithmicBuckets(1, 10, 1), std::invalid_argument);
}

TEST(HistogramUtils, PresetsAreSorted) {
    for (const auto& buckets : {HistogramUtils::httpResponseTimeBuckets(),
                                HistogramUtils::databaseQueryTimeBuckets(),
                                HistogramUtils::memoryUsageBuckets(),
                                HistogramUtils::cpuUsageBuckets()}) {
        EXPECT_TRUE(std::is_sorted(buckets.begin(), buckets.end()));
    }
    EXPECT_NO_THROW(HistogramMetric{HistogramUtils::cpuUsageHistogram("host.cpu")});
}

TEST(HistogramUtils, PercentileKeys) {
    EXPECT_EQ(HistogramUtils::percentileKey(50), "50");
    EXPECT_EQ(HistogramUtils::percentileKey(99.9), "99.9");
}

TEST(HistogramUtils, MergeAddsCountsWithMatchingBoundaries) {
    HistogramMetric a(histogramConfig({10, 20}));
    HistogramMetric b(histogramConfig({10, 20}));
    a.observe(5);
    a.observe(15);
    b.observe(15);
    b.observe(50);

    auto merged = HistogramUtils::mergeHistograms({a.buckets(), b.buckets()});
    EXPECT_EQ(merged.counts, (std::vector<int64_t>{1, 2}));
    EXPECT_EQ(merged.count, 4);
    EXPECT_DOUBLE_EQ(merged.sum, 85.0);

    HistogramMetric other(histogramConfig({10, 30}));
    EXPECT_THROW(HistogramUtils::mergeHistograms({a.buckets(), other.buckets()}), std::invalid_argument);
    EXPECT_THROW(HistogramUtils::mergeHistograms({}), std::invalid_argument);
}

TEST(DistributionUtils, MergePoolsValues) {
    DistributionValue a{{1, 3}, {}};
    DistributionValue b{{4, 2}, {}};

    auto merged = DistributionUtils::mergeDistributions({a, b});
    EXPECT_EQ(merged.values, (std::vector<double>{1, 2, 3, 4}));
    EXPECT_NEAR(merged.percentiles.at("50"), 2.5, 1e-9);
    EXPECT_THROW(DistributionUtils::mergeDistributions({}), std::invalid_argument);
}

TEST(DistributionUtils, CompareDetectsShiftedMeans) {
    auto low = DistributionUtils::summarize({1, 2, 3, 4, 5});
    auto high = DistributionUtils::summarize({101, 102, 103, 104, 105});

    auto result = DistributionUtils::compare(low, high);
    EXPECT_DOUBLE_EQ(result.meanDifference, -100.0);
    EXPECT_TRUE(result.isSignificant);
    EXPECT_LT(result.pValue, 0.05);

    auto same = DistributionUtils::compare(low, DistributionUtils::summarize({1, 2, 3, 4, 5}));
    EXPECT_FALSE(same.isSignificant);
    EXPECT_DOUBLE_EQ(same.pValue, 1.0);

    EXPECT_THROW(DistributionUtils::compare(low, DistributionUtils::summarize({7})), std::invalid_argument);
    auto flat = DistributionUtils::summarize({3, 3, 3});
    EXPECT_THROW(DistributionUtils::compare(flat, flat), std::invalid_argument);
}
