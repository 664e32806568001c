// ============================================================================
// IN-MEMORY BACKEND UNIT TESTS
// ============================================================================
// Tests for ring-buffer storage, retention cleanup and stats
// ============================================================================

#include <gtest/gtest.h>
#include <metricstream/core/storage/in_memory_backend.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>

using namespace MetricStream;
using namespace std::chrono_literals;

namespace {

Metric metricAt(const std::string& name, Timestamp ts, double value = 1.0) {
    return MetricFactory::createMetric(name, MetricFactory::number(value), MetricType::GAUGE, {}, std::nullopt, ts);
}

std::vector<Metric> series(const std::string& name, size_t count, Timestamp start) {
    std::vector<Metric> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(metricAt(name, start + std::chrono::seconds(i), static_cast<double>(i)));
    }
    return out;
}

} // namespace

// ============================================================================
// STORE / RETRIEVE
// ============================================================================

TEST(InMemoryBackend, StoresAndRetrievesInOrder) {
    InMemoryBackend backend(16);
    auto now = Clock::wall_now();
    backend.store(series("cpu", 5, now));

    auto all = backend.retrieve(MetricFilter{});
    ASSERT_EQ(all.size(), 5u);
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_DOUBLE_EQ(numericValue(all[i].value), static_cast<double>(i));
    }
}

TEST(InMemoryBackend, OverwritesOldestWhenFull) {
    InMemoryBackend backend(10);
    backend.store(series("cpu", 25, Clock::wall_now()));

    auto all = backend.retrieve(MetricFilter{});
    ASSERT_EQ(all.size(), 10u);
    EXPECT_DOUBLE_EQ(numericValue(all.front().value), 15.0);
    EXPECT_DOUBLE_EQ(numericValue(all.back().value), 24.0);
}

TEST(InMemoryBackend, ZeroCapacityFailsWithStorageError) {
    EXPECT_THROW(InMemoryBackend backend(0), StorageError);
}

// ============================================================================
// CLEANUP
// ============================================================================

TEST(InMemoryBackend, CleanupByAge) {
    InMemoryBackend backend(100);
    auto now = Clock::wall_now();
    backend.store(series("old", 10, now - 10min));
    backend.store(series("new", 10, now));

    size_t removed = backend.cleanup(now - 5min, 1000);
    EXPECT_EQ(removed, 10u);

    auto remaining = backend.retrieve(MetricFilter{});
    ASSERT_EQ(remaining.size(), 10u);
    for (const auto& m : remaining) {
        EXPECT_EQ(m.name, "new");
    }
}

TEST(InMemoryBackend, CleanupByCountDropsOldest) {
    InMemoryBackend backend(100);
    backend.store(series("cpu", 80, Clock::wall_now()));

    size_t removed = backend.cleanup(Clock::wall_now() - 24h, 50);
    EXPECT_EQ(removed, 30u);

    auto remaining = backend.retrieve(MetricFilter{});
    ASSERT_EQ(remaining.size(), 50u);
    EXPECT_DOUBLE_EQ(numericValue(remaining.front().value), 30.0);
}

TEST(InMemoryBackend, CleanupWithNothingToRemove) {
    InMemoryBackend backend(8);
    backend.store(series("cpu", 3, Clock::wall_now()));
    EXPECT_EQ(backend.cleanup(Clock::wall_now() - 1h, 10), 0u);
    EXPECT_EQ(backend.size(), 3u);
}

TEST(InMemoryBackend, BufferKeepsWorkingAfterCleanup) {
    InMemoryBackend backend(4);
    backend.store(series("cpu", 4, Clock::wall_now()));
    backend.cleanup(Clock::wall_now() - 1h, 2);
    backend.store(series("mem", 3, Clock::wall_now()));

    auto all = backend.retrieve(MetricFilter{});
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all.front().name, "cpu");
    EXPECT_EQ(all.back().name, "mem");
}

// ============================================================================
// STATS
// ============================================================================

TEST(InMemoryBackend, StatsReportCountsAndBounds) {
    InMemoryBackend backend(32);
    auto empty = backend.stats();
    EXPECT_EQ(empty.totalMetrics, 0u);
    EXPECT_FALSE(empty.oldestTimestamp.has_value());
    EXPECT_EQ(empty.backendLabel, "in-memory-ring-buffer");

    auto start = Clock::wall_now() - 1h;
    backend.store(series("cpu", 4, start));
    auto s = backend.stats();
    EXPECT_EQ(s.totalMetrics, 4u);
    EXPECT_EQ(s.approximateMemoryBytes, 4u * InMemoryBackend::ESTIMATED_METRIC_BYTES);
    EXPECT_EQ(s.oldestTimestamp, start);
    EXPECT_EQ(s.newestTimestamp, start + 3s);

    auto buffer = backend.bufferStats();
    EXPECT_TRUE(buffer.is_power_of_two);
    EXPECT_EQ(buffer.available_space, 28u);
}

TEST(InMemoryBackend, StatsBoundsFollowTimestampsNotArrivalOrder) {
    InMemoryBackend backend(8);
    auto base = Clock::wall_now() - 1h;
    backend.store({metricAt("cpu", base + 10s), metricAt("cpu", base), metricAt("cpu", base + 30s),
                   metricAt("cpu", base + 20s)});

    auto s = backend.stats();
    EXPECT_EQ(s.oldestTimestamp, base);
    EXPECT_EQ(s.newestTimestamp, base + 30s);
}
