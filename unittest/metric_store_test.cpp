// ============================================================================
// METRIC STORE UNIT TESTS
// ============================================================================
// Tests for the storage façade and backend selection
// ============================================================================

#include <gtest/gtest.h>
#include <metricstream/core/storage/metric_store.hpp>
#include <metricstream/core/storage/backend_factory.hpp>
#include <metricstream/core/storage/in_memory_backend.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include "fake_backends.hpp"
#include <filesystem>

using namespace MetricStream;
using namespace std::chrono_literals;

namespace {

Metric metricAt(const std::string& name, MetricType type, Timestamp ts) {
    return MetricFactory::createMetric(name, MetricFactory::number(1), type, {}, std::nullopt, ts);
}

StorageConfiguration inMemoryConfig(size_t maxMetrics = 1000) {
    StorageConfiguration config;
    config.maxMetrics = maxMetrics;
    return config;
}

} // namespace

// ============================================================================
// RECORD / QUERY
// ============================================================================

TEST(MetricStore, RecordAndQueryByName) {
    MetricStore store(inMemoryConfig());
    auto now = Clock::wall_now();
    store.recordOne(metricAt("cpu", MetricType::GAUGE, now));
    store.recordMany({metricAt("mem", MetricType::GAUGE, now), metricAt("cpu", MetricType::GAUGE, now)});

    EXPECT_EQ(store.queryByName("cpu").size(), 2u);
    EXPECT_EQ(store.queryByName("disk").size(), 0u);
    EXPECT_EQ(store.stats().totalMetrics, 3u);
}

TEST(MetricStore, RejectsMalformedMetrics) {
    MetricStore store(inMemoryConfig());
    auto now = Clock::wall_now();
    Metric bad = metricAt("cpu", MetricType::GAUGE, now);
    bad.name = "bad name!";

    EXPECT_THROW(store.recordOne(bad), StorageError);
    EXPECT_THROW(store.recordMany({metricAt("cpu", MetricType::GAUGE, now), bad}), StorageError);
    EXPECT_EQ(store.stats().totalMetrics, 0u);
}

TEST(MetricStore, QueryByTimeRange) {
    MetricStore store(inMemoryConfig());
    auto now = Clock::wall_now();
    store.recordMany({metricAt("a", MetricType::GAUGE, now - 2h),
                      metricAt("b", MetricType::GAUGE, now - 1h),
                      metricAt("c", MetricType::GAUGE, now)});

    auto result = store.queryByTimeRange(now - 90min, now - 30min);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.front().name, "b");
}

TEST(MetricStore, QueryWithTypeFilterReturnsOnlyThatType) {
    MetricStore store(inMemoryConfig());
    auto now = Clock::wall_now();
    store.recordMany({metricAt("requests", MetricType::COUNTER, now),
                      metricAt("cpu", MetricType::GAUGE, now),
                      metricAt("latency", MetricType::TIMER, now),
                      metricAt("errors", MetricType::COUNTER, now)});

    MetricFilter filter;
    filter.types = {MetricType::COUNTER};
    auto result = store.query(filter);
    ASSERT_EQ(result.size(), 2u);
    for (const auto& m : result) {
        EXPECT_EQ(m.type, MetricType::COUNTER);
    }
}

// ============================================================================
// RETENTION
// ============================================================================

TEST(MetricStore, CleanupAppliesConfiguredPolicy) {
    StorageConfiguration config = inMemoryConfig();
    config.retentionPolicy.maxAge = 5min;
    config.retentionPolicy.maxCount = 1000;
    MetricStore store(config);

    auto now = Clock::wall_now();
    for (int i = 0; i < 10; ++i) {
        store.recordOne(metricAt("old", MetricType::GAUGE, now - 10min));
        store.recordOne(metricAt("new", MetricType::GAUGE, now));
    }

    EXPECT_EQ(store.cleanup(), 10u);
    EXPECT_EQ(store.queryByName("old").size(), 0u);
    EXPECT_EQ(store.queryByName("new").size(), 10u);
}

TEST(MetricStore, CleanupWithExplicitPolicy) {
    MetricStore store(inMemoryConfig());
    auto now = Clock::wall_now();
    for (int i = 0; i < 80; ++i) {
        store.recordOne(metricAt("cpu", MetricType::GAUGE, now));
    }

    RetentionPolicy policy;
    policy.maxCount = 50;
    EXPECT_EQ(store.cleanup(policy), 30u);
    EXPECT_EQ(store.stats().totalMetrics, 50u);
}

TEST(MetricStore, ClearRemovesEverything) {
    MetricStore store(inMemoryConfig());
    store.recordMany({metricAt("a", MetricType::GAUGE, Clock::wall_now()),
                      metricAt("b", MetricType::GAUGE, Clock::wall_now() + 1h)});
    store.clear();
    EXPECT_EQ(store.stats().totalMetrics, 0u);
}

TEST(MetricStore, RetentionPolicyCanBeReplaced) {
    MetricStore store(inMemoryConfig());
    RetentionPolicy policy;
    policy.maxCount = 7;
    store.setRetentionPolicy(policy);
    EXPECT_EQ(store.retentionPolicy().maxCount, 7u);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(MetricStore, BackendFailuresSurfaceAsStorageError) {
    auto backend = std::make_shared<Testing::FlakyBackend>();
    backend->failAll = true;
    MetricStore store(backend, inMemoryConfig());

    try {
        store.recordOne(metricAt("cpu", MetricType::GAUGE, Clock::wall_now()));
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.operation(), "store");
    }
}

TEST(MetricStore, RequiresBackend) {
    EXPECT_THROW(MetricStore(nullptr, inMemoryConfig()), StorageError);
}

// ============================================================================
// BACKEND FACTORY
// ============================================================================

TEST(StorageBackendFactory, BuildsInMemoryBackend) {
    auto backend = StorageBackendFactory::fromConfiguration(inMemoryConfig(64));
    auto* memory = dynamic_cast<InMemoryBackend*>(backend.get());
    ASSERT_NE(memory, nullptr);
    EXPECT_EQ(memory->capacity(), 64u);
}

TEST(StorageBackendFactory, ExternalAndHybridRequireUrl) {
    StorageConfiguration external = inMemoryConfig();
    external.backendKind = BackendKind::EXTERNAL;
    EXPECT_THROW(StorageBackendFactory::fromConfiguration(external), StorageError);

    StorageConfiguration hybrid = inMemoryConfig();
    hybrid.backendKind = BackendKind::HYBRID;
    EXPECT_THROW(StorageBackendFactory::fromConfiguration(hybrid), StorageError);
}

TEST(StorageBackendFactory, RejectsDisabledRingBuffer) {
    StorageConfiguration config = inMemoryConfig();
    config.enableRingBuffer = false;
    EXPECT_THROW(StorageBackendFactory::fromConfiguration(config), StorageError);
}

TEST(StorageBackendFactory, BuildsHybridBackend) {
    std::string path = "unittest/temp_hybrid_journal.bin";
    {
        StorageConfiguration config = inMemoryConfig(32);
        config.backendKind = BackendKind::HYBRID;
        config.externalUrl = "file://" + path;
        config.connectionTimeout = 2s;

        auto backend = StorageBackendFactory::fromConfiguration(config);
        EXPECT_STREQ(backend->name(), "hybrid-in-memory-external");
    }
    std::filesystem::remove(path);
}
