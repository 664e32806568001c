// ============================================================================
// EXTERNAL BACKEND UNIT TESTS
// ============================================================================
// Tests for the append-only journal sink
// ============================================================================

#include <gtest/gtest.h>
#include <metricstream/core/storage/external_backend.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include <filesystem>

using namespace MetricStream;

namespace {

ExternalStorageConfig journalConfig(const std::string& path) {
    ExternalStorageConfig config;
    config.url = "file://" + path;
    config.batchSize = 2;
    return config;
}

} // namespace

TEST(ExternalBackend, ConfigDefaults) {
    ExternalStorageConfig config;
    EXPECT_EQ(config.timeout, Millis(5000));
    EXPECT_EQ(config.retryAttempts, 3u);
    EXPECT_EQ(config.batchSize, 100u);
}

TEST(ExternalBackend, RejectsUnsupportedUrls) {
    ExternalStorageConfig http;
    http.url = "http://metrics.example.com";
    EXPECT_THROW(ExternalBackend backend(http), StorageError);

    ExternalStorageConfig emptyPath;
    emptyPath.url = "file://";
    EXPECT_THROW(ExternalBackend backend(emptyPath), StorageError);
}

TEST(ExternalBackend, AppendsRecordsToJournal) {
    std::string path = "unittest/temp_journal.bin";
    std::filesystem::remove(path);

    Metric m = MetricFactory::createMetric("disk.used", MetricFactory::numberWithUnit(42.0, "GB"),
                                           MetricType::GAUGE, {{"mount", "root"}});
    size_t recordSize = ExternalBackend::encodeRecord(m).size();
    {
        ExternalBackend backend(journalConfig(path));
        backend.store({m, m, m});

        auto stats = backend.stats();
        EXPECT_EQ(stats.totalMetrics, 3u);
        EXPECT_EQ(stats.oldestTimestamp, m.timestamp);
        EXPECT_EQ(stats.backendLabel, "external-file://" + path);
    }

    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 3 * recordSize);

    // Reopening appends rather than truncating
    {
        ExternalBackend backend(journalConfig(path));
        backend.store({m});
    }
    EXPECT_EQ(std::filesystem::file_size(path), 4 * recordSize);

    std::filesystem::remove(path);
}

TEST(ExternalBackend, JournalIsWriteOnly) {
    std::string path = "unittest/temp_journal_ro.bin";
    {
        ExternalBackend backend(journalConfig(path));
        backend.store({MetricFactory::createMetric("cpu", MetricFactory::number(1), MetricType::GAUGE)});

        EXPECT_TRUE(backend.retrieve(MetricFilter{}).empty());
        EXPECT_EQ(backend.cleanup(Timestamp::max(), 0), 0u);
        EXPECT_EQ(backend.stats().totalMetrics, 1u);
    }
    std::filesystem::remove(path);
}

TEST(ExternalBackend, UnwritablePathFailsAtConstruction) {
    ExternalStorageConfig config;
    config.url = "file://unittest/no_such_dir/journal.bin";
    EXPECT_THROW(ExternalBackend backend(config), StorageError);
}
