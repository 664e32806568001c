#include <spdlog/spdlog.h>
#include <metricstream/core/config/loader.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include <metricstream/core/metrics/histogram.hpp>
#include <metricstream/core/storage/metric_store.hpp>
#include <metricstream/core/processor/batch_processor.hpp>
#include <metricstream/core/retention/retention_sweeper.hpp>

#include <csignal>
#include <cstdlib>
#include <atomic>
#include <random>
#include <thread>
#include <chrono>

using namespace MetricStream;

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    spdlog::info("Signal {} received, shutting down...", signum);
    g_running.store(false, std::memory_order_release);
}

namespace {

constexpr auto REPORT_INTERVAL = std::chrono::seconds(5);
constexpr auto FEED_INTERVAL = std::chrono::milliseconds(100);

std::vector<Metric> syntheticMetrics(std::mt19937& rng, uint64_t tick, HistogramMetric& latencyHist) {
    std::uniform_real_distribution<double> latency(1.0, 250.0);
    std::uniform_real_distribution<double> cpu(0.0, 100.0);

    MetricMetadata metadata;
    metadata.source = "demo-feeder";
    metadata.service = "metricstream";

    const double requestLatency = latency(rng);
    latencyHist.observe(requestLatency);

    std::vector<Metric> metrics;
    metrics.push_back(MetricFactory::createMetric("http.requests.total",
                                                  MetricFactory::number(static_cast<double>(tick)),
                                                  MetricType::COUNTER,
                                                  {{"method", "GET"}, {"route", "/api/metrics"}},
                                                  metadata));
    metrics.push_back(MetricFactory::createMetric("http.request.latency",
                                                  MetricFactory::numberWithUnit(requestLatency, "ms"),
                                                  MetricType::TIMER,
                                                  {{"route", "/api/metrics"}},
                                                  metadata));
    metrics.push_back(MetricFactory::createMetric("host.cpu.usage",
                                                  MetricFactory::numberWithUnit(cpu(rng), "percent"),
                                                  MetricType::GAUGE,
                                                  {{"host", "local"}},
                                                  metadata));
    return metrics;
}

void report(const BatchProcessor& processor, MetricStore& store) {
    BatchStats batch = processor.stats();
    spdlog::info("[STATS] batches={} ok={} failed={} partial={} metrics={} pending={} avg_size={:.1f} avg_ms={:.2f}",
                 batch.totalBatches, batch.successfulBatches, batch.failedBatches,
                 batch.partiallyFailedBatches, batch.totalMetrics, batch.pendingMetrics,
                 batch.averageBatchSize, batch.averageProcessingTimeMs);

    BatchHealthStatus health = processor.healthStatus();
    spdlog::info("[HEALTH] status={} queue={} failure_rate={:.3f}",
                 toString(health.status), health.queueSize, health.failureRate);
    for (const auto& issue : health.issues) {
        spdlog::warn("[HEALTH] {}", issue);
    }

    try {
        StorageStats storage = store.stats();
        spdlog::info("[STORAGE] backend={} metrics={} memory~{}B",
                     storage.backendLabel, storage.totalMetrics, storage.approximateMemoryBytes);
    } catch (const StorageError& e) {
        spdlog::error("[STORAGE] {}", e.what());
    }
}

} // namespace

int main( int argc, char* argv[] ) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("MetricStreamCore version 1.0.0 starting up...");

    const char* configPath = argc > 1 ? argv[1] : "config/config.yaml";
    spdlog::info("Config file: {}", configPath);

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(configPath);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::info("Configuration loaded successfully ({} v{}).", config.app_name, config.version);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        MetricStore store(config.storage);
        BatchProcessor processor(config.batch, store);
        RetentionSweeper sweeper(config.storage.retentionPolicy, store);

        spdlog::info("Starting batch processor...");
        processor.start();

        spdlog::info("Starting retention sweeper...");
        sweeper.start();

        spdlog::info("Initialization complete. Feeding synthetic metrics.");
        spdlog::info("Press Ctrl+C to shutdown");

        HistogramMetric latencyHist(
            HistogramUtils::httpResponseTimeHistogram("http.request.latency.histogram", {{"route", "/api/metrics"}}));

        std::mt19937 rng(std::random_device{}());
        uint64_t tick = 0;
        auto lastReport = std::chrono::steady_clock::now();

        while (g_running.load(std::memory_order_acquire)) {
            try {
                processor.addMany(syntheticMetrics(rng, ++tick, latencyHist));
            } catch (const BatchError& e) {
                spdlog::error("Failed to enqueue metrics: {}", e.what());
            }

            auto now = std::chrono::steady_clock::now();
            if (now - lastReport >= REPORT_INTERVAL) {
                // One histogram snapshot per report window
                PercentileMap p = latencyHist.percentiles();
                spdlog::info("[LATENCY] p50={:.1f}ms p95={:.1f}ms p99={:.1f}ms",
                             p["50"], p["95"], p["99"]);
                try {
                    processor.add(latencyHist.toMetric());
                } catch (const BatchError& e) {
                    spdlog::error("Failed to enqueue latency histogram: {}", e.what());
                }
                latencyHist.reset();

                report(processor, store);
                lastReport = now;
            }
            std::this_thread::sleep_for(FEED_INTERVAL);
        }

        spdlog::info("Shutting down services...");

        processor.stop();
        spdlog::info("Batch processor stopped");

        sweeper.stop();
        spdlog::info("Retention sweeper stopped");

        report(processor, store);
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("MetricStreamCore shutdown complete");
    return 0;
}
