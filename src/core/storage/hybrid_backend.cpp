#include <metricstream/core/storage/hybrid_backend.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace MetricStream {

HybridBackend::HybridBackend(std::shared_ptr<InMemoryBackend> memory,
                             std::shared_ptr<StorageBackend> external)
    : memory_(std::move(memory)),
      external_(std::move(external)),
      mirror_pool_(1) {
    if (!memory_ || !external_) {
        throw StorageError("init", "Hybrid backend needs both an in-memory and an external backend");
    }
    spdlog::info("[HybridBackend] Initialized (memory: {}, external: {})",
                 memory_->name(), external_->name());
}

HybridBackend::~HybridBackend() {
    mirror_pool_.shutdown();
}

void HybridBackend::store(const std::vector<Metric>& metrics) {
    memory_->store(metrics);

    // Fire and forget: mirror failures never reach the caller
    pending_mirrors_.fetch_add(1, std::memory_order_acq_rel);
    auto external = external_;
    bool queued = mirror_pool_.submit([this, external, metrics]() {
        try {
            external->store(metrics);
        } catch (const std::exception& e) {
            failed_mirrors_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[HybridBackend] Failed to store {} metrics to external backend: {}",
                          metrics.size(), e.what());
        }
        pending_mirrors_.fetch_sub(1, std::memory_order_acq_rel);
    });
    if (!queued) {
        pending_mirrors_.fetch_sub(1, std::memory_order_acq_rel);
        failed_mirrors_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[HybridBackend] Mirror worker unavailable, {} metrics kept in memory only",
                      metrics.size());
    }
}

std::vector<Metric> HybridBackend::retrieve(const MetricFilter& filter) {
    auto results = memory_->retrieve(filter);
    if (!results.empty()) {
        return results;
    }
    return external_->retrieve(filter);
}

size_t HybridBackend::cleanup(Timestamp maxAge, size_t maxCount) {
    size_t removed = memory_->cleanup(maxAge, maxCount);
    removed += external_->cleanup(maxAge, maxCount);
    return removed;
}

StorageStats HybridBackend::stats() {
    StorageStats mem = memory_->stats();
    StorageStats ext = external_->stats();

    StorageStats s;
    s.totalMetrics = mem.totalMetrics + ext.totalMetrics;
    s.approximateMemoryBytes = mem.approximateMemoryBytes;

    if (mem.oldestTimestamp && ext.oldestTimestamp) {
        s.oldestTimestamp = std::min(*mem.oldestTimestamp, *ext.oldestTimestamp);
    } else {
        s.oldestTimestamp = mem.oldestTimestamp ? mem.oldestTimestamp : ext.oldestTimestamp;
    }
    if (mem.newestTimestamp && ext.newestTimestamp) {
        s.newestTimestamp = std::max(*mem.newestTimestamp, *ext.newestTimestamp);
    } else {
        s.newestTimestamp = mem.newestTimestamp ? mem.newestTimestamp : ext.newestTimestamp;
    }
    s.backendLabel = name();
    return s;
}

} // namespace MetricStream
