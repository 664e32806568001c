#include <metricstream/core/storage/in_memory_backend.hpp>
#include <metricstream/core/storage/filter_pipeline.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace MetricStream {

InMemoryBackend::InMemoryBackend(size_t capacity) try : buffer_(capacity) {
    spdlog::info("[InMemoryBackend] Initialized (capacity: {}, power of two: {})",
                 capacity, buffer_.isPowerOfTwo());
} catch (const std::invalid_argument&) {
    throw StorageError("init", "In-memory backend needs a positive capacity",
                       std::current_exception());
}

void InMemoryBackend::store(const std::vector<Metric>& metrics) {
    std::lock_guard<std::mutex> lock(storageMutex);
    try {
        size_t evicted = 0;
        if (metrics.size() > buffer_.availableSpace()) {
            evicted = metrics.size() - buffer_.availableSpace();
        }
        buffer_.enqueueBatch(metrics);
        if (evicted > 0) {
            spdlog::debug("[InMemoryBackend] Capacity reached, overwrote {} oldest metrics", evicted);
        }
    } catch (const std::exception&) {
        throw StorageError("store", "Failed to store " + std::to_string(metrics.size()) + " metrics",
                           std::current_exception());
    }
}

std::vector<Metric> InMemoryBackend::retrieve(const MetricFilter& filter) {
    std::vector<Metric> snapshot;
    {
        std::lock_guard<std::mutex> lock(storageMutex);
        try {
            snapshot = buffer_.toArray();
        } catch (const std::exception&) {
            throw StorageError("retrieve", "Failed to retrieve metrics", std::current_exception());
        }
    }
    try {
        return FilterPipeline::apply(std::move(snapshot), filter);
    } catch (const std::exception&) {
        throw StorageError("retrieve", "Failed to filter metrics", std::current_exception());
    }
}

size_t InMemoryBackend::cleanup(Timestamp maxAge, size_t maxCount) {
    std::lock_guard<std::mutex> lock(storageMutex);
    try {
        std::vector<Metric> all = buffer_.toArray();
        size_t removed = 0;

        std::vector<Metric> survivors;
        survivors.reserve(all.size());
        for (auto& m : all) {
            if (m.timestamp < maxAge) {
                ++removed;
            } else {
                survivors.push_back(std::move(m));
            }
        }

        // Count-based trim drops the oldest survivors
        if (survivors.size() > maxCount) {
            size_t excess = survivors.size() - maxCount;
            survivors.erase(survivors.begin(), survivors.begin() + excess);
            removed += excess;
        }

        if (removed > 0) {
            buffer_.clear();
            buffer_.enqueueBatch(survivors);
        }

        spdlog::debug("[InMemoryBackend] Cleanup removed {} metrics, {} remain", removed, buffer_.size());
        return removed;
    } catch (const std::exception&) {
        throw StorageError("cleanup", "Failed to cleanup metrics", std::current_exception());
    }
}

StorageStats InMemoryBackend::stats() {
    std::lock_guard<std::mutex> lock(storageMutex);
    try {
        StorageStats s;
        s.totalMetrics = buffer_.size();
        s.approximateMemoryBytes = buffer_.size() * ESTIMATED_METRIC_BYTES;
        // Callers may supply timestamps out of insertion order
        buffer_.forEach([&s](const Metric& m) {
            if (!s.oldestTimestamp || m.timestamp < *s.oldestTimestamp) s.oldestTimestamp = m.timestamp;
            if (!s.newestTimestamp || m.timestamp > *s.newestTimestamp) s.newestTimestamp = m.timestamp;
        });
        s.backendLabel = name();
        return s;
    } catch (const std::exception&) {
        throw StorageError("stats", "Failed to get storage statistics", std::current_exception());
    }
}

size_t InMemoryBackend::size() const {
    std::lock_guard<std::mutex> lock(storageMutex);
    return buffer_.size();
}

RingBuffer<Metric>::Stats InMemoryBackend::bufferStats() const {
    std::lock_guard<std::mutex> lock(storageMutex);
    return buffer_.stats();
}

} // namespace MetricStream
