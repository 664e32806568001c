#pragma once

#include <metricstream/core/storage/storage_backend.hpp>
#include <metricstream/core/queues/ring_buffer.hpp>
#include <mutex>

namespace MetricStream {

/**
 * @brief StorageBackend over a single RingBuffer<Metric>.
 *
 * Once `capacity` metrics are held, each new metric silently evicts the oldest.
 * A backend-level mutex serializes the drain path against queries and cleanup.
 */
class InMemoryBackend : public StorageBackend {
public:
    static constexpr size_t ESTIMATED_METRIC_BYTES = 500;

    explicit InMemoryBackend(size_t capacity);
    ~InMemoryBackend() override = default;

    void store(const std::vector<Metric>& metrics) override;
    std::vector<Metric> retrieve(const MetricFilter& filter) override;
    size_t cleanup(Timestamp maxAge, size_t maxCount) override;
    StorageStats stats() override;
    const char* name() const override { return "in-memory-ring-buffer"; }

    size_t size() const;
    size_t capacity() const { return buffer_.capacity(); }
    RingBuffer<Metric>::Stats bufferStats() const;

private:
    mutable std::mutex storageMutex;
    RingBuffer<Metric> buffer_;
};

} // namespace MetricStream
