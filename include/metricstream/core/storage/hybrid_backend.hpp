#pragma once

#include <metricstream/core/storage/in_memory_backend.hpp>
#include <metricstream/core/storage/external_backend.hpp>
#include <metricstream/core/utils/thread_pool.hpp>
#include <atomic>
#include <memory>

namespace MetricStream {

/**
 * @brief In-memory storage for reads, external storage for persistence.
 *
 * store() writes to memory synchronously and mirrors the batch to the external
 * backend on a background worker. Mirror failures are logged, never reported
 * to the caller. retrieve() consults external storage only when the in-memory
 * result is empty.
 */
class HybridBackend : public StorageBackend {
public:
    HybridBackend(std::shared_ptr<InMemoryBackend> memory,
                  std::shared_ptr<StorageBackend> external);
    ~HybridBackend() override;

    void store(const std::vector<Metric>& metrics) override;
    std::vector<Metric> retrieve(const MetricFilter& filter) override;
    size_t cleanup(Timestamp maxAge, size_t maxCount) override;
    StorageStats stats() override;
    const char* name() const override { return "hybrid-in-memory-external"; }

    size_t pendingMirrorWrites() const { return pending_mirrors_.load(std::memory_order_acquire); }
    uint64_t failedMirrorWrites() const { return failed_mirrors_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<InMemoryBackend> memory_;
    std::shared_ptr<StorageBackend> external_;
    std::atomic<size_t> pending_mirrors_{0};
    std::atomic<uint64_t> failed_mirrors_{0};

    // Declared last: destroyed first, so queued mirrors finish while backends are alive
    ThreadPool mirror_pool_;
};

} // namespace MetricStream
