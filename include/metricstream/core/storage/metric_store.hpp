#pragma once

#include <metricstream/core/storage/storage_backend.hpp>
#include <metricstream/core/config/app_config.hpp>
#include <mutex>

namespace MetricStream {

/**
 * @brief The API external collaborators call to record and query metrics.
 *
 * Thin façade over a StorageBackend: no caching, no buffering. All failures
 * surface as StorageError, including metrics whose name or label keys break
 * the grammar (checked before anything reaches the backend).
 */
class MetricStore {
public:
    MetricStore(StorageBackendPtr backend, StorageConfiguration config);

    // Backend built from the configuration (see StorageBackendFactory)
    explicit MetricStore(const StorageConfiguration& config);

    void recordOne(const Metric& metric);
    void recordMany(const std::vector<Metric>& metrics);

    std::vector<Metric> query(const MetricFilter& filter);
    std::vector<Metric> queryByName(const std::string& name);
    std::vector<Metric> queryByTimeRange(Timestamp start, Timestamp end);

    /**
     * @brief Apply the configured retention policy
     * @return Number of metrics removed
     */
    size_t cleanup();

    // Apply an explicit policy (cutoff = now - policy.maxAge)
    size_t cleanup(const RetentionPolicy& policy);

    // Remove everything
    void clear();

    StorageStats stats();

    RetentionPolicy retentionPolicy() const;
    void setRetentionPolicy(const RetentionPolicy& policy);
    StorageConfiguration configuration() const;
    StorageBackend& backend() { return *backend_; }

private:
    StorageBackendPtr backend_;
    mutable std::mutex config_mutex_;
    StorageConfiguration config_;
};

} // namespace MetricStream
