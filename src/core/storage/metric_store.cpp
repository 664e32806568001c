#include <metricstream/core/storage/metric_store.hpp>
#include <metricstream/core/storage/backend_factory.hpp>
#include <metricstream/core/metrics/metric_factory.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace MetricStream {

namespace {

void validateForStore(const Metric& metric) {
    try {
        MetricFactory::validate(metric);
    } catch (const std::invalid_argument& e) {
        throw StorageError("store", e.what());
    }
}

} // namespace

MetricStore::MetricStore(StorageBackendPtr backend, StorageConfiguration config)
    : backend_(std::move(backend)), config_(std::move(config)) {
    if (!backend_) {
        throw StorageError("init", "MetricStore requires a storage backend");
    }
    spdlog::info("[MetricStore] Bound to {} backend (max age: {}ms, max count: {})",
                 backend_->name(), config_.retentionPolicy.maxAge.count(),
                 config_.retentionPolicy.maxCount);
}

MetricStore::MetricStore(const StorageConfiguration& config)
    : MetricStore(StorageBackendFactory::fromConfiguration(config), config) {}

void MetricStore::recordOne(const Metric& metric) {
    validateForStore(metric);
    backend_->store({metric});
}

void MetricStore::recordMany(const std::vector<Metric>& metrics) {
    for (const auto& metric : metrics) {
        validateForStore(metric);
    }
    backend_->store(metrics);
}

std::vector<Metric> MetricStore::query(const MetricFilter& filter) {
    return backend_->retrieve(filter);
}

std::vector<Metric> MetricStore::queryByName(const std::string& name) {
    MetricFilter filter;
    filter.names.push_back(name);
    return backend_->retrieve(filter);
}

std::vector<Metric> MetricStore::queryByTimeRange(Timestamp start, Timestamp end) {
    MetricFilter filter;
    filter.timeRange = TimeRange{start, end};
    return backend_->retrieve(filter);
}

size_t MetricStore::cleanup() {
    return cleanup(retentionPolicy());
}

size_t MetricStore::cleanup(const RetentionPolicy& policy) {
    Timestamp cutoff = Clock::wall_now() - policy.maxAge;
    return backend_->cleanup(cutoff, policy.maxCount);
}

void MetricStore::clear() {
    size_t removed = backend_->cleanup(Timestamp::max(), 0);
    spdlog::info("[MetricStore] Cleared {} metrics", removed);
}

StorageStats MetricStore::stats() {
    return backend_->stats();
}

RetentionPolicy MetricStore::retentionPolicy() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_.retentionPolicy;
}

void MetricStore::setRetentionPolicy(const RetentionPolicy& policy) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.retentionPolicy = policy;
}

StorageConfiguration MetricStore::configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

} // namespace MetricStream
