#include <metricstream/core/storage/backend_factory.hpp>
#include <metricstream/core/storage/in_memory_backend.hpp>
#include <metricstream/core/storage/hybrid_backend.hpp>
#include <spdlog/spdlog.h>

namespace MetricStream {

StorageBackendPtr StorageBackendFactory::createInMemory(size_t capacity) {
    return std::make_shared<InMemoryBackend>(capacity);
}

StorageBackendPtr StorageBackendFactory::createExternal(const ExternalStorageConfig& config) {
    return std::make_shared<ExternalBackend>(config);
}

StorageBackendPtr StorageBackendFactory::createHybrid(size_t inMemoryCapacity,
                                                      const ExternalStorageConfig& config) {
    return std::make_shared<HybridBackend>(std::make_shared<InMemoryBackend>(inMemoryCapacity),
                                           std::make_shared<ExternalBackend>(config));
}

ExternalStorageConfig StorageBackendFactory::externalConfigFrom(const StorageConfiguration& config) {
    if (!config.externalUrl || config.externalUrl->empty()) {
        throw StorageError("configure",
                           std::string("External storage URL is required for ") +
                           toString(config.backendKind) + " backend");
    }
    ExternalStorageConfig ext;
    ext.url = *config.externalUrl;
    ext.timeout = config.connectionTimeout.value_or(Millis(5000));
    ext.retryAttempts = 3;
    ext.batchSize = 100;
    return ext;
}

StorageBackendPtr StorageBackendFactory::fromConfiguration(const StorageConfiguration& config) {
    if (config.backendKind != BackendKind::EXTERNAL && !config.enableRingBuffer) {
        throw StorageError("configure", "In-memory storage requires the ring buffer to be enabled");
    }

    switch (config.backendKind) {
        case BackendKind::IN_MEMORY:
            return createInMemory(config.maxMetrics);
        case BackendKind::EXTERNAL:
            return createExternal(externalConfigFrom(config));
        case BackendKind::HYBRID:
            return createHybrid(config.maxMetrics, externalConfigFrom(config));
        default:
            throw StorageError("configure", "Unsupported storage backend");
    }
}

} // namespace MetricStream
