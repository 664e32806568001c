#pragma once

#include <metricstream/core/storage/storage_backend.hpp>
#include <metricstream/core/storage/external_backend.hpp>
#include <metricstream/core/config/app_config.hpp>

namespace MetricStream {

class StorageBackendFactory {
public:
    static StorageBackendPtr createInMemory(size_t capacity);
    static StorageBackendPtr createExternal(const ExternalStorageConfig& config);
    static StorageBackendPtr createHybrid(size_t inMemoryCapacity, const ExternalStorageConfig& config);

    /**
     * @brief Build the backend described by a StorageConfiguration
     * @throws StorageError on missing externalUrl or a disabled ring buffer
     */
    static StorageBackendPtr fromConfiguration(const StorageConfiguration& config);

    static ExternalStorageConfig externalConfigFrom(const StorageConfiguration& config);
};

} // namespace MetricStream
