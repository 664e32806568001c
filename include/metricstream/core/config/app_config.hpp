#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace MetricStream {

using Millis = std::chrono::milliseconds;

// All three values must be strictly positive
struct RetentionPolicy {
    Millis maxAge{std::chrono::hours(24)};
    size_t maxCount = 10000;
    Millis cleanupInterval{std::chrono::minutes(30)};
};

enum class BackendKind : uint8_t {
    IN_MEMORY = 0,
    EXTERNAL = 1,
    HYBRID = 2
};

const char* toString(BackendKind kind);
std::optional<BackendKind> parseBackendKind(const std::string& text);

struct StorageConfiguration {
    size_t maxMetrics = 10000;
    RetentionPolicy retentionPolicy;
    BackendKind backendKind = BackendKind::IN_MEMORY;
    bool enableRingBuffer = true;
    std::optional<std::string> externalUrl;
    std::optional<Millis> connectionTimeout;
};

struct BatchRetryConfig {
    uint32_t maxRetries = 3;
    Millis initialDelay{100};
    Millis maxDelay{std::chrono::seconds(30)};
    double backoffMultiplier = 2.0;
    std::vector<std::string> retryableErrors{"StorageError", "NetworkError", "TimeoutError"};
};

// maxWaitTime must be >= flushInterval
struct BatchConfiguration {
    size_t maxBatchSize = 100;
    Millis flushInterval{std::chrono::seconds(30)};
    Millis maxWaitTime{std::chrono::minutes(5)};
    bool enableAutoFlush = true;
    bool enableBatching = true;
    bool enablePartialFailureRecovery = true;
    BatchRetryConfig retryConfig;
};

} // namespace MetricStream

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    MetricStream::StorageConfiguration storage;
    MetricStream::BatchConfiguration batch;
};

} // namespace AppConfig
