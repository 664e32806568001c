#include <metricstream/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <stdexcept>

using namespace MetricStream;

namespace {

YAML::Node require(const YAML::Node& parent, const char* key, const std::string& section) {
    YAML::Node node = parent[key];
    if (!node) {
        throw std::runtime_error("Missing required field: " + section + key);
    }
    return node;
}

template<typename T>
T readAs(const YAML::Node& node, const std::string& field) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for field " + field + ": " + e.what());
    }
}

template<typename T>
T readOr(const YAML::Node& parent, const char* key, const std::string& section, T fallback) {
    YAML::Node node = parent[key];
    if (!node) return fallback;
    return readAs<T>(node, section + key);
}

Millis readDuration(const YAML::Node& parent, const char* key, const std::string& section, Millis fallback) {
    YAML::Node node = parent[key];
    if (!node) return fallback;
    return ConfigLoader::parseDuration(readAs<std::string>(node, section + key));
}

size_t readPositive(const YAML::Node& parent, const char* key, const std::string& section, size_t fallback) {
    YAML::Node node = parent[key];
    if (!node) return fallback;
    long long value = readAs<long long>(node, section + key);
    if (value <= 0) {
        throw std::runtime_error("Field " + section + key + " must be positive");
    }
    return static_cast<size_t>(value);
}

RetentionPolicy loadRetention(const YAML::Node& node) {
    RetentionPolicy policy;
    if (!node) return policy;
    const std::string section = "storage.retention.";
    policy.maxAge = readDuration(node, "max_age", section, policy.maxAge);
    policy.maxCount = readPositive(node, "max_count", section, policy.maxCount);
    policy.cleanupInterval = readDuration(node, "cleanup_interval", section, policy.cleanupInterval);
    if (policy.maxAge.count() <= 0 || policy.cleanupInterval.count() <= 0) {
        throw std::runtime_error("Retention durations must be positive");
    }
    return policy;
}

StorageConfiguration loadStorage(const YAML::Node& node) {
    StorageConfiguration storage;
    const std::string section = "storage.";
    storage.maxMetrics = readPositive(node, "max_metrics", section, storage.maxMetrics);

    std::string backend = readOr<std::string>(node, "backend", section, "in-memory");
    auto kind = parseBackendKind(backend);
    if (!kind) {
        throw std::runtime_error("Unknown storage backend: " + backend);
    }
    storage.backendKind = *kind;
    storage.enableRingBuffer = readOr<bool>(node, "enable_ring_buffer", section, true);

    if (node["external_url"]) {
        storage.externalUrl = readAs<std::string>(node["external_url"], "storage.external_url");
    }
    if (node["connection_timeout"]) {
        storage.connectionTimeout = readDuration(node, "connection_timeout", section, Millis(5000));
    }
    if (storage.backendKind != BackendKind::IN_MEMORY &&
        (!storage.externalUrl || storage.externalUrl->empty())) {
        throw std::runtime_error("storage.external_url is required for the " + backend + " backend");
    }

    storage.retentionPolicy = loadRetention(node["retention"]);
    return storage;
}

BatchRetryConfig loadRetry(const YAML::Node& node) {
    BatchRetryConfig retry;
    if (!node) return retry;
    const std::string section = "batch.retry.";
    retry.maxRetries = readOr<uint32_t>(node, "max_retries", section, retry.maxRetries);
    retry.initialDelay = readDuration(node, "initial_delay", section, retry.initialDelay);
    retry.maxDelay = readDuration(node, "max_delay", section, retry.maxDelay);
    retry.backoffMultiplier = readOr<double>(node, "backoff_multiplier", section, retry.backoffMultiplier);
    if (retry.backoffMultiplier < 1.0) {
        throw std::runtime_error("batch.retry.backoff_multiplier must be >= 1.0");
    }
    if (node["retryable_errors"]) {
        retry.retryableErrors = readAs<std::vector<std::string>>(node["retryable_errors"],
                                                                 "batch.retry.retryable_errors");
    }
    return retry;
}

BatchConfiguration loadBatch(const YAML::Node& node) {
    BatchConfiguration batch;
    if (!node) return batch;
    const std::string section = "batch.";
    batch.maxBatchSize = readPositive(node, "max_batch_size", section, batch.maxBatchSize);
    batch.flushInterval = readDuration(node, "flush_interval", section, batch.flushInterval);
    batch.maxWaitTime = readDuration(node, "max_wait_time", section, batch.maxWaitTime);
    batch.enableAutoFlush = readOr<bool>(node, "enable_auto_flush", section, batch.enableAutoFlush);
    batch.enableBatching = readOr<bool>(node, "enable_batching", section, batch.enableBatching);
    batch.enablePartialFailureRecovery = readOr<bool>(node, "enable_partial_failure_recovery", section,
                                                      batch.enablePartialFailureRecovery);
    batch.retryConfig = loadRetry(node["retry"]);

    if (batch.flushInterval.count() <= 0) {
        throw std::runtime_error("batch.flush_interval must be positive");
    }
    if (batch.maxWaitTime < batch.flushInterval) {
        throw std::runtime_error("batch.max_wait_time must be >= batch.flush_interval");
    }
    return batch;
}

} // namespace

Millis ConfigLoader::parseDuration(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos == text.size()) {
        throw std::runtime_error("Invalid duration: '" + text + "'");
    }

    long long amount = 0;
    try {
        amount = std::stoll(text.substr(0, pos));
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Duration out of range: '" + text + "'");
    }
    std::string unit = text.substr(pos);
    if (unit == "ms") return Millis(amount);
    if (unit == "s") return std::chrono::seconds(amount);
    if (unit == "m") return std::chrono::minutes(amount);
    if (unit == "h") return std::chrono::hours(amount);
    throw std::runtime_error("Invalid duration unit '" + unit + "' in '" + text + "'");
}

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }

    AppConfig::AppConfiguration config;
    config.app_name = readAs<std::string>(require(root, "app_name", ""), "app_name");
    config.version = readAs<std::string>(require(root, "version", ""), "version");

    YAML::Node logging = root["logging"];
    if (logging) {
        config.logging.level = readOr<std::string>(logging, "level", "logging.", config.logging.level);
    }

    config.storage = loadStorage(require(root, "storage", ""));
    config.batch = loadBatch(root["batch"]);

    spdlog::debug("Loaded configuration {} v{} from {}", config.app_name, config.version, path);
    return config;
}
