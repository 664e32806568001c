#include <metricstream/core/storage/external_backend.hpp>
#include <spdlog/spdlog.h>
#include <cstring>
#include <exception>
#include <stdexcept>

namespace MetricStream {

namespace {

constexpr const char* FILE_SCHEME = "file://";

template<typename T>
void appendRaw(std::vector<uint8_t>& buffer, const T& value) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(&value);
    buffer.insert(buffer.end(), bytes, bytes + sizeof(T));
}

void appendString(std::vector<uint8_t>& buffer, const std::string& text) {
    appendRaw(buffer, static_cast<uint32_t>(text.size()));
    buffer.insert(buffer.end(), text.begin(), text.end());
}

} // namespace

ExternalBackend::ExternalBackend(ExternalStorageConfig config)
    : config_(std::move(config)) {
    if (config_.url.rfind(FILE_SCHEME, 0) != 0) {
        spdlog::error("[ExternalBackend] Unsupported storage url {}", config_.url);
        throw StorageError("connect", "Unsupported external storage url: " + config_.url);
    }
    path_ = config_.url.substr(std::strlen(FILE_SCHEME));
    if (path_.empty()) {
        throw StorageError("connect", "External storage url has no path: " + config_.url);
    }
    openJournal();
    spdlog::info("[ExternalBackend] Journaling to {} (batch size: {}, timeout: {}ms)",
                 path_, config_.batchSize, config_.timeout.count());
}

ExternalBackend::~ExternalBackend() {
    if (journalFile.is_open()) {
        journalFile.flush();
        journalFile.close();
    }
}

void ExternalBackend::openJournal() {
    journalFile.open(path_, std::ios::binary | std::ios::app);
    if (!journalFile.is_open()) {
        spdlog::error("[ExternalBackend] Failed to open journal at {}", path_);
        throw StorageError("connect", "Failed to open journal file " + path_);
    }
}

std::vector<uint8_t> ExternalBackend::encodeRecord(const Metric& metric) {
    std::vector<uint8_t> buffer;
    buffer.reserve(64 + metric.id.size() + metric.name.size());

    appendRaw(buffer, static_cast<int64_t>(Clock::to_epoch_ms(metric.timestamp)));
    appendRaw(buffer, static_cast<uint8_t>(metric.type));
    appendString(buffer, metric.id);
    appendString(buffer, metric.name);

    appendRaw(buffer, static_cast<uint8_t>(metric.value.index()));
    appendRaw(buffer, numericValue(metric.value));
    const auto* withUnit = std::get_if<NumberWithUnitValue>(&metric.value);
    appendString(buffer, withUnit ? withUnit->unit : std::string());

    appendRaw(buffer, static_cast<uint32_t>(metric.labels.size()));
    for (const auto& [key, value] : metric.labels) {
        appendString(buffer, key);
        appendString(buffer, value);
    }
    return buffer;
}

void ExternalBackend::writeRecords(const std::vector<Metric>& metrics) {
    size_t sinceFlush = 0;
    for (const auto& m : metrics) {
        std::vector<uint8_t> record = encodeRecord(m);
        journalFile.write(reinterpret_cast<const char*>(record.data()),
                          static_cast<std::streamsize>(record.size()));
        if (++sinceFlush >= config_.batchSize) {
            journalFile.flush();
            sinceFlush = 0;
        }
    }
    journalFile.flush();
    if (!journalFile.good()) {
        throw std::runtime_error("journal write failed for " + path_);
    }
}

void ExternalBackend::store(const std::vector<Metric>& metrics) {
    if (metrics.empty()) return;
    std::lock_guard<std::mutex> lock(journalMutex);

    uint32_t attempts = config_.retryAttempts == 0 ? 1 : config_.retryAttempts;
    for (uint32_t attempt = 1; ; ++attempt) {
        try {
            writeRecords(metrics);
            break;
        } catch (const std::exception& e) {
            if (attempt >= attempts) {
                spdlog::error("[ExternalBackend] Giving up after {} attempt(s): {}", attempt, e.what());
                throw StorageError("store",
                                   "Failed to store " + std::to_string(metrics.size()) +
                                   " metrics to external storage: " + config_.url,
                                   std::current_exception());
            }
            spdlog::warn("[ExternalBackend] Write attempt {} failed: {}, reopening journal",
                         attempt, e.what());
            journalFile.close();
            journalFile.clear();
            journalFile.open(path_, std::ios::binary | std::ios::app);
        }
    }

    journaled_ += metrics.size();
    for (const auto& m : metrics) {
        if (!oldest_ || m.timestamp < *oldest_) oldest_ = m.timestamp;
        if (!newest_ || m.timestamp > *newest_) newest_ = m.timestamp;
    }
    spdlog::debug("[ExternalBackend] Journaled {} metrics (total: {})", metrics.size(), journaled_);
}

std::vector<Metric> ExternalBackend::retrieve(const MetricFilter& /*filter*/) {
    spdlog::debug("[ExternalBackend] retrieve: journal at {} is write-only", path_);
    return {};
}

size_t ExternalBackend::cleanup(Timestamp /*maxAge*/, size_t /*maxCount*/) {
    spdlog::debug("[ExternalBackend] cleanup: journal at {} is append-only", path_);
    return 0;
}

StorageStats ExternalBackend::stats() {
    std::lock_guard<std::mutex> lock(journalMutex);
    StorageStats s;
    s.totalMetrics = journaled_;
    s.approximateMemoryBytes = 0;
    s.oldestTimestamp = oldest_;
    s.newestTimestamp = newest_;
    s.backendLabel = "external-" + config_.url;
    return s;
}

} // namespace MetricStream
