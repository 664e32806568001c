#pragma once

#include <metricstream/core/storage/storage_backend.hpp>
#include <metricstream/core/config/app_config.hpp>
#include <fstream>
#include <mutex>
#include <string>

namespace MetricStream {

struct ExternalStorageConfig {
    std::string url;                 // file://<path>
    Millis timeout{5000};
    uint32_t retryAttempts = 3;
    size_t batchSize = 100;          // records written between stream flushes
};

/**
 * @brief Remote sink boundary, realized as an append-only binary journal.
 *
 * Record layout (host byte order):
 *   [ts_ms:i64][type:u8][id_len:u32][id][name_len:u32][name]
 *   [value_kind:u8][value:f64][unit_len:u32][unit]
 *   [label_count:u32]{[key_len:u32][key][val_len:u32][val]}*
 *
 * The journal is write-only: retrieve() returns nothing and cleanup() removes
 * nothing. stats() reports what has been journaled by this instance.
 */
class ExternalBackend : public StorageBackend {
public:
    explicit ExternalBackend(ExternalStorageConfig config);
    ~ExternalBackend() override;

    void store(const std::vector<Metric>& metrics) override;
    std::vector<Metric> retrieve(const MetricFilter& filter) override;
    size_t cleanup(Timestamp maxAge, size_t maxCount) override;
    StorageStats stats() override;
    const char* name() const override { return "external"; }

    const std::string& path() const { return path_; }
    const ExternalStorageConfig& config() const { return config_; }

    static std::vector<uint8_t> encodeRecord(const Metric& metric);

private:
    void openJournal();
    void writeRecords(const std::vector<Metric>& metrics);

    ExternalStorageConfig config_;
    std::string path_;
    std::ofstream journalFile;
    std::mutex journalMutex;

    size_t journaled_ = 0;
    std::optional<Timestamp> oldest_;
    std::optional<Timestamp> newest_;
};

} // namespace MetricStream
