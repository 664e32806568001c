// Test doubles for storage failure paths
#pragma once

#include <metricstream/core/storage/in_memory_backend.hpp>
#include <atomic>
#include <set>
#include <string>

namespace MetricStream::Testing {

/**
 * In-memory backend whose store() can be switched to fail, either for every
 * call or only for batches containing a metric with a rejected name.
 */
class FlakyBackend : public StorageBackend {
public:
    explicit FlakyBackend(size_t capacity = 1024) : inner_(capacity) {}

    void store(const std::vector<Metric>& metrics) override {
        storeCalls++;
        if (failAll.load()) {
            throw StorageError("store", "backend unavailable");
        }
        for (const auto& m : metrics) {
            if (rejectedNames.count(m.name) > 0) {
                throw StorageError("store", "rejected metric " + m.name);
            }
        }
        inner_.store(metrics);
    }

    std::vector<Metric> retrieve(const MetricFilter& filter) override { return inner_.retrieve(filter); }
    size_t cleanup(Timestamp maxAge, size_t maxCount) override { return inner_.cleanup(maxAge, maxCount); }
    StorageStats stats() override { return inner_.stats(); }
    const char* name() const override { return "flaky"; }

    size_t stored() const { return inner_.size(); }

    std::atomic<bool> failAll{false};
    std::set<std::string> rejectedNames;
    std::atomic<int> storeCalls{0};

private:
    InMemoryBackend inner_;
};

// Backend whose every operation throws a non-storage error
class BrokenBackend : public StorageBackend {
public:
    void store(const std::vector<Metric>&) override { throw std::runtime_error("disk on fire"); }
    std::vector<Metric> retrieve(const MetricFilter&) override { throw std::runtime_error("disk on fire"); }
    size_t cleanup(Timestamp, size_t) override { throw std::runtime_error("disk on fire"); }
    StorageStats stats() override { throw std::runtime_error("disk on fire"); }
    const char* name() const override { return "broken"; }
};

} // namespace MetricStream::Testing
