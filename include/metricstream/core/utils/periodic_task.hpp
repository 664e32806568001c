#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace MetricStream {

/**
 * @brief Cancellable fixed-interval background loop.
 *
 * Runs `tick` on a dedicated thread every `interval`. The sleep between ticks
 * is interruptible so stop() returns promptly. A tick that throws is logged
 * and the schedule continues. stop() waits for an in-flight tick to finish;
 * it never interrupts a tick mid-write.
 *
 * Must not be stopped from inside its own tick.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name,
                 std::chrono::milliseconds interval,
                 std::function<void()> tick,
                 bool runImmediately = false);
    ~PeriodicTask() noexcept;

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    std::chrono::milliseconds interval() const { return interval_; }
    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
    uint64_t failedTicks() const { return failed_ticks_.load(std::memory_order_relaxed); }

private:
    void loop();
    void runTick();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> tick_;
    bool run_immediately_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failed_ticks_{0};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace MetricStream
