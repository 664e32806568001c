#include <metricstream/core/utils/periodic_task.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace MetricStream {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           std::function<void()> tick,
                           bool runImmediately)
    : name_(std::move(name)),
      interval_(interval),
      tick_(std::move(tick)),
      run_immediately_(runImmediately) {}

PeriodicTask::~PeriodicTask() noexcept {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::debug("[PeriodicTask] {} started (interval: {}ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::debug("[PeriodicTask] {} stopped after {} tick(s)", name_,
                      ticks_.load(std::memory_order_relaxed));
    }
}

void PeriodicTask::loop() {
    if (run_immediately_ && running_.load(std::memory_order_acquire)) {
        runTick();
    }

    while (running_.load(std::memory_order_acquire)) {
        // Interruptible sleep: wait for the interval OR until stop() is called
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        runTick();
    }
}

void PeriodicTask::runTick() {
    ticks_.fetch_add(1, std::memory_order_relaxed);
    try {
        tick_();
    } catch (const std::exception& e) {
        failed_ticks_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[PeriodicTask] {} tick failed: {}", name_, e.what());
    }
}

} // namespace MetricStream
