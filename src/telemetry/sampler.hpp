/**
 * @file sampler.hpp
 * @brief Background metric sampler feeding the TelemetryStore.
 */

#pragma once

#include "core/logger.hpp"
#include "resource_monitor/metric_source.hpp"
#include "telemetry/telemetry_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace model_keeper {

/**
 * @brief Callback invoked with each background sample after it is stored.
 */
using SampleObserver = std::function<void(const MetricSample&)>;

/**
 * @brief Periodic sampler running on a dedicated std::jthread.
 *
 * Each tick collects one sample and appends it to the store. Between ticks
 * the thread waits on a condition variable bound to its stop_token, so
 * stop() wakes it immediately instead of waiting out the interval.
 */
class Sampler {
public:
    Sampler(IMetricSource& source,
            TelemetryStore& store,
            std::chrono::milliseconds interval = std::chrono::milliseconds(5000),
            Logger* logger = nullptr);
    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    /// Start the background thread. No-op if already running.
    void start();

    /**
     * @brief Request stop and wait at most `grace` for the thread to exit.
     * @return false if the thread did not exit within the grace period. The
     *         thread keeps its stop request and is joined by a later stop()
     *         or by the destructor.
     */
    bool stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    /// Synchronous on-demand sample, independent of the background cadence.
    [[nodiscard]] MetricSample current();

    void on_sample(SampleObserver observer);

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t samples_taken() const noexcept { return samples_taken_.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    void sampling_loop(std::stop_token stop);
    void tick();

    IMetricSource& source_;
    TelemetryStore& store_;
    std::chrono::milliseconds interval_;
    Logger* logger_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::future<void> exited_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> samples_taken_{0};

    std::mutex observers_mutex_;
    std::vector<SampleObserver> observers_;

    // Declared last: destroyed first, so the loop never outlives the members it uses.
    std::jthread sampling_thread_;
};

}  // namespace model_keeper
