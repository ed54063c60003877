/**
 * @file telemetry_store.hpp
 * @brief Bounded, append-only history of MetricSamples with derived aggregates.
 */

#pragma once

#include "core/types.hpp"
#include "resource_monitor/metric_sample.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace model_keeper {

/**
 * @brief Means over the samples inside a time window.
 */
struct MetricAverage {
    size_t sample_count{0};
    double cpu_percent{0.0};
    double memory_percent{0.0};
    double disk_percent{0.0};
    double network_bytes_sent_per_sec{0.0};   ///< 0 when fewer than two samples qualify
    double network_bytes_recv_per_sec{0.0};
};

/**
 * @brief Newest minus oldest over the last N samples. Coarse rising/falling signal.
 */
struct MetricTrend {
    size_t window{0};
    double cpu_delta{0.0};
    double memory_delta{0.0};
};

/**
 * @brief Fixed-capacity FIFO ring of samples.
 *
 * append() is O(1); once full, each append evicts the oldest sample.
 * All members are safe to call concurrently.
 */
class TelemetryStore {
public:
    static constexpr size_t kDefaultCapacity = 1000;

    explicit TelemetryStore(size_t capacity = kDefaultCapacity);

    void append(MetricSample sample);

    /// Samples oldest-first; only the last `limit` when limit > 0.
    [[nodiscard]] std::vector<MetricSample> history(size_t limit = 0) const;
    [[nodiscard]] std::optional<MetricSample> latest() const;

    /**
     * @brief Mean over samples with timestamp in [now - window, now].
     * @return nullopt when no sample qualifies.
     */
    [[nodiscard]] std::optional<MetricAverage> average_over(
        std::chrono::milliseconds window,
        Timestamp now = std::chrono::system_clock::now()) const;

    /// nullopt with fewer than two samples.
    [[nodiscard]] std::optional<MetricTrend> trend(size_t window_count) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint64_t total_appended() const;
    void clear();

private:
    /// i-th oldest sample; caller holds mutex_.
    [[nodiscard]] const MetricSample& at(size_t i) const;

    const size_t capacity_;
    std::vector<MetricSample> ring_;
    size_t head_{0};        ///< Index of the oldest sample once full
    uint64_t appended_{0};
    mutable std::mutex mutex_;
};

}  // namespace model_keeper
