/**
 * @file metric_sample.hpp
 * @brief Point-in-time system resource snapshot.
 *
 * Produced by an IMetricSource, stored by the TelemetryStore. Immutable once
 * recorded; a default-constructed sample is the all-zero sample used when a
 * reading fails.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace model_keeper {

/**
 * @brief One accelerator device (GPU) as reported by its management interface.
 */
struct AcceleratorInfo {
    uint32_t id{0};
    std::string name;
    uint64_t memory_total_bytes{0};
    uint64_t memory_used_bytes{0};
    float utilization_percent{0.0f};

    [[nodiscard]] float memory_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_used_bytes)
               / static_cast<float>(memory_total_bytes);
    }
};

struct MetricSample {
    Timestamp timestamp{};

    float cpu_percent{0.0f};                          ///< Aggregate CPU [0.0, 100.0]
    uint32_t cpu_count{0};
    float cpu_frequency_mhz{0.0f};

    uint64_t memory_total_bytes{0};
    uint64_t memory_used_bytes{0};
    uint64_t memory_available_bytes{0};

    uint64_t disk_total_bytes{0};
    uint64_t disk_used_bytes{0};
    uint64_t disk_free_bytes{0};

    uint64_t network_bytes_sent{0};                   ///< Cumulative since boot
    uint64_t network_bytes_recv{0};
    uint64_t network_packets_sent{0};
    uint64_t network_packets_recv{0};

    std::vector<AcceleratorInfo> accelerators;        ///< Empty when none present

    uint32_t process_count{0};
    Timestamp boot_time{};
    std::optional<float> cpu_temperature_celsius;

    [[nodiscard]] float memory_percent() const noexcept {
        if (memory_total_bytes == 0 || memory_available_bytes > memory_total_bytes) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }

    [[nodiscard]] float disk_percent() const noexcept {
        if (disk_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(disk_used_bytes)
               / static_cast<float>(disk_total_bytes);
    }

    /// Seconds since boot at the time of the sample; 0 if boot time is unknown.
    [[nodiscard]] double uptime_seconds() const noexcept {
        if (boot_time == Timestamp{} || timestamp < boot_time) return 0.0;
        return std::chrono::duration<double>(timestamp - boot_time).count();
    }
};

}  // namespace model_keeper
