/**
 * @file metric_source.hpp
 * @brief Metric source interface and concrete implementations.
 *
 * Provides LinuxMetricSource (reads /proc, /sys, statvfs) and
 * MockMetricSource (testing, demo mode). The source is selected at startup
 * from configuration, so the sampler holds it through IMetricSource.
 */

#pragma once

#include "core/concepts.hpp"
#include "resource_monitor/metric_sample.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace model_keeper {

// ─────────────────────────────────────────────
// IMetricSource
// ─────────────────────────────────────────────

class IMetricSource {
public:
    virtual ~IMetricSource() = default;

    /// Take one sample. Never throws; failures yield a default sample.
    virtual MetricSample collect() = 0;
    virtual const char* name() const = 0;
};

/// Resident set size of the calling process in bytes (0 if unavailable).
[[nodiscard]] uint64_t process_resident_bytes();

// ─────────────────────────────────────────────
// LinuxMetricSource
// ─────────────────────────────────────────────

/**
 * @brief Reads system resources from Linux pseudo-filesystems.
 *
 * Data sources:
 *   /proc/stat            — CPU utilization (delta between calls), boot time
 *   /proc/cpuinfo, cpufreq — core count and frequency
 *   /proc/meminfo         — Memory total and available
 *   statvfs(disk_path)    — Disk usage
 *   /proc/net/dev         — Network byte and packet counters (non-loopback)
 *   /proc/<pid>           — Process count
 *   /sys/class/thermal/   — CPU temperature (hottest zone)
 *   /sys/class/drm/       — Accelerator VRAM and utilization (best effort)
 */
class LinuxMetricSource final : public IMetricSource {
public:
    explicit LinuxMetricSource(std::filesystem::path disk_path = "/",
                               std::filesystem::path proc_root = "/proc",
                               std::filesystem::path sys_root = "/sys");

    MetricSample collect() override;
    const char* name() const override { return "linux"; }

    struct CpuTimesInternal {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    MetricSample sample_once();
    float cpu_percent_since_last();
    std::vector<AcceleratorInfo> read_accelerators() const;

    std::filesystem::path disk_path_;
    std::filesystem::path proc_root_;
    std::filesystem::path sys_root_;

    std::mutex cpu_mutex_;
    std::optional<CpuTimesInternal> prev_cpu_times_;
};

// ─────────────────────────────────────────────
// MockMetricSource
// ─────────────────────────────────────────────

/**
 * @brief Mock metric source for testing and simulation.
 *
 * Returns queued samples first, then the static sample. Thread-safe: tests
 * adjust values while a sampler thread is collecting.
 */
class MockMetricSource final : public IMetricSource {
public:
    MockMetricSource();

    MetricSample collect() override;
    const char* name() const override { return "mock"; }

    // Test helpers — configure what samples are returned
    void push_sample(MetricSample sample);
    void set_static_sample(MetricSample sample);
    void set_cpu(float percent);
    void set_memory_percent(float percent);
    void set_disk_percent(float percent);
    void set_process_count(uint32_t count);
    void set_temperature(std::optional<float> celsius);
    void set_accelerators(std::vector<AcceleratorInfo> accelerators);
    void set_network(uint64_t bytes_sent, uint64_t bytes_recv);

    [[nodiscard]] size_t collect_count() const;

private:
    mutable std::mutex mutex_;
    std::deque<MetricSample> sequence_;
    MetricSample static_sample_;
    size_t collect_count_{0};
};

static_assert(MetricSourceLike<LinuxMetricSource>);
static_assert(MetricSourceLike<MockMetricSource>);

}  // namespace model_keeper
