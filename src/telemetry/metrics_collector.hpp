/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "health/health_report.hpp"
#include "resource_monitor/metric_sample.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

namespace model_keeper {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_sample(const MetricSample& sample);
    void record_lifecycle_event(const ResourceId& id, std::string_view operation,
                                bool ok, std::string_view message, Millis duration);
    void record_health(const OverallHealth& health);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_recorded() const noexcept { return events_recorded_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_recorded_{0};

    void emit(std::string_view json_line);
};

}  // namespace model_keeper
