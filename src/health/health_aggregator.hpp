/**
 * @file health_aggregator.hpp
 * @brief Reduces system, resource, telemetry and service signals into one status.
 *
 * Four independent checks each produce a HealthReport. The overall status
 * is the worst of the four; recommendations are derived from the issue text.
 * Every collaborator is optional: a missing one degrades the affected check
 * instead of failing the aggregation.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "health/health_report.hpp"
#include "lifecycle/lifecycle_manager.hpp"
#include "resource_monitor/metric_source.hpp"
#include "telemetry/sampler.hpp"
#include "telemetry/telemetry_store.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace model_keeper {

using HealthThresholds = HealthConfig;

/// Collaborators consulted by the checks. Null members are treated as absent.
struct HealthSources {
    const LifecycleManager* lifecycle{nullptr};
    const TelemetryStore* store{nullptr};
    Sampler* sampler{nullptr};            ///< Preferred source of fresh samples
    IMetricSource* source{nullptr};       ///< Fallback when no sampler is wired
};

class HealthAggregator {
public:
    HealthAggregator(HealthThresholds thresholds, HealthSources sources, Logger* logger = nullptr);

    [[nodiscard]] HealthReport check_system();
    [[nodiscard]] HealthReport check_resources();
    [[nodiscard]] HealthReport check_telemetry();
    [[nodiscard]] HealthReport check_service();

    /// Run all four checks, aggregate, and append to the history. Never throws.
    OverallHealth check_health();

    /// "system", "resources", "telemetry" or "service".
    [[nodiscard]] HealthReport run_check(std::string_view kind);

    /**
     * @brief Fold four reports into an OverallHealth (status and
     *        recommendations). Timestamp and uptime are left to the caller.
     */
    [[nodiscard]] static OverallHealth aggregate(HealthReport system,
                                                 HealthReport resources,
                                                 HealthReport telemetry,
                                                 HealthReport service);

    [[nodiscard]] static std::vector<std::string> recommendations(const OverallHealth& health);

    /// Most-recent-last; the last `limit` entries if non-zero.
    [[nodiscard]] std::vector<OverallHealth> history(size_t limit = 0) const;
    void clear_history();

    [[nodiscard]] const HealthThresholds& thresholds() const noexcept { return thresholds_; }

private:
    /// Fresh sample: sampler, else source, else the newest stored sample.
    [[nodiscard]] std::optional<MetricSample> fresh_sample();
    [[nodiscard]] double uptime_seconds(const std::optional<MetricSample>& sample) const;

    HealthReport evaluate_system(const std::optional<MetricSample>& sample) const;
    HealthReport evaluate_resources() const;
    HealthReport evaluate_telemetry(const std::optional<MetricSample>& sample) const;
    HealthReport evaluate_service() const;

    template <typename F>
    HealthReport guarded(const char* check_name, F&& check);

    void remember(const OverallHealth& health);

    HealthThresholds thresholds_;
    HealthSources sources_;
    Logger* logger_;
    SteadyTime started_;

    mutable std::mutex history_mutex_;
    std::deque<OverallHealth> history_;
};

}  // namespace model_keeper
