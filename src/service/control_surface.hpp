/**
 * @file control_surface.hpp
 * @brief Inbound operations offered to an external request layer.
 *
 * ControlSurface is the only thing a transport (HTTP, CLI, RPC) needs to
 * hold: it lists resources, triggers lifecycle operations and exposes health
 * and telemetry, each as a typed result and as a JSON rendering. Every
 * collaborator is optional; a missing one yields an "unavailable" failure
 * rather than a crash.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "health/health_aggregator.hpp"
#include "lifecycle/lifecycle_manager.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/sampler.hpp"
#include "telemetry/telemetry_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace model_keeper {

struct OperationOutcome {
    bool ok{false};
    std::string message;              ///< Human-readable reason on failure
    std::optional<ErrorCode> code;    ///< Set on failure
};

/**
 * @brief Current utilisation with a coarse status and the recent trend.
 *
 * Status rules: CPU above 80% or memory above 85% is a warning; disk above
 * 90% or CPU above 95% is critical.
 */
struct PerformanceSummary {
    Severity status{Severity::Healthy};
    Timestamp timestamp{};
    double cpu_percent{0.0};
    double memory_percent{0.0};
    double disk_percent{0.0};
    std::vector<std::string> issues;
    std::optional<MetricTrend> trend;   ///< Over the last 10 stored samples
    double uptime_hours{0.0};
};

/// Build a summary from one sample and an optional trend.
[[nodiscard]] PerformanceSummary summarize_performance(const MetricSample& sample,
                                                       std::optional<MetricTrend> trend);

struct ControlSurfaceParts {
    LifecycleManager* lifecycle{nullptr};
    TelemetryStore* store{nullptr};
    HealthAggregator* health{nullptr};
    MetricsCollector* events{nullptr};
    Sampler* sampler{nullptr};           ///< Fresh samples for the performance summary
};

class ControlSurface {
public:
    explicit ControlSurface(ControlSurfaceParts parts, Logger* logger = nullptr);

    [[nodiscard]] Result<std::vector<ResourceStatus>> list_resources() const;

    OperationOutcome download(const ResourceId& id, bool force = false,
                              std::optional<Millis> timeout = std::nullopt);
    OperationOutcome load(const ResourceId& id, const std::string& device = "auto",
                          std::optional<Millis> timeout = std::nullopt);
    OperationOutcome unload(const ResourceId& id);

    [[nodiscard]] Result<OverallHealth> health();
    [[nodiscard]] Result<std::vector<MetricSample>> telemetry(size_t limit = 0) const;
    [[nodiscard]] Result<std::optional<MetricAverage>> telemetry_average(Millis window) const;

    /// Recorded health aggregations, oldest first; last `limit` if non-zero.
    [[nodiscard]] Result<std::vector<OverallHealth>> health_history(size_t limit = 0) const;

    /**
     * @brief Summary of the current sample (from the sampler, else the newest
     *        stored sample) with the trend over the stored history.
     */
    [[nodiscard]] Result<PerformanceSummary> performance_summary() const;

    // JSON renderings
    [[nodiscard]] std::string list_resources_json() const;
    [[nodiscard]] std::string health_json();
    [[nodiscard]] std::string telemetry_json(size_t limit = 0) const;
    [[nodiscard]] std::string telemetry_average_json(Millis window) const;
    [[nodiscard]] std::string health_history_json(size_t limit = 0) const;
    [[nodiscard]] std::string performance_summary_json() const;

private:
    template <typename Operation>
    OperationOutcome run(const ResourceId& id, const char* operation, Operation&& op);

    ControlSurfaceParts parts_;
    Logger* logger_;
};

[[nodiscard]] std::string to_json(const ResourceStatus& status);
[[nodiscard]] std::string to_json(const MetricSample& sample);
[[nodiscard]] std::string to_json(const MetricAverage& average);
[[nodiscard]] std::string to_json(const OperationOutcome& outcome);
[[nodiscard]] std::string to_json(const PerformanceSummary& summary);

}  // namespace model_keeper
