/**
 * @file health_report.hpp
 * @brief Per-subsystem health reports and the aggregated overall status.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace model_keeper {

/// Subsystem-specific detail value; the aggregator never interprets these.
using DetailValue = std::variant<std::string, double, int64_t, bool>;
using Details = std::map<std::string, DetailValue>;

struct HealthReport {
    Severity severity{Severity::Healthy};
    std::vector<std::string> issues;
    Details details;

    /// Raise severity to at least `level` and record the issue.
    void raise(Severity level, std::string issue) {
        severity = worst(severity, level);
        issues.push_back(std::move(issue));
    }
};

struct OverallHealth {
    Severity status{Severity::Healthy};
    Timestamp timestamp{};
    double uptime_seconds{0.0};
    HealthReport system;
    HealthReport resources;
    HealthReport telemetry;
    HealthReport service;
    std::vector<std::string> recommendations;
    std::optional<std::string> failure;   ///< Set when the pipeline itself failed
};

[[nodiscard]] std::string to_json(const DetailValue& value);
[[nodiscard]] std::string to_json(const HealthReport& report);

/**
 * @brief Render as {status, timestamp, uptime, system_health,
 *        resource_health, telemetry_health, service_health, recommendations}.
 */
[[nodiscard]] std::string to_json(const OverallHealth& health);

}  // namespace model_keeper
