/**
 * @file control_surface.cpp
 * @brief ControlSurface implementation and JSON renderings.
 */

#include "service/control_surface.hpp"

#include <chrono>
#include <sstream>

namespace model_keeper {

namespace {

constexpr const char* kComponent = "service";
constexpr size_t kSummaryTrendWindow = 10;

std::string error_json(const Error& error) {
    std::ostringstream oss;
    oss << R"({"error":")" << json_escape(error.message) << "\""
        << R"(,"code":")" << to_string(error.code) << "\"}";
    return oss.str();
}

Error unavailable(const char* what) {
    return Error{ErrorCode::Unavailable, std::string{what} + " unavailable"};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Performance summary
// ─────────────────────────────────────────────

PerformanceSummary summarize_performance(const MetricSample& sample,
                                         std::optional<MetricTrend> trend) {
    PerformanceSummary summary;
    summary.timestamp = sample.timestamp;
    summary.cpu_percent = sample.cpu_percent;
    summary.memory_percent = sample.memory_percent();
    summary.disk_percent = sample.disk_percent();
    summary.trend = trend;
    summary.uptime_hours = sample.uptime_seconds() / 3600.0;

    auto raise = [&summary](Severity severity, const char* issue) {
        summary.status = worst(summary.status, severity);
        summary.issues.emplace_back(issue);
    };
    if (summary.cpu_percent > 80.0) raise(Severity::Warning, "High CPU usage");
    if (summary.memory_percent > 85.0) raise(Severity::Warning, "High memory usage");
    if (summary.disk_percent > 90.0) raise(Severity::Critical, "High disk usage");
    if (summary.cpu_percent > 95.0) raise(Severity::Critical, "Critical CPU usage");
    return summary;
}

// ─────────────────────────────────────────────
// JSON renderings
// ─────────────────────────────────────────────

std::string to_json(const ResourceStatus& status) {
    std::ostringstream oss;
    oss << R"({"id":")" << json_escape(status.id) << "\"";
    if (status.descriptor) {
        const auto& descriptor = *status.descriptor;
        oss << R"(,"name":")" << json_escape(descriptor.name) << "\""
            << R"(,"size":")" << json_escape(descriptor.size_class) << "\""
            << R"(,"kind":")" << json_escape(descriptor.kind) << "\""
            << R"(,"quantization":")" << to_string(descriptor.quantization) << "\""
            << R"(,"max_length":)" << descriptor.max_context_length
            << R"(,"capabilities":[)";
        bool first = true;
        for (const auto& capability : descriptor.capabilities) {
            if (!first) oss << ',';
            first = false;
            oss << '"' << json_escape(capability) << '"';
        }
        oss << ']';
    }
    oss << R"(,"phase":")" << to_string(status.phase) << "\""
        << R"(,"status":")" << status.status_label() << "\""
        << R"(,"loaded":)" << (status.loaded ? "true" : "false");
    if (status.loaded) {
        oss << R"(,"device":")" << json_escape(status.device) << "\""
            << R"(,"footprint_mb":)" << (status.footprint_bytes / (1024 * 1024))
            << R"(,"load_ms":)" << status.load_duration.count();
    }
    if (status.last_error) {
        oss << R"(,"error":")" << json_escape(status.last_error->message) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string to_json(const MetricSample& sample) {
    std::ostringstream oss;
    oss << R"({"timestamp":")" << format_timestamp(sample.timestamp) << "\""
        << R"(,"cpu":{"percent":)" << sample.cpu_percent
        << R"(,"count":)" << sample.cpu_count
        << R"(,"frequency_mhz":)" << sample.cpu_frequency_mhz;
    if (sample.cpu_temperature_celsius) {
        oss << R"(,"temperature":)" << *sample.cpu_temperature_celsius;
    }
    oss << "}"
        << R"(,"memory":{"total":)" << sample.memory_total_bytes
        << R"(,"used":)" << sample.memory_used_bytes
        << R"(,"available":)" << sample.memory_available_bytes
        << R"(,"percent":)" << sample.memory_percent() << "}"
        << R"(,"disk":{"total":)" << sample.disk_total_bytes
        << R"(,"used":)" << sample.disk_used_bytes
        << R"(,"free":)" << sample.disk_free_bytes
        << R"(,"percent":)" << sample.disk_percent() << "}"
        << R"(,"network":{"bytes_sent":)" << sample.network_bytes_sent
        << R"(,"bytes_recv":)" << sample.network_bytes_recv
        << R"(,"packets_sent":)" << sample.network_packets_sent
        << R"(,"packets_recv":)" << sample.network_packets_recv << "}"
        << R"(,"accelerators":[)";
    for (size_t i = 0; i < sample.accelerators.size(); ++i) {
        const auto& accelerator = sample.accelerators[i];
        if (i > 0) oss << ',';
        oss << R"({"id":)" << accelerator.id
            << R"(,"name":")" << json_escape(accelerator.name) << "\""
            << R"(,"memory_total":)" << accelerator.memory_total_bytes
            << R"(,"memory_used":)" << accelerator.memory_used_bytes
            << R"(,"utilization":)" << accelerator.utilization_percent << "}";
    }
    oss << "]"
        << R"(,"process_count":)" << sample.process_count
        << R"(,"uptime":)" << sample.uptime_seconds()
        << "}";
    return oss.str();
}

std::string to_json(const MetricAverage& average) {
    std::ostringstream oss;
    oss << R"({"samples":)" << average.sample_count
        << R"(,"cpu_percent":)" << average.cpu_percent
        << R"(,"memory_percent":)" << average.memory_percent
        << R"(,"disk_percent":)" << average.disk_percent
        << R"(,"network_bytes_sent_per_sec":)" << average.network_bytes_sent_per_sec
        << R"(,"network_bytes_recv_per_sec":)" << average.network_bytes_recv_per_sec
        << "}";
    return oss.str();
}

std::string to_json(const OperationOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"ok":)" << (outcome.ok ? "true" : "false")
        << R"(,"message":")" << json_escape(outcome.message) << "\"";
    if (outcome.code) {
        oss << R"(,"code":")" << to_string(*outcome.code) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string to_json(const PerformanceSummary& summary) {
    std::ostringstream oss;
    oss << R"({"status":")" << to_string(summary.status) << "\""
        << R"(,"timestamp":")" << format_timestamp(summary.timestamp) << "\""
        << R"(,"current_metrics":{"cpu_percent":)" << summary.cpu_percent
        << R"(,"memory_percent":)" << summary.memory_percent
        << R"(,"disk_percent":)" << summary.disk_percent << "}"
        << R"(,"issues":[)";
    for (size_t i = 0; i < summary.issues.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(summary.issues[i]) << '"';
    }
    oss << R"(],"trends":{)";
    if (summary.trend) {
        oss << R"("cpu_trend_percent":)" << summary.trend->cpu_delta
            << R"(,"memory_trend_percent":)" << summary.trend->memory_delta;
    }
    oss << R"(},"uptime_hours":)" << summary.uptime_hours << "}";
    return oss.str();
}

// ─────────────────────────────────────────────
// ControlSurface
// ─────────────────────────────────────────────

ControlSurface::ControlSurface(ControlSurfaceParts parts, Logger* logger)
    : parts_(parts), logger_(logger) {}

template <typename Operation>
OperationOutcome ControlSurface::run(const ResourceId& id, const char* operation, Operation&& op) {
    if (!parts_.lifecycle) {
        auto error = unavailable("Lifecycle manager");
        return OperationOutcome{false, error.message, error.code};
    }

    auto started = std::chrono::steady_clock::now();
    Result<void> result = op(*parts_.lifecycle);
    auto elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - started);

    OperationOutcome outcome;
    if (result) {
        outcome.ok = true;
        outcome.message = std::string{operation} + " of '" + id + "' succeeded";
    } else {
        outcome.message = result.error().message;
        outcome.code = result.error().code;
        if (logger_) {
            logger_->warn(kComponent, std::string{operation} + " request for '" + id
                                      + "' failed: " + outcome.message);
        }
    }

    if (parts_.events) {
        parts_.events->record_lifecycle_event(id, operation, outcome.ok, outcome.message, elapsed);
    }
    return outcome;
}

Result<std::vector<ResourceStatus>> ControlSurface::list_resources() const {
    if (!parts_.lifecycle) return unavailable("Lifecycle manager");
    return parts_.lifecycle->list();
}

OperationOutcome ControlSurface::download(const ResourceId& id, bool force,
                                          std::optional<Millis> timeout) {
    return run(id, "download", [&](LifecycleManager& manager) {
        return manager.download(id, force, timeout);
    });
}

OperationOutcome ControlSurface::load(const ResourceId& id, const std::string& device,
                                      std::optional<Millis> timeout) {
    return run(id, "load", [&](LifecycleManager& manager) {
        return manager.load(id, device, timeout);
    });
}

OperationOutcome ControlSurface::unload(const ResourceId& id) {
    return run(id, "unload", [&](LifecycleManager& manager) {
        return manager.unload(id);
    });
}

Result<OverallHealth> ControlSurface::health() {
    if (!parts_.health) return unavailable("Health aggregator");
    auto health = parts_.health->check_health();
    if (parts_.events) parts_.events->record_health(health);
    return health;
}

Result<std::vector<MetricSample>> ControlSurface::telemetry(size_t limit) const {
    if (!parts_.store) return unavailable("Telemetry store");
    return parts_.store->history(limit);
}

Result<std::optional<MetricAverage>> ControlSurface::telemetry_average(Millis window) const {
    if (!parts_.store) return unavailable("Telemetry store");
    return std::optional<MetricAverage>{parts_.store->average_over(window)};
}

Result<std::vector<OverallHealth>> ControlSurface::health_history(size_t limit) const {
    if (!parts_.health) return unavailable("Health aggregator");
    return parts_.health->history(limit);
}

Result<PerformanceSummary> ControlSurface::performance_summary() const {
    std::optional<MetricSample> sample;
    if (parts_.sampler) {
        sample = parts_.sampler->current();
    } else if (parts_.store) {
        sample = parts_.store->latest();
    }
    if (!sample) {
        return Error{ErrorCode::Unavailable, "No metric sample available"};
    }

    std::optional<MetricTrend> trend;
    if (parts_.store) trend = parts_.store->trend(kSummaryTrendWindow);
    return summarize_performance(*sample, trend);
}

std::string ControlSurface::list_resources_json() const {
    auto resources = list_resources();
    if (!resources) return error_json(resources.error());

    std::ostringstream oss;
    oss << R"({"resources":[)";
    for (size_t i = 0; i < resources->size(); ++i) {
        if (i > 0) oss << ',';
        oss << to_json((*resources)[i]);
    }
    oss << R"(],"total":)" << resources->size() << "}";
    return oss.str();
}

std::string ControlSurface::health_json() {
    auto health = this->health();
    if (!health) return error_json(health.error());
    return to_json(*health);
}

std::string ControlSurface::telemetry_json(size_t limit) const {
    auto samples = telemetry(limit);
    if (!samples) return error_json(samples.error());

    std::ostringstream oss;
    oss << R"({"samples":[)";
    for (size_t i = 0; i < samples->size(); ++i) {
        if (i > 0) oss << ',';
        oss << to_json((*samples)[i]);
    }
    oss << R"(],"count":)" << samples->size() << "}";
    return oss.str();
}

std::string ControlSurface::telemetry_average_json(Millis window) const {
    auto average = telemetry_average(window);
    if (!average) return error_json(average.error());

    std::ostringstream oss;
    oss << R"({"window_ms":)" << window.count() << R"(,"average":)";
    if (*average) {
        oss << to_json(**average);
    } else {
        oss << "null";
    }
    oss << "}";
    return oss.str();
}

std::string ControlSurface::health_history_json(size_t limit) const {
    auto history = health_history(limit);
    if (!history) return error_json(history.error());

    std::ostringstream oss;
    oss << R"({"history":[)";
    for (size_t i = 0; i < history->size(); ++i) {
        if (i > 0) oss << ',';
        oss << to_json((*history)[i]);
    }
    oss << R"(],"count":)" << history->size() << "}";
    return oss.str();
}

std::string ControlSurface::performance_summary_json() const {
    auto summary = performance_summary();
    if (!summary) return error_json(summary.error());
    return to_json(*summary);
}

}  // namespace model_keeper
