/**
 * @file health_aggregator.cpp
 * @brief HealthAggregator implementation.
 */

#include "health/health_aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <thread>

namespace model_keeper {

namespace {

constexpr const char* kComponent = "health";

// Fixed pressure levels of the telemetry check
constexpr float kMemoryPressurePercent = 85.0f;
constexpr float kDiskPressurePercent = 90.0f;
constexpr float kCpuTrendRisePoints = 20.0f;

std::string format_fixed(double value, int precision = 1) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool any_issue_mentions(const HealthReport& report, std::string_view needle) {
    return std::any_of(report.issues.begin(), report.issues.end(),
                       [&](const std::string& issue) {
                           return lowercase(issue).find(needle) != std::string::npos;
                       });
}

bool is_pressing(Severity severity) {
    return severity == Severity::Warning || severity == Severity::Critical;
}

/// Map a percentage to Critical / Warning / nothing, recording the issue.
void threshold_check(HealthReport& report, std::string_view label, float value,
                     float warning, float critical) {
    if (value > critical) {
        report.raise(Severity::Critical,
                     "Critical " + std::string{label} + " usage: " + format_fixed(value) + "%");
    } else if (value > warning) {
        report.raise(Severity::Warning,
                     "High " + std::string{label} + " usage: " + format_fixed(value) + "%");
    }
}

}  // anonymous namespace

HealthAggregator::HealthAggregator(HealthThresholds thresholds, HealthSources sources, Logger* logger)
    : thresholds_(thresholds)
    , sources_(sources)
    , logger_(logger)
    , started_(std::chrono::steady_clock::now()) {}

template <typename F>
HealthReport HealthAggregator::guarded(const char* check_name, F&& check) {
    try {
        return check();
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error(kComponent, std::string{check_name} + " check failed: " + e.what());
        }
        HealthReport report;
        report.raise(Severity::Error, std::string{check_name} + " check failed: " + e.what());
        return report;
    }
}

// ─────────────────────────────────────────────
// Public checks
// ─────────────────────────────────────────────

HealthReport HealthAggregator::check_system() {
    return guarded("System", [this] { return evaluate_system(fresh_sample()); });
}

HealthReport HealthAggregator::check_resources() {
    return guarded("Resources", [this] { return evaluate_resources(); });
}

HealthReport HealthAggregator::check_telemetry() {
    return guarded("Telemetry", [this] { return evaluate_telemetry(fresh_sample()); });
}

HealthReport HealthAggregator::check_service() {
    return guarded("Service", [this] { return evaluate_service(); });
}

HealthReport HealthAggregator::run_check(std::string_view kind) {
    if (kind == "system") return check_system();
    if (kind == "resources") return check_resources();
    if (kind == "telemetry") return check_telemetry();
    if (kind == "service") return check_service();

    HealthReport report;
    report.raise(Severity::Error, "Unknown check type: " + std::string{kind});
    return report;
}

// ─────────────────────────────────────────────
// check_health
// ─────────────────────────────────────────────

OverallHealth HealthAggregator::check_health() {
    try {
        std::optional<MetricSample> sample;
        auto system = guarded("System", [&] {
            sample = fresh_sample();
            return evaluate_system(sample);
        });
        auto resources = guarded("Resources", [this] { return evaluate_resources(); });
        auto telemetry = guarded("Telemetry", [&] { return evaluate_telemetry(sample); });
        auto service = guarded("Service", [this] { return evaluate_service(); });

        auto health = aggregate(std::move(system), std::move(resources),
                                std::move(telemetry), std::move(service));
        health.timestamp = std::chrono::system_clock::now();
        health.uptime_seconds = uptime_seconds(sample);

        remember(health);
        if (logger_) {
            logger_->info(kComponent, "Health check completed: "
                                      + std::string{to_string(health.status)});
        }
        return health;
    } catch (const std::exception& e) {
        OverallHealth degraded;
        degraded.status = Severity::Error;
        degraded.timestamp = std::chrono::system_clock::now();
        degraded.failure = e.what();
        degraded.uptime_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_).count();
        if (logger_) {
            logger_->error(kComponent, std::string{"Health check failed: "} + e.what());
        }
        return degraded;
    }
}

OverallHealth HealthAggregator::aggregate(HealthReport system, HealthReport resources,
                                          HealthReport telemetry, HealthReport service) {
    OverallHealth health;
    health.status = worst(worst(system.severity, resources.severity),
                          worst(telemetry.severity, service.severity));
    health.system = std::move(system);
    health.resources = std::move(resources);
    health.telemetry = std::move(telemetry);
    health.service = std::move(service);
    health.recommendations = recommendations(health);
    return health;
}

std::vector<std::string> HealthAggregator::recommendations(const OverallHealth& health) {
    std::vector<std::string> out;

    if (is_pressing(health.system.severity)) {
        if (any_issue_mentions(health.system, "cpu")) {
            out.emplace_back("Consider closing unnecessary applications or processes to reduce CPU usage");
        }
        if (any_issue_mentions(health.system, "memory")) {
            out.emplace_back("Free up memory by closing unused applications or increasing system RAM");
        }
        if (any_issue_mentions(health.system, "disk")) {
            out.emplace_back("Clean up disk space or consider expanding storage capacity");
        }
    }

    if (is_pressing(health.resources.severity)) {
        double percentage = 0.0;
        if (auto it = health.resources.details.find("health_percentage");
            it != health.resources.details.end()) {
            if (const auto* value = std::get_if<double>(&it->second)) percentage = *value;
        }
        if (percentage < 50.0) {
            out.emplace_back("Download and load more models to improve service capabilities");
        }
        out.emplace_back("Inspect resources in error state and consider reloading them");
    }

    if (health.telemetry.severity == Severity::Warning) {
        out.emplace_back("Optimize system performance by addressing resource bottlenecks");
        if (any_issue_mentions(health.telemetry, "temperature")) {
            out.emplace_back("Improve system cooling to reduce CPU temperature");
        }
    }

    if (health.service.severity == Severity::Warning) {
        if (any_issue_mentions(health.service, "memory")) {
            out.emplace_back("Restart the service to free up memory");
        }
        if (any_issue_mentions(health.service, "response")) {
            out.emplace_back("Check system resources and network connectivity");
        }
        if (any_issue_mentions(health.service, "not available")) {
            out.emplace_back("Check service wiring: the lifecycle manager and telemetry store should both be connected");
        }
    }

    bool all_healthy = health.system.severity == Severity::Healthy
                    && health.resources.severity == Severity::Healthy
                    && health.telemetry.severity == Severity::Healthy
                    && health.service.severity == Severity::Healthy;
    if (all_healthy) {
        out.emplace_back("System is operating normally. Continue regular monitoring.");
        out.emplace_back("Consider scheduling automated health checks for early issue detection.");
    }
    return out;
}

// ─────────────────────────────────────────────
// Individual evaluations
// ─────────────────────────────────────────────

HealthReport HealthAggregator::evaluate_system(const std::optional<MetricSample>& sample) const {
    HealthReport report;
    if (!sample) {
        report.raise(Severity::NotAvailable, "Metric source not available");
        return report;
    }

    threshold_check(report, "CPU", sample->cpu_percent,
                    thresholds_.cpu_warning, thresholds_.cpu_critical);
    threshold_check(report, "memory", sample->memory_percent(),
                    thresholds_.memory_warning, thresholds_.memory_critical);
    threshold_check(report, "disk", sample->disk_percent(),
                    thresholds_.disk_warning, thresholds_.disk_critical);

    if (sample->process_count > thresholds_.process_count_warning) {
        report.raise(Severity::Warning,
                     "High process count: " + std::to_string(sample->process_count));
    }

    report.details["cpu_percent"] = static_cast<double>(sample->cpu_percent);
    report.details["memory_percent"] = static_cast<double>(sample->memory_percent());
    report.details["disk_percent"] = static_cast<double>(sample->disk_percent());
    report.details["process_count"] = static_cast<int64_t>(sample->process_count);
    report.details["uptime_hours"] = sample->uptime_seconds() / 3600.0;
    return report;
}

HealthReport HealthAggregator::evaluate_resources() const {
    HealthReport report;
    if (!sources_.lifecycle) {
        report.raise(Severity::NotAvailable, "Lifecycle manager not available");
        return report;
    }

    auto statuses = sources_.lifecycle->list();
    size_t loaded = 0;
    for (const auto& status : statuses) {
        report.details["resource." + status.id] = status.status_label();
        if (status.loaded) ++loaded;

        if (status.last_error) {
            // A loaded resource keeps serving; its last operation still failed.
            report.raise(Severity::Warning,
                         "Resource " + status.id
                         + (status.loaded ? " last operation failed: " : " in error state: ")
                         + status.last_error->message);
        } else if (!status.loaded && status.phase == ResourcePhase::NotDownloaded) {
            report.issues.push_back("Resource " + status.id + " not downloaded");
        }
    }

    auto total = statuses.size();
    double percentage = total > 0 ? 100.0 * static_cast<double>(loaded) / static_cast<double>(total)
                                  : 0.0;
    report.details["total_resources"] = static_cast<int64_t>(total);
    report.details["loaded_resources"] = static_cast<int64_t>(loaded);
    report.details["health_percentage"] = percentage;

    if (total == 0) {
        report.raise(Severity::NotAvailable, "No resources registered");
    } else if (loaded == 0) {
        report.raise(Severity::Critical, "No resources loaded");
    } else if (loaded * 2 < total) {
        report.raise(Severity::Warning, "Less than 50% of resources are loaded");
    }
    return report;
}

HealthReport HealthAggregator::evaluate_telemetry(const std::optional<MetricSample>& sample) const {
    HealthReport report;
    if (!sample) {
        report.raise(Severity::NotAvailable, "Telemetry not available");
        return report;
    }

    if (sample->cpu_temperature_celsius) {
        auto celsius = *sample->cpu_temperature_celsius;
        report.details["cpu_temperature_celsius"] = static_cast<double>(celsius);
        if (celsius > thresholds_.temperature_warning) {
            report.raise(Severity::Warning, "High CPU temperature: " + format_fixed(celsius) + " C");
        }
    }

    if (sample->memory_percent() > kMemoryPressurePercent) {
        report.raise(Severity::Warning,
                     "High memory pressure: " + format_fixed(sample->memory_percent()) + "%");
    }
    if (sample->disk_percent() > kDiskPressurePercent) {
        report.raise(Severity::Warning, "High disk usage affecting performance");
    }

    for (const auto& accelerator : sample->accelerators) {
        auto percent = accelerator.memory_percent();
        if (percent > thresholds_.accelerator_memory_warning) {
            report.raise(Severity::Warning, "High accelerator memory on " + accelerator.name
                                            + ": " + format_fixed(percent) + "%");
        }
    }
    report.details["accelerator_count"] = static_cast<int64_t>(sample->accelerators.size());

    if (sources_.store) {
        report.details["samples_stored"] = static_cast<int64_t>(sources_.store->size());
        if (auto trend = sources_.store->trend(thresholds_.trend_window)) {
            report.details["cpu_trend"] = static_cast<double>(trend->cpu_delta);
            report.details["memory_trend"] = static_cast<double>(trend->memory_delta);
            if (trend->cpu_delta > kCpuTrendRisePoints) {
                report.raise(Severity::Warning,
                             "Rising CPU trend: +" + format_fixed(trend->cpu_delta) + " points over "
                             + std::to_string(trend->window) + " samples");
            }
        }
    }

    report.details["cpu_percent"] = static_cast<double>(sample->cpu_percent);
    report.details["memory_percent"] = static_cast<double>(sample->memory_percent());
    report.details["disk_percent"] = static_cast<double>(sample->disk_percent());
    return report;
}

HealthReport HealthAggregator::evaluate_service() const {
    HealthReport report;

    if (!sources_.lifecycle) {
        report.raise(Severity::Warning, "Lifecycle manager not available");
    }
    if (!sources_.store) {
        report.raise(Severity::Warning, "Telemetry store not available");
    }

    auto probe_start = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(thresholds_.probe_ms));
    auto response_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - probe_start).count();
    if (response_ms > thresholds_.service_response_ms_warning) {
        report.raise(Severity::Warning, "Slow response time: " + format_fixed(response_ms, 2) + " ms");
    }

    auto memory_mb = static_cast<double>(process_resident_bytes()) / (1024.0 * 1024.0);
    if (memory_mb > thresholds_.service_memory_mb_warning) {
        report.raise(Severity::Warning, "High memory usage: " + format_fixed(memory_mb, 2) + " MB");
    }

    report.details["response_time_ms"] = response_ms;
    report.details["memory_usage_mb"] = memory_mb;
    if (sources_.sampler) {
        report.details["sampler_running"] = sources_.sampler->running();
    }
    if (sources_.lifecycle) {
        report.details["loaded_resources"] = static_cast<int64_t>(sources_.lifecycle->loaded_count());
    }
    return report;
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

std::optional<MetricSample> HealthAggregator::fresh_sample() {
    if (sources_.sampler) return sources_.sampler->current();
    if (sources_.source) return sources_.source->collect();
    if (sources_.store) return sources_.store->latest();
    return std::nullopt;
}

double HealthAggregator::uptime_seconds(const std::optional<MetricSample>& sample) const {
    if (sample) {
        auto boot = sample->boot_time;
        if (boot != Timestamp{}) {
            auto since_boot = std::chrono::duration<double>(std::chrono::system_clock::now() - boot);
            if (since_boot.count() > 0.0) return since_boot.count();
        }
    }
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
}

void HealthAggregator::remember(const OverallHealth& health) {
    std::lock_guard lock(history_mutex_);
    history_.push_back(health);
    while (history_.size() > thresholds_.history_capacity) {
        history_.pop_front();
    }
}

std::vector<OverallHealth> HealthAggregator::history(size_t limit) const {
    std::lock_guard lock(history_mutex_);
    size_t count = (limit == 0 || limit > history_.size()) ? history_.size() : limit;
    return {history_.end() - static_cast<std::ptrdiff_t>(count), history_.end()};
}

void HealthAggregator::clear_history() {
    std::lock_guard lock(history_mutex_);
    history_.clear();
}

}  // namespace model_keeper
