/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace model_keeper {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_sample(const MetricSample& sample) {
    std::ostringstream oss;
    oss << R"({"event":"metric_sample")"
        << R"(,"ts":")" << format_timestamp(sample.timestamp) << "\""
        << R"(,"cpu_pct":)" << sample.cpu_percent
        << R"(,"mem_pct":)" << sample.memory_percent()
        << R"(,"mem_avail_mb":)" << (sample.memory_available_bytes / (1024 * 1024))
        << R"(,"disk_pct":)" << sample.disk_percent()
        << R"(,"net_sent":)" << sample.network_bytes_sent
        << R"(,"net_recv":)" << sample.network_bytes_recv
        << R"(,"processes":)" << sample.process_count
        << R"(,"accelerators":)" << sample.accelerators.size();
    if (sample.cpu_temperature_celsius) {
        oss << R"(,"temp_c":)" << *sample.cpu_temperature_celsius;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_lifecycle_event(const ResourceId& id, std::string_view operation,
                                              bool ok, std::string_view message, Millis duration) {
    std::ostringstream oss;
    oss << R"({"event":"lifecycle")"
        << R"(,"resource":")" << json_escape(id) << "\""
        << R"(,"operation":")" << json_escape(operation) << "\""
        << R"(,"ok":)" << (ok ? "true" : "false")
        << R"(,"message":")" << json_escape(message) << "\""
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_health(const OverallHealth& health) {
    std::ostringstream oss;
    oss << R"({"event":"health")"
        << R"(,"ts":")" << format_timestamp(health.timestamp) << "\""
        << R"(,"status":")" << to_string(health.status) << "\""
        << R"(,"system":")" << to_string(health.system.severity) << "\""
        << R"(,"resources":")" << to_string(health.resources.severity) << "\""
        << R"(,"telemetry":")" << to_string(health.telemetry.severity) << "\""
        << R"(,"service":")" << to_string(health.service.severity) << "\""
        << R"(,"recommendations":)" << health.recommendations.size()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_recorded_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace model_keeper
