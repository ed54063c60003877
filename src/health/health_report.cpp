/**
 * @file health_report.cpp
 * @brief JSON rendering of health reports.
 */

#include "health/health_report.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <sstream>

namespace model_keeper {

namespace {

void write_strings(std::ostringstream& oss, const std::vector<std::string>& values) {
    oss << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(values[i]) << '"';
    }
    oss << ']';
}

}  // anonymous namespace

std::string to_json(const DetailValue& value) {
    std::ostringstream oss;
    if (const auto* text = std::get_if<std::string>(&value)) {
        oss << '"' << json_escape(*text) << '"';
    } else if (const auto* real = std::get_if<double>(&value)) {
        if (std::isfinite(*real)) {
            oss << *real;
        } else {
            oss << "null";
        }
    } else if (const auto* integer = std::get_if<int64_t>(&value)) {
        oss << *integer;
    } else {
        oss << (std::get<bool>(value) ? "true" : "false");
    }
    return oss.str();
}

std::string to_json(const HealthReport& report) {
    std::ostringstream oss;
    oss << R"({"status":")" << to_string(report.severity) << "\""
        << R"(,"issues":)";
    write_strings(oss, report.issues);
    oss << R"(,"details":{)";
    bool first = true;
    for (const auto& [key, value] : report.details) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << json_escape(key) << "\":" << to_json(value);
    }
    oss << "}}";
    return oss.str();
}

std::string to_json(const OverallHealth& health) {
    std::ostringstream oss;
    oss << R"({"status":")" << to_string(health.status) << "\""
        << R"(,"timestamp":")" << format_timestamp(health.timestamp) << "\""
        << R"(,"uptime":)" << health.uptime_seconds
        << R"(,"system_health":)" << to_json(health.system)
        << R"(,"resource_health":)" << to_json(health.resources)
        << R"(,"telemetry_health":)" << to_json(health.telemetry)
        << R"(,"service_health":)" << to_json(health.service)
        << R"(,"recommendations":)";
    write_strings(oss, health.recommendations);
    if (health.failure) {
        oss << R"(,"error":")" << json_escape(*health.failure) << "\"";
    }
    oss << "}";
    return oss.str();
}

}  // namespace model_keeper
