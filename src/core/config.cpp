/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace model_keeper {

namespace {

template <typename T>
T read_uint(const toml::node_view<toml::node>& node, T fallback) {
    auto value = node.value_or(static_cast<int64_t>(fallback));
    if (value < 0) return fallback;
    return static_cast<T>(value);
}

float read_float(const toml::node_view<toml::node>& node, float fallback) {
    return static_cast<float>(node.value_or(static_cast<double>(fallback)));
}

}  // anonymous namespace

std::filesystem::path Config::catalog_path() const {
    if (service.catalog_file.is_absolute()) return service.catalog_file;
    return service.models_dir / service.catalog_file;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            config.service.name = service["name"].value_or(std::string{config.service.name});
            config.service.models_dir =
                service["models_dir"].value_or(std::string{config.service.models_dir.string()});
            config.service.catalog_file =
                service["catalog_file"].value_or(std::string{config.service.catalog_file.string()});
            config.service.status_interval_ms =
                read_uint(service["status_interval_ms"], config.service.status_interval_ms);
        }

        // [backend]
        if (auto backend = tbl["backend"]; backend.is_table()) {
            config.backend.kind = backend["kind"].value_or(std::string{config.backend.kind});
            config.backend.mirror_dir =
                backend["mirror_dir"].value_or(std::string{config.backend.mirror_dir.string()});
            if (auto* accelerators = backend["accelerators"].as_array()) {
                for (const auto& entry : *accelerators) {
                    if (auto name = entry.value<std::string>()) {
                        config.backend.accelerators.push_back(*name);
                    }
                }
            }
        }

        // [lifecycle]
        if (auto lifecycle = tbl["lifecycle"]; lifecycle.is_table()) {
            config.lifecycle.worker_threads =
                read_uint(lifecycle["worker_threads"], config.lifecycle.worker_threads);
            config.lifecycle.download_timeout_ms =
                read_uint(lifecycle["download_timeout_ms"], config.lifecycle.download_timeout_ms);
            config.lifecycle.load_timeout_ms =
                read_uint(lifecycle["load_timeout_ms"], config.lifecycle.load_timeout_ms);
        }

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            config.monitor.sampling_interval_ms =
                read_uint(monitor["sampling_interval_ms"], config.monitor.sampling_interval_ms);
            config.monitor.history_capacity =
                read_uint(monitor["history_capacity"], config.monitor.history_capacity);
            config.monitor.mock = monitor["mock"].value_or(bool{config.monitor.mock});
            config.monitor.disk_path =
                monitor["disk_path"].value_or(std::string{config.monitor.disk_path.string()});
            config.monitor.stop_grace_ms =
                read_uint(monitor["stop_grace_ms"], config.monitor.stop_grace_ms);
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            auto& h = config.health;
            h.cpu_warning = read_float(health["cpu_warning"], h.cpu_warning);
            h.cpu_critical = read_float(health["cpu_critical"], h.cpu_critical);
            h.memory_warning = read_float(health["memory_warning"], h.memory_warning);
            h.memory_critical = read_float(health["memory_critical"], h.memory_critical);
            h.disk_warning = read_float(health["disk_warning"], h.disk_warning);
            h.disk_critical = read_float(health["disk_critical"], h.disk_critical);
            h.process_count_warning =
                read_uint(health["process_count_warning"], h.process_count_warning);
            h.temperature_warning =
                read_float(health["temperature_warning"], h.temperature_warning);
            h.accelerator_memory_warning =
                read_float(health["accelerator_memory_warning"], h.accelerator_memory_warning);
            h.service_response_ms_warning =
                read_uint(health["service_response_ms_warning"], h.service_response_ms_warning);
            h.service_memory_mb_warning =
                read_uint(health["service_memory_mb_warning"], h.service_memory_mb_warning);
            h.probe_ms = read_uint(health["probe_ms"], h.probe_ms);
            h.history_capacity = read_uint(health["history_capacity"], h.history_capacity);
            h.trend_window = read_uint(health["trend_window"], h.trend_window);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir =
                telemetry["log_dir"].value_or(std::string{config.telemetry.log_dir.string()});
            config.telemetry.log_level =
                telemetry["log_level"].value_or(std::string{config.telemetry.log_level});
            config.telemetry.max_file_size_mb =
                read_uint(telemetry["max_file_size_mb"], config.telemetry.max_file_size_mb);
            config.telemetry.rotate_count =
                read_uint(telemetry["rotate_count"], config.telemetry.rotate_count);
            config.telemetry.events = telemetry["events"].value_or(bool{config.telemetry.events});
        }

        if (config.health.cpu_warning > config.health.cpu_critical
            || config.health.memory_warning > config.health.memory_critical
            || config.health.disk_warning > config.health.disk_critical) {
            return Error{ErrorCode::InvalidArgument,
                         "Health warning thresholds must not exceed critical thresholds"};
        }
        if (config.monitor.history_capacity == 0 || config.health.history_capacity == 0) {
            return Error{ErrorCode::InvalidArgument, "History capacities must be positive"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace model_keeper
