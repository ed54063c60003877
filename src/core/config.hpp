/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace model_keeper {

struct ServiceConfig {
    std::string name = "model-keeper";
    std::filesystem::path models_dir = "./models";
    std::filesystem::path catalog_file = "catalog.toml";   ///< Relative to models_dir
    uint32_t status_interval_ms = 30000;
};

struct BackendConfig {
    std::string kind = "directory";                         ///< "directory", "mock"
    std::filesystem::path mirror_dir = "./mirror";
    std::vector<std::string> accelerators;                  ///< e.g. "cuda:0"
};

struct LifecycleConfig {
    uint32_t worker_threads = 4;
    uint64_t download_timeout_ms = 1800000;                 ///< 0 = unbounded
    uint64_t load_timeout_ms = 600000;                      ///< 0 = unbounded
};

struct MonitorConfig {
    uint32_t sampling_interval_ms = 5000;
    uint32_t history_capacity = 1000;
    bool mock = false;
    std::filesystem::path disk_path = "/";
    uint32_t stop_grace_ms = 2000;
};

struct HealthConfig {
    float cpu_warning = 75.0f;
    float cpu_critical = 90.0f;
    float memory_warning = 80.0f;
    float memory_critical = 90.0f;
    float disk_warning = 85.0f;
    float disk_critical = 95.0f;
    uint32_t process_count_warning = 1000;
    float temperature_warning = 80.0f;
    float accelerator_memory_warning = 90.0f;
    uint32_t service_response_ms_warning = 1000;
    uint32_t service_memory_mb_warning = 500;
    uint32_t probe_ms = 10;
    uint32_t history_capacity = 100;
    uint32_t trend_window = 10;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    bool events = true;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    ServiceConfig service;
    BackendConfig backend;
    LifecycleConfig lifecycle;
    MonitorConfig monitor;
    HealthConfig health;
    TelemetryConfig telemetry;

    /// Catalog location with catalog_file resolved against models_dir.
    [[nodiscard]] std::filesystem::path catalog_path() const;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace model_keeper
