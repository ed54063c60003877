/**
 * @file main.cpp
 * @brief ModelKeeper daemon entry point.
 *
 * Wires all modules explicitly:
 *   Config → Logger → Catalog → Backend → LifecycleManager
 *          → MetricSource → TelemetryStore → Sampler → HealthAggregator → ControlSurface
 * and tears them down in reverse order.
 */

#include "catalog/resource_catalog.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "health/health_aggregator.hpp"
#include "lifecycle/backends.hpp"
#include "lifecycle/lifecycle_manager.hpp"
#include "resource_monitor/metric_source.hpp"
#include "service/control_surface.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "telemetry/sampler.hpp"
#include "telemetry/telemetry_store.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace model_keeper;

namespace {

constexpr const char* kComponent = "daemon";

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            ModelKeeper v1.0.0             ║
  ║   Model Lifecycle & Health Aggregation    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string models_dir;
    std::string log_dir;
    bool mock = false;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--models-dir" && i + 1 < argc) {
            args.models_dir = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--mock") {
            args.mock = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: model_keeper [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --models-dir <path>  Directory holding downloaded models\n"
                      << "  --log-dir <path>     Log output directory\n"
                      << "  --mock               Use the mock backend and mock metric source\n"
                      << "  --demo               Run download, load, health, unload once, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

LifecycleOptions lifecycle_options(const Config& config) {
    LifecycleOptions options;
    options.worker_threads = config.lifecycle.worker_threads;
    options.download_timeout = Millis(config.lifecycle.download_timeout_ms);
    options.load_timeout = Millis(config.lifecycle.load_timeout_ms);
    return options;
}

std::unique_ptr<IModelBackend> make_backend(const Config& config, Logger& logger) {
    if (config.backend.kind == "mock") {
        logger.info(kComponent, "Using mock model backend");
        return std::make_unique<MockBackend>(config.backend.accelerators);
    }
    if (config.backend.kind != "directory") {
        logger.warn(kComponent, "Unknown backend kind '" + config.backend.kind
                                + "', falling back to directory");
    }
    logger.info(kComponent, "Using directory backend over " + config.backend.mirror_dir.string());
    return std::make_unique<DirectoryBackend>(config.backend.mirror_dir, config.backend.accelerators);
}

std::unique_ptr<IMetricSource> make_metric_source(const Config& config) {
    if (config.monitor.mock) return std::make_unique<MockMetricSource>();
    return std::make_unique<LinuxMetricSource>(config.monitor.disk_path);
}

void log_outcome(Logger& logger, const std::string& what, const OperationOutcome& outcome) {
    if (outcome.ok) {
        logger.info(kComponent, what + ": " + outcome.message);
    } else {
        logger.error(kComponent, what + " failed: " + outcome.message);
    }
}

/**
 * @brief Run the lifecycle once against the mock backend:
 *        download → load → health → unload.
 */
int run_demo(const Config& config, Logger& logger) {
    logger.info(kComponent, "=== Demo Mode ===");

    auto demo_dir = std::filesystem::temp_directory_path() / "model_keeper_demo";
    std::error_code ec;
    std::filesystem::remove_all(demo_dir, ec);

    auto catalog = ResourceCatalog::from_descriptors(ResourceCatalog::builtin_descriptors());
    MockBackend backend;
    backend.set_fetch_delay(std::chrono::milliseconds(50));
    backend.set_materialize_delay(std::chrono::milliseconds(50));

    MockMetricSource source;
    source.set_cpu(35.0f);
    TelemetryStore store(config.monitor.history_capacity);
    Sampler sampler(source, store, std::chrono::milliseconds(100), &logger);
    sampler.start();

    int exit_code = 0;
    {
        LifecycleManager manager(catalog, backend, demo_dir, lifecycle_options(config), &logger);
        HealthAggregator aggregator(config.health,
                                    HealthSources{&manager, &store, &sampler, &source}, &logger);
        ControlSurface surface(ControlSurfaceParts{&manager, &store, &aggregator, nullptr, &sampler},
                               &logger);

        for (const auto& id : {std::string{"codebert-small"}, std::string{"tinyllama"}}) {
            auto downloaded = surface.download(id);
            log_outcome(logger, "Download " + id, downloaded);
            auto loaded = surface.load(id);
            log_outcome(logger, "Load " + id, loaded);
            if (!downloaded.ok || !loaded.ok) exit_code = 1;
        }

        std::cout << surface.list_resources_json() << std::endl;
        std::cout << surface.health_json() << std::endl;
        std::cout << surface.performance_summary_json() << std::endl;

        for (const auto& id : {std::string{"codebert-small"}, std::string{"tinyllama"}}) {
            log_outcome(logger, "Unload " + id, surface.unload(id));
        }
        std::cout << surface.telemetry_average_json(Millis(60'000)) << std::endl;
    }

    if (!sampler.stop(Millis(config.monitor.stop_grace_ms))) exit_code = 1;
    std::filesystem::remove_all(demo_dir, ec);

    logger.info(kComponent, "=== Demo Complete ===");
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        if (config_result.error().code != ErrorCode::NotFound) return 1;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.models_dir.empty()) config.service.models_dir = args.models_dir;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.mock) {
        config.backend.kind = "mock";
        config.monitor.mock = true;
    }

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "model_keeper",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level);
    logger.info(kComponent, config.service.name + " starting...");
    logger.info(kComponent, "Models directory: " + config.service.models_dir.string());

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(config, logger);
    }

    // ── Catalog ──────────────────────────────
    auto catalog_result = ResourceCatalog::load_or_create(config.catalog_path(), &logger);
    if (!catalog_result) {
        logger.error(kComponent, "Cannot load catalog: " + catalog_result.error().message);
        std::cerr << "Cannot load catalog: " << catalog_result.error().message << std::endl;
        return 1;
    }
    const auto& catalog = *catalog_result;

    // ── Backend & Lifecycle ──────────────────
    auto backend = make_backend(config, logger);
    auto manager = std::make_unique<LifecycleManager>(
        catalog, *backend, config.service.models_dir, lifecycle_options(config), &logger);

    // ── Telemetry ────────────────────────────
    auto source = make_metric_source(config);
    TelemetryStore store(config.monitor.history_capacity);

    std::unique_ptr<MetricsCollector> events;
    if (config.telemetry.events && !config.telemetry.log_dir.empty()) {
        events = std::make_unique<MetricsCollector>(std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "events",
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count));
    }

    Sampler sampler(*source, store, Millis(config.monitor.sampling_interval_ms), &logger);
    if (events) {
        sampler.on_sample([&events](const MetricSample& sample) { events->record_sample(sample); });
    }
    sampler.start();
    logger.info(kComponent, "Sampler started (source " + std::string{source->name()}
                            + ", interval " + std::to_string(config.monitor.sampling_interval_ms)
                            + "ms)");

    // ── Health & Control Surface ─────────────
    HealthAggregator aggregator(config.health,
                                HealthSources{manager.get(), &store, &sampler, source.get()},
                                &logger);
    ControlSurface surface(
        ControlSurfaceParts{manager.get(), &store, &aggregator, events.get(), &sampler}, &logger);

    // ── Main Loop ────────────────────────────
    logger.info(kComponent, "Entering main loop. Press Ctrl+C to shutdown.");

    constexpr auto kTick = std::chrono::milliseconds(100);
    auto status_interval = Millis(config.service.status_interval_ms);
    auto next_status = std::chrono::steady_clock::now() + status_interval;

    while (!g_shutdown_requested) {
        if (std::chrono::steady_clock::now() >= next_status) {
            auto health = surface.health();
            if (health) {
                logger.info(kComponent, "Status: " + std::string{to_string(health->status)}
                                        + ", " + std::to_string(manager->loaded_count()) + "/"
                                        + std::to_string(manager->catalog().size()) + " loaded, "
                                        + std::to_string(store.size()) + " samples");
                for (const auto& recommendation : health->recommendations) {
                    logger.debug(kComponent, "Recommendation: " + recommendation);
                }
            }
            if (auto summary = surface.performance_summary(); summary) {
                for (const auto& issue : summary->issues) {
                    logger.warn(kComponent, "Performance: " + issue);
                }
            }
            next_status += status_interval;
        }
        std::this_thread::sleep_for(kTick);
    }

    // ── Graceful Shutdown ────────────────────
    logger.info(kComponent, "Shutdown requested. Cleaning up...");
    if (!sampler.stop(Millis(config.monitor.stop_grace_ms))) {
        logger.warn(kComponent, "Sampler did not stop within the grace period");
    }
    for (const auto& failure : manager->cleanup_all()) {
        logger.warn(kComponent, "Cleanup failure: " + failure.message);
    }
    manager.reset();
    if (events) events->flush();

    logger.info(kComponent, config.service.name + " stopped.");
    logger.flush();
    return 0;
}
