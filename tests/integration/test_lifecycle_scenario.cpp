/**
 * @file test_lifecycle_scenario.cpp
 * @brief Integration tests driving the full daemon wiring:
 *        catalog, backend, lifecycle, sampler, health and control surface.
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

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <unistd.h>

using namespace model_keeper;
using namespace std::chrono_literals;

namespace {

std::filesystem::path scenario_dir() {
    return std::filesystem::temp_directory_path()
         / ("mk_it_" + std::to_string(::getpid()) + "_"
            + ::testing::UnitTest::GetInstance()->current_test_info()->name());
}

HealthThresholds quiet_thresholds() {
    auto thresholds = default_config().health;
    thresholds.probe_ms = 1;
    thresholds.service_memory_mb_warning = 1'000'000;
    return thresholds;
}

ResourceDescriptor descriptor(const std::string& id) {
    ResourceDescriptor d;
    d.id = id;
    d.name = id;
    d.repo_reference = "acme/" + id;
    return d;
}

}  // namespace

// ═══════════════════════════════════════════════
// Lifecycle + Health Scenarios
// ═══════════════════════════════════════════════

TEST(LifecycleScenario, SingleResourceRoundTrip) {
    auto dir = scenario_dir();
    std::filesystem::remove_all(dir);

    auto catalog = ResourceCatalog::from_descriptors({descriptor("R")});
    MockBackend backend({"cuda:0"});
    MockMetricSource source;
    TelemetryStore store(64);
    Logger logger(std::make_unique<NullSink>(), LogLevel::Debug);

    {
        Sampler sampler(source, store, 10ms, &logger);
        sampler.start();

        LifecycleManager manager(catalog, backend, dir / "models", {}, &logger);
        HealthAggregator aggregator(quiet_thresholds(),
                                    HealthSources{&manager, &store, &sampler, &source}, &logger);
        ControlSurface surface(ControlSurfaceParts{&manager, &store, &aggregator, nullptr}, &logger);

        ASSERT_TRUE(surface.download("R").ok);
        ASSERT_TRUE(surface.load("R", "auto").ok);

        auto ref = manager.get("R");
        ASSERT_TRUE(ref.has_value());
        EXPECT_EQ(ref->device, "cuda:0");

        auto resources = surface.list_resources();
        ASSERT_TRUE(resources.has_value());
        ASSERT_EQ(resources->size(), 1u);
        EXPECT_TRUE((*resources)[0].loaded);
        EXPECT_EQ(manager.loaded_count(), 1u);

        auto resource_health = aggregator.run_check("resources");
        EXPECT_EQ(resource_health.severity, Severity::Healthy);
        EXPECT_EQ(std::get<int64_t>(resource_health.details.at("loaded_resources")), 1);
        EXPECT_DOUBLE_EQ(std::get<double>(resource_health.details.at("health_percentage")), 100.0);

        auto health = surface.health();
        ASSERT_TRUE(health.has_value());
        EXPECT_EQ(health->status, Severity::Healthy);

        ASSERT_TRUE(surface.unload("R").ok);
        EXPECT_FALSE(manager.get("R").has_value());
        EXPECT_EQ(manager.state("R")->phase, ResourcePhase::Downloaded);
        EXPECT_EQ(backend.live_handles(), 0u);

        EXPECT_TRUE(sampler.stop(1s));
        EXPECT_GT(store.size(), 0u);
    }

    std::filesystem::remove_all(dir);
}

TEST(LifecycleScenario, EmptyCatalogReportsNotAvailable) {
    auto dir = scenario_dir();
    std::filesystem::remove_all(dir);

    ResourceCatalog catalog;
    MockBackend backend;
    MockMetricSource source;
    TelemetryStore store(8);
    {
        LifecycleManager manager(catalog, backend, dir);
        HealthAggregator aggregator(quiet_thresholds(),
                                    HealthSources{&manager, &store, nullptr, &source});

        auto health = aggregator.check_health();
        EXPECT_EQ(health.resources.severity, Severity::NotAvailable);
        EXPECT_EQ(health.status, Severity::NotAvailable);
    }
    std::filesystem::remove_all(dir);
}

TEST(LifecycleScenario, MaterializeFailureSurfacesInHealth) {
    auto dir = scenario_dir();
    std::filesystem::remove_all(dir);

    auto catalog = ResourceCatalog::from_descriptors({descriptor("big"), descriptor("small")});
    MockBackend backend;
    MockMetricSource source;
    TelemetryStore store(8);
    {
        LifecycleManager manager(catalog, backend, dir);
        HealthAggregator aggregator(quiet_thresholds(),
                                    HealthSources{&manager, &store, nullptr, &source});
        ControlSurface surface(ControlSurfaceParts{&manager, &store, &aggregator, nullptr});

        ASSERT_TRUE(surface.download("big").ok);
        ASSERT_TRUE(surface.download("small").ok);
        ASSERT_TRUE(surface.load("small", "cpu").ok);

        backend.set_materialize_failure(Error{ErrorCode::ResourceExhausted, "CUDA out of memory"});
        auto outcome = surface.load("big", "cpu");
        EXPECT_FALSE(outcome.ok);
        EXPECT_EQ(outcome.code, ErrorCode::ResourceExhausted);

        auto json = surface.list_resources_json();
        EXPECT_NE(json.find(R"("status":"error")"), std::string::npos);
        EXPECT_NE(json.find("CUDA out of memory"), std::string::npos);

        auto health = surface.health();
        ASSERT_TRUE(health.has_value());
        EXPECT_EQ(health->resources.severity, Severity::Warning);
        EXPECT_EQ(health->status, Severity::Warning);

        bool suggests_reload = false;
        for (const auto& r : health->recommendations) {
            if (r.find("error state") != std::string::npos) suggests_reload = true;
        }
        EXPECT_TRUE(suggests_reload);
    }
    std::filesystem::remove_all(dir);
}

TEST(LifecycleScenario, RestartSeesDownloadedArtifacts) {
    auto dir = scenario_dir();
    std::filesystem::remove_all(dir);

    auto catalog = ResourceCatalog::from_descriptors({descriptor("R")});
    MockBackend backend;
    {
        LifecycleManager first(catalog, backend, dir);
        ASSERT_TRUE(first.download("R").has_value());
        ASSERT_TRUE(first.load("R", "cpu").has_value());
    }
    EXPECT_EQ(backend.live_handles(), 0u);

    {
        LifecycleManager second(catalog, backend, dir);
        EXPECT_EQ(second.state("R")->phase, ResourcePhase::Downloaded);
        EXPECT_TRUE(second.load("R", "cpu").has_value());
    }
    EXPECT_EQ(backend.fetch_count(), 1u);
    std::filesystem::remove_all(dir);
}

TEST(LifecycleScenario, EventsAreWrittenAsNdjson) {
    auto dir = scenario_dir();
    std::filesystem::remove_all(dir);

    auto catalog = ResourceCatalog::from_descriptors({descriptor("R")});
    MockBackend backend;
    MockMetricSource source;
    TelemetryStore store(8);
    std::filesystem::path events_path;
    {
        auto sink = std::make_unique<JsonFileSink>(dir / "logs", "events");
        events_path = sink->current_path();
        MetricsCollector events(std::move(sink));

        LifecycleManager manager(catalog, backend, dir / "models");
        HealthAggregator aggregator(quiet_thresholds(),
                                    HealthSources{&manager, &store, nullptr, &source});
        ControlSurface surface(ControlSurfaceParts{&manager, &store, &aggregator, &events});

        EXPECT_TRUE(surface.download("R").ok);
        EXPECT_TRUE(surface.load("R").ok);
        (void)surface.health();
        events.record_sample(source.collect());
        events.flush();
        EXPECT_EQ(events.events_recorded(), 4u);
    }

    std::ifstream ifs(events_path);
    std::string line;
    size_t lines = 0;
    while (std::getline(ifs, line)) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
        ++lines;
    }
    EXPECT_EQ(lines, 4u);
    std::filesystem::remove_all(dir);
}
