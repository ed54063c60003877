/**
 * @file test_health_aggregator.cpp
 * @brief Unit tests for HealthAggregator checks, aggregation and recommendations.
 */

#include "catalog/resource_catalog.hpp"
#include "health/health_aggregator.hpp"
#include "lifecycle/backends.hpp"
#include "lifecycle/lifecycle_manager.hpp"
#include "resource_monitor/metric_source.hpp"
#include "telemetry/telemetry_store.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

using namespace model_keeper;

namespace {

constexpr std::array<Severity, 5> kAllSeverities = {
    Severity::Healthy, Severity::NotAvailable, Severity::Warning, Severity::Error, Severity::Critical};

HealthReport report_with(Severity severity, std::string issue = {}) {
    HealthReport report;
    report.severity = severity;
    if (!issue.empty()) report.issues.push_back(std::move(issue));
    return report;
}

bool contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

bool any_contains(const std::vector<std::string>& values, const std::string& fragment) {
    return std::any_of(values.begin(), values.end(), [&](const std::string& value) {
        return value.find(fragment) != std::string::npos;
    });
}

HealthThresholds fast_thresholds() {
    HealthThresholds thresholds;
    thresholds.probe_ms = 0;
    thresholds.service_memory_mb_warning = 1'000'000;
    return thresholds;
}

class ThrowingSource : public IMetricSource {
public:
    MetricSample collect() override { throw std::runtime_error("sensor offline"); }
    const char* name() const override { return "throwing"; }
};

ResourceDescriptor make_descriptor(const std::string& id) {
    ResourceDescriptor d;
    d.id = id;
    d.name = id;
    d.repo_reference = "acme/" + id;
    return d;
}

}  // namespace

// ─── Aggregation ─────────────────────────────

TEST(HealthAggregateTest, StatusIsWorstOfFour) {
    for (auto system : kAllSeverities) {
        for (auto resources : kAllSeverities) {
            for (auto telemetry : kAllSeverities) {
                for (auto service : kAllSeverities) {
                    auto health = HealthAggregator::aggregate(
                        report_with(system), report_with(resources),
                        report_with(telemetry), report_with(service));
                    auto expected = std::max({system, resources, telemetry, service});
                    ASSERT_EQ(health.status, expected);
                    EXPECT_EQ(health.system.severity, system);
                    EXPECT_EQ(health.service.severity, service);
                }
            }
        }
    }
}

TEST(HealthAggregateTest, AllHealthyRecommendsRoutineMonitoring) {
    auto health = HealthAggregator::aggregate(report_with(Severity::Healthy), report_with(Severity::Healthy),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy));
    EXPECT_EQ(health.status, Severity::Healthy);
    ASSERT_EQ(health.recommendations.size(), 2u);
    EXPECT_EQ(health.recommendations[0], "System is operating normally. Continue regular monitoring.");
}

TEST(HealthAggregateTest, NotAvailableSuppressesRoutineAdvice) {
    auto health = HealthAggregator::aggregate(report_with(Severity::NotAvailable), report_with(Severity::Healthy),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy));
    EXPECT_EQ(health.status, Severity::NotAvailable);
    EXPECT_TRUE(health.recommendations.empty());
}

TEST(HealthAggregateTest, SystemRecommendationsFollowIssues) {
    auto system = report_with(Severity::Critical, "Critical CPU usage: 96.0%");
    system.issues.push_back("High memory usage: 85.0%");
    system.issues.push_back("High disk usage: 90.0%");

    auto health = HealthAggregator::aggregate(std::move(system), report_with(Severity::Healthy),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy));
    EXPECT_TRUE(contains(health.recommendations,
                         "Consider closing unnecessary applications or processes to reduce CPU usage"));
    EXPECT_TRUE(contains(health.recommendations,
                         "Free up memory by closing unused applications or increasing system RAM"));
    EXPECT_TRUE(contains(health.recommendations,
                         "Clean up disk space or consider expanding storage capacity"));
}

TEST(HealthAggregateTest, ErrorSeverityGivesNoSystemAdvice) {
    auto health = HealthAggregator::aggregate(report_with(Severity::Error, "System check failed: cpu"),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy),
                                              report_with(Severity::Healthy));
    EXPECT_TRUE(health.recommendations.empty());
}

TEST(HealthAggregateTest, ResourceRecommendations) {
    auto resources = report_with(Severity::Warning, "Less than 50% of resources are loaded");
    resources.details["health_percentage"] = 25.0;
    auto health = HealthAggregator::aggregate(report_with(Severity::Healthy), std::move(resources),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy));
    EXPECT_TRUE(contains(health.recommendations,
                         "Download and load more models to improve service capabilities"));
    EXPECT_TRUE(contains(health.recommendations,
                         "Inspect resources in error state and consider reloading them"));

    auto mostly_loaded = report_with(Severity::Warning, "Resource x in error state: boom");
    mostly_loaded.details["health_percentage"] = 75.0;
    auto second = HealthAggregator::aggregate(report_with(Severity::Healthy), std::move(mostly_loaded),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy));
    EXPECT_FALSE(contains(second.recommendations,
                          "Download and load more models to improve service capabilities"));
    EXPECT_TRUE(contains(second.recommendations,
                         "Inspect resources in error state and consider reloading them"));
}

TEST(HealthAggregateTest, TelemetryAndServiceRecommendations) {
    auto telemetry = report_with(Severity::Warning, "High CPU temperature: 85.0 C");
    auto service = report_with(Severity::Warning, "Slow response time: 1500.00 ms");
    service.issues.push_back("High memory usage: 900.00 MB");

    auto health = HealthAggregator::aggregate(report_with(Severity::Healthy), report_with(Severity::Healthy),
                                              std::move(telemetry), std::move(service));
    EXPECT_TRUE(contains(health.recommendations,
                         "Optimize system performance by addressing resource bottlenecks"));
    EXPECT_TRUE(contains(health.recommendations, "Improve system cooling to reduce CPU temperature"));
    EXPECT_TRUE(contains(health.recommendations, "Restart the service to free up memory"));
    EXPECT_TRUE(contains(health.recommendations, "Check system resources and network connectivity"));
}

// ─── System check ────────────────────────────

TEST(HealthCheckTest, HighCpuIsCritical) {
    MockMetricSource source;
    source.set_cpu(96.0f);
    TelemetryStore store(10);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, &store, nullptr, &source});

    auto system = aggregator.check_system();
    EXPECT_EQ(system.severity, Severity::Critical);
    EXPECT_TRUE(contains(system.issues, "Critical CPU usage: 96.0%"));
    EXPECT_DOUBLE_EQ(std::get<double>(system.details.at("cpu_percent")), 96.0);
    EXPECT_EQ(std::get<int64_t>(system.details.at("process_count")), 200);

    auto health = aggregator.check_health();
    EXPECT_EQ(health.status, Severity::Critical);
    EXPECT_TRUE(contains(health.recommendations,
                         "Consider closing unnecessary applications or processes to reduce CPU usage"));
}

TEST(HealthCheckTest, WarningBands) {
    MockMetricSource source;
    source.set_cpu(80.0f);
    source.set_memory_percent(85.0f);
    source.set_disk_percent(50.0f);
    source.set_process_count(1500);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, nullptr, nullptr, &source});

    auto system = aggregator.check_system();
    EXPECT_EQ(system.severity, Severity::Warning);
    EXPECT_TRUE(contains(system.issues, "High CPU usage: 80.0%"));
    EXPECT_TRUE(any_contains(system.issues, "High memory usage"));
    EXPECT_FALSE(any_contains(system.issues, "disk"));
    EXPECT_TRUE(contains(system.issues, "High process count: 1500"));
}

TEST(HealthCheckTest, NominalSystemIsHealthy) {
    MockMetricSource source;
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, nullptr, nullptr, &source});
    auto system = aggregator.check_system();
    EXPECT_EQ(system.severity, Severity::Healthy);
    EXPECT_TRUE(system.issues.empty());
}

TEST(HealthCheckTest, NoSourceIsNotAvailable) {
    HealthAggregator aggregator(fast_thresholds(), HealthSources{});
    EXPECT_EQ(aggregator.check_system().severity, Severity::NotAvailable);
    EXPECT_EQ(aggregator.check_telemetry().severity, Severity::NotAvailable);
    EXPECT_EQ(aggregator.check_resources().severity, Severity::NotAvailable);

    auto service = aggregator.check_service();
    EXPECT_EQ(service.severity, Severity::Warning);
    EXPECT_TRUE(contains(service.issues, "Lifecycle manager not available"));
    EXPECT_TRUE(contains(service.issues, "Telemetry store not available"));

    auto health = aggregator.check_health();
    EXPECT_EQ(health.status, Severity::Warning);
    EXPECT_TRUE(any_contains(health.recommendations, "Check service wiring"));
}

TEST(HealthCheckTest, StoreIsFallbackSampleSource) {
    TelemetryStore store(10);
    MetricSample sample;
    sample.timestamp = std::chrono::system_clock::now();
    sample.cpu_percent = 92.0f;
    store.append(sample);

    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, &store, nullptr, nullptr});
    EXPECT_EQ(aggregator.check_system().severity, Severity::Critical);
}

TEST(HealthCheckTest, ThrowingSourceBecomesErrorReport) {
    ThrowingSource source;
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, nullptr, nullptr, &source});

    auto system = aggregator.check_system();
    EXPECT_EQ(system.severity, Severity::Error);
    EXPECT_TRUE(contains(system.issues, "System check failed: sensor offline"));

    auto telemetry = aggregator.run_check("telemetry");
    EXPECT_EQ(telemetry.severity, Severity::Error);
    EXPECT_TRUE(contains(telemetry.issues, "Telemetry check failed: sensor offline"));

    auto health = aggregator.check_health();
    EXPECT_EQ(health.system.severity, Severity::Error);
    EXPECT_EQ(health.telemetry.severity, Severity::NotAvailable);
    EXPECT_EQ(health.status, Severity::Error);
    EXPECT_FALSE(health.failure.has_value());
}

// ─── Telemetry check ─────────────────────────

TEST(HealthCheckTest, TemperatureAndAcceleratorWarnings) {
    MockMetricSource source;
    source.set_temperature(85.0f);
    AcceleratorInfo gpu;
    gpu.name = "card0";
    gpu.memory_total_bytes = 100;
    gpu.memory_used_bytes = 95;
    source.set_accelerators({gpu});
    TelemetryStore store(10);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, &store, nullptr, &source});

    auto telemetry = aggregator.check_telemetry();
    EXPECT_EQ(telemetry.severity, Severity::Warning);
    EXPECT_TRUE(contains(telemetry.issues, "High CPU temperature: 85.0 C"));
    EXPECT_TRUE(any_contains(telemetry.issues, "High accelerator memory on card0"));
    EXPECT_EQ(std::get<int64_t>(telemetry.details.at("accelerator_count")), 1);

    auto health = aggregator.check_health();
    EXPECT_TRUE(contains(health.recommendations, "Improve system cooling to reduce CPU temperature"));
}

TEST(HealthCheckTest, RisingCpuTrend) {
    MockMetricSource source;
    TelemetryStore store(20);
    auto now = std::chrono::system_clock::now();
    for (int i = 0; i < 5; ++i) {
        MetricSample sample;
        sample.timestamp = now + std::chrono::seconds(i);
        sample.cpu_percent = 10.0f + 10.0f * static_cast<float>(i);
        store.append(sample);
    }
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, &store, nullptr, &source});

    auto telemetry = aggregator.check_telemetry();
    EXPECT_EQ(telemetry.severity, Severity::Warning);
    EXPECT_TRUE(any_contains(telemetry.issues, "Rising CPU trend"));
    EXPECT_NEAR(std::get<double>(telemetry.details.at("cpu_trend")), 40.0, 1e-6);
}

// ─── Resources check ─────────────────────────

class ResourceHealthTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
             / ("mk_test_health_" + std::to_string(::getpid()) + "_"
                + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    MockBackend backend_;
};

TEST_F(ResourceHealthTest, ZeroResourcesIsNotAvailable) {
    ResourceCatalog empty;
    LifecycleManager manager(empty, backend_, dir_);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{&manager, nullptr, nullptr, nullptr});

    auto resources = aggregator.check_resources();
    EXPECT_EQ(resources.severity, Severity::NotAvailable);
    EXPECT_TRUE(contains(resources.issues, "No resources registered"));
    EXPECT_EQ(std::get<int64_t>(resources.details.at("total_resources")), 0);
}

TEST_F(ResourceHealthTest, NothingLoadedIsCritical) {
    auto catalog = ResourceCatalog::from_descriptors({make_descriptor("a"), make_descriptor("b")});
    LifecycleManager manager(catalog, backend_, dir_);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{&manager, nullptr, nullptr, nullptr});

    auto resources = aggregator.check_resources();
    EXPECT_EQ(resources.severity, Severity::Critical);
    EXPECT_TRUE(contains(resources.issues, "No resources loaded"));
    EXPECT_TRUE(contains(resources.issues, "Resource a not downloaded"));
    EXPECT_EQ(std::get<std::string>(resources.details.at("resource.a")), "not_downloaded");
}

TEST_F(ResourceHealthTest, LoadedFractionDrivesSeverity) {
    auto catalog = ResourceCatalog::from_descriptors(
        {make_descriptor("a"), make_descriptor("b"), make_descriptor("c")});
    LifecycleManager manager(catalog, backend_, dir_);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{&manager, nullptr, nullptr, nullptr});

    ASSERT_TRUE(manager.download("a").has_value());
    ASSERT_TRUE(manager.load("a", "cpu").has_value());

    auto one_of_three = aggregator.check_resources();
    EXPECT_EQ(one_of_three.severity, Severity::Warning);
    EXPECT_TRUE(contains(one_of_three.issues, "Less than 50% of resources are loaded"));
    EXPECT_EQ(std::get<int64_t>(one_of_three.details.at("loaded_resources")), 1);
    EXPECT_EQ(std::get<std::string>(one_of_three.details.at("resource.a")), "loaded");

    ASSERT_TRUE(manager.download("b").has_value());
    ASSERT_TRUE(manager.load("b", "cpu").has_value());

    auto two_of_three = aggregator.check_resources();
    EXPECT_EQ(two_of_three.severity, Severity::Healthy);
    EXPECT_NEAR(std::get<double>(two_of_three.details.at("health_percentage")), 66.67, 0.01);
}

TEST_F(ResourceHealthTest, ErroredResourceRaisesWarning) {
    auto catalog = ResourceCatalog::from_descriptors({make_descriptor("a"), make_descriptor("b")});
    LifecycleManager manager(catalog, backend_, dir_);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{&manager, nullptr, nullptr, nullptr});

    ASSERT_TRUE(manager.download("a").has_value());
    ASSERT_TRUE(manager.load("a", "cpu").has_value());
    ASSERT_TRUE(manager.download("b").has_value());
    backend_.set_materialize_failure(Error{ErrorCode::ResourceExhausted, "out of memory"});
    ASSERT_FALSE(manager.load("b", "cpu").has_value());

    auto resources = aggregator.check_resources();
    EXPECT_EQ(resources.severity, Severity::Warning);
    EXPECT_TRUE(contains(resources.issues, "Resource b in error state: out of memory"));
    EXPECT_EQ(std::get<std::string>(resources.details.at("resource.b")), "error");
}

TEST_F(ResourceHealthTest, FailedRedownloadOfLoadedResourceRaisesWarning) {
    auto catalog = ResourceCatalog::from_descriptors({make_descriptor("a")});
    LifecycleManager manager(catalog, backend_, dir_);
    HealthAggregator aggregator(fast_thresholds(), HealthSources{&manager, nullptr, nullptr, nullptr});

    ASSERT_TRUE(manager.download("a").has_value());
    ASSERT_TRUE(manager.load("a", "cpu").has_value());
    EXPECT_EQ(aggregator.check_resources().severity, Severity::Healthy);

    backend_.set_fetch_failure("mirror unreachable");
    ASSERT_FALSE(manager.download("a", true).has_value());

    auto status = manager.state("a");
    ASSERT_TRUE(status.has_value());
    ASSERT_TRUE(status->loaded);
    ASSERT_TRUE(status->last_error.has_value());

    auto resources = aggregator.check_resources();
    EXPECT_EQ(resources.severity, Severity::Warning);
    EXPECT_TRUE(any_contains(resources.issues, "Resource a last operation failed: "));
    EXPECT_EQ(std::get<std::string>(resources.details.at("resource.a")), "loaded");
    EXPECT_EQ(std::get<int64_t>(resources.details.at("loaded_resources")), 1);
}

// ─── Dispatch and history ────────────────────

TEST(HealthCheckTest, UnknownCheckKind) {
    HealthAggregator aggregator(fast_thresholds(), HealthSources{});
    auto report = aggregator.run_check("disk");
    EXPECT_EQ(report.severity, Severity::Error);
    EXPECT_TRUE(contains(report.issues, "Unknown check type: disk"));
}

TEST(HealthCheckTest, HistoryIsBounded) {
    auto thresholds = fast_thresholds();
    thresholds.history_capacity = 3;
    MockMetricSource source;
    HealthAggregator aggregator(thresholds, HealthSources{nullptr, nullptr, nullptr, &source});

    for (int i = 0; i < 5; ++i) (void)aggregator.check_health();
    EXPECT_EQ(aggregator.history().size(), 3u);
    EXPECT_EQ(aggregator.history(2).size(), 2u);

    aggregator.clear_history();
    EXPECT_TRUE(aggregator.history().empty());
}

TEST(HealthCheckTest, UptimeComesFromBootTime) {
    MockMetricSource source;
    HealthAggregator aggregator(fast_thresholds(), HealthSources{nullptr, nullptr, nullptr, &source});
    auto health = aggregator.check_health();
    EXPECT_NEAR(health.uptime_seconds, 3600.0, 10.0);
    EXPECT_NE(health.timestamp, Timestamp{});
}

TEST(HealthReportJsonTest, OverallShape) {
    auto health = HealthAggregator::aggregate(report_with(Severity::Healthy), report_with(Severity::Warning, "x"),
                                              report_with(Severity::Healthy), report_with(Severity::Healthy));
    health.resources.details["loaded_resources"] = int64_t{2};
    health.resources.details["ok"] = true;
    auto json = to_json(health);

    EXPECT_NE(json.find(R"("status":"warning")"), std::string::npos);
    EXPECT_NE(json.find(R"("resource_health":{"status":"warning","issues":["x"])"), std::string::npos);
    EXPECT_NE(json.find(R"("loaded_resources":2)"), std::string::npos);
    EXPECT_NE(json.find(R"("ok":true)"), std::string::npos);
    EXPECT_NE(json.find(R"("recommendations":[)"), std::string::npos);
    EXPECT_EQ(json.find(R"("error":)"), std::string::npos);
}
