/**
 * @file test_metric_source.cpp
 * @brief Unit tests for MockMetricSource and LinuxMetricSource.
 */

#include "resource_monitor/metric_source.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace model_keeper;

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

}  // namespace

// ─── MockMetricSource ────────────────────────

TEST(MockMetricSourceTest, DefaultSample) {
    MockMetricSource source;
    auto sample = source.collect();

    EXPECT_FLOAT_EQ(sample.cpu_percent, 25.0f);
    EXPECT_EQ(sample.memory_total_bytes, 16 * kGiB);
    EXPECT_EQ(sample.memory_available_bytes, 10 * kGiB);
    EXPECT_NEAR(sample.memory_percent(), 37.5f, 0.01f);
    EXPECT_NEAR(sample.disk_percent(), 25.0f, 0.01f);
    EXPECT_EQ(sample.process_count, 200u);
    EXPECT_FALSE(sample.cpu_temperature_celsius.has_value());
    EXPECT_TRUE(sample.accelerators.empty());
    EXPECT_NEAR(sample.uptime_seconds(), 3600.0, 5.0);
    EXPECT_STREQ(source.name(), "mock");
}

TEST(MockMetricSourceTest, Setters) {
    MockMetricSource source;
    source.set_cpu(91.0f);
    source.set_memory_percent(87.5f);
    source.set_disk_percent(95.0f);
    source.set_process_count(1200);
    source.set_temperature(82.5f);
    source.set_network(100, 200);

    AcceleratorInfo gpu;
    gpu.name = "card0";
    gpu.memory_total_bytes = 8 * kGiB;
    gpu.memory_used_bytes = 6 * kGiB;
    source.set_accelerators({gpu});

    auto sample = source.collect();
    EXPECT_FLOAT_EQ(sample.cpu_percent, 91.0f);
    EXPECT_NEAR(sample.memory_percent(), 87.5f, 0.01f);
    EXPECT_NEAR(sample.disk_percent(), 95.0f, 0.01f);
    EXPECT_EQ(sample.process_count, 1200u);
    ASSERT_TRUE(sample.cpu_temperature_celsius.has_value());
    EXPECT_FLOAT_EQ(*sample.cpu_temperature_celsius, 82.5f);
    EXPECT_EQ(sample.network_bytes_sent, 100u);
    EXPECT_EQ(sample.network_bytes_recv, 200u);
    ASSERT_EQ(sample.accelerators.size(), 1u);
    EXPECT_FLOAT_EQ(sample.accelerators[0].memory_percent(), 75.0f);
}

TEST(MockMetricSourceTest, SequenceThenStatic) {
    MockMetricSource source;

    MetricSample first;
    first.cpu_percent = 10.0f;
    MetricSample second;
    second.cpu_percent = 90.0f;
    source.push_sample(first);
    source.push_sample(second);

    EXPECT_FLOAT_EQ(source.collect().cpu_percent, 10.0f);
    EXPECT_FLOAT_EQ(source.collect().cpu_percent, 90.0f);
    EXPECT_FLOAT_EQ(source.collect().cpu_percent, 25.0f);  // back to static
    EXPECT_EQ(source.collect_count(), 3u);
}

TEST(MockMetricSourceTest, TimestampsAreStamped) {
    MockMetricSource source;
    auto before = std::chrono::system_clock::now();
    auto sample = source.collect();
    EXPECT_GE(sample.timestamp, before);
}

// ─── MetricSample ────────────────────────────

TEST(MetricSampleTest, ZeroSampleIsSafe) {
    MetricSample sample;
    EXPECT_FLOAT_EQ(sample.memory_percent(), 0.0f);
    EXPECT_FLOAT_EQ(sample.disk_percent(), 0.0f);
    EXPECT_DOUBLE_EQ(sample.uptime_seconds(), 0.0);
}

// ─── LinuxMetricSource ───────────────────────

class LinuxMetricSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path()
              / ("mk_test_linux_source_" + std::to_string(::getpid()) + "_"
                 + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "proc");
        std::filesystem::create_directories(root_ / "sys");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path proc() const { return root_ / "proc"; }
    std::filesystem::path sys() const { return root_ / "sys"; }

    std::filesystem::path root_;
};

TEST_F(LinuxMetricSourceTest, ParsesFakeProcAndSys) {
    write_file(proc() / "stat",
               "cpu  100 0 100 800 0 0 0 0 0 0\n"
               "cpu0 100 0 100 800 0 0 0 0 0 0\n"
               "btime 1700000000\n");
    write_file(proc() / "meminfo",
               "MemTotal:       8000000 kB\n"
               "MemFree:        1000000 kB\n"
               "MemAvailable:   2000000 kB\n");
    write_file(proc() / "net/dev",
               "Inter-|   Receive                            |  Transmit\n"
               " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets\n"
               "    lo: 5000 50 0 0 0 0 0 0 5000 50 0 0 0 0 0 0\n"
               "  eth0: 1000 10 0 0 0 0 0 0 2000 20 0 0 0 0 0 0\n");
    std::filesystem::create_directories(proc() / "1");
    std::filesystem::create_directories(proc() / "42");
    std::filesystem::create_directories(proc() / "self");
    write_file(sys() / "class/thermal/thermal_zone0/temp", "54000\n");
    write_file(sys() / "class/drm/card0/device/mem_info_vram_total", "8589934592\n");
    write_file(sys() / "class/drm/card0/device/mem_info_vram_used", "2147483648\n");
    write_file(sys() / "class/drm/card0/device/gpu_busy_percent", "30\n");
    std::filesystem::create_directories(sys() / "class/drm/card0-HDMI-A-1");

    LinuxMetricSource source(root_, proc(), sys());
    auto sample = source.collect();

    EXPECT_FLOAT_EQ(sample.cpu_percent, 0.0f);  // counters did not move
    EXPECT_EQ(sample.memory_total_bytes, 8000000ULL * 1024);
    EXPECT_EQ(sample.memory_available_bytes, 2000000ULL * 1024);
    EXPECT_NEAR(sample.memory_percent(), 75.0f, 0.01f);
    EXPECT_EQ(sample.network_bytes_recv, 1000u);
    EXPECT_EQ(sample.network_bytes_sent, 2000u);
    EXPECT_EQ(sample.process_count, 2u);
    EXPECT_EQ(sample.boot_time, Timestamp{std::chrono::seconds(1700000000)});
    ASSERT_TRUE(sample.cpu_temperature_celsius.has_value());
    EXPECT_FLOAT_EQ(*sample.cpu_temperature_celsius, 54.0f);
    ASSERT_EQ(sample.accelerators.size(), 1u);
    EXPECT_EQ(sample.accelerators[0].name, "card0");
    EXPECT_FLOAT_EQ(sample.accelerators[0].memory_percent(), 25.0f);
    EXPECT_FLOAT_EQ(sample.accelerators[0].utilization_percent, 30.0f);
    EXPECT_GT(sample.disk_total_bytes, 0u);
}

TEST_F(LinuxMetricSourceTest, TemperatureIsHottestThermalZone) {
    write_file(sys() / "class/thermal/thermal_zone0/temp", "40000\n");
    write_file(sys() / "class/thermal/thermal_zone1/temp", "71500\n");
    write_file(sys() / "class/thermal/thermal_zone2/temp", "n/a\n");
    write_file(sys() / "class/thermal/cooling_device0/temp", "99000\n");

    LinuxMetricSource source(root_, proc(), sys());
    auto sample = source.collect();
    ASSERT_TRUE(sample.cpu_temperature_celsius.has_value());
    EXPECT_FLOAT_EQ(*sample.cpu_temperature_celsius, 71.5f);
}

TEST_F(LinuxMetricSourceTest, CpuPercentFromCounterDelta) {
    write_file(proc() / "stat", "cpu  100 0 100 800 0 0 0 0\n");
    LinuxMetricSource source(root_, proc(), sys());
    (void)source.collect();  // primes the counters

    // 50 active out of 100 elapsed jiffies
    write_file(proc() / "stat", "cpu  150 0 100 850 0 0 0 0\n");
    EXPECT_NEAR(source.collect().cpu_percent, 50.0f, 0.01f);
}

TEST_F(LinuxMetricSourceTest, MissingFilesYieldZeroValues) {
    LinuxMetricSource source(root_ / "missing", proc(), sys());
    auto sample = source.collect();

    EXPECT_FLOAT_EQ(sample.cpu_percent, 0.0f);
    EXPECT_EQ(sample.memory_total_bytes, 0u);
    EXPECT_EQ(sample.disk_total_bytes, 0u);
    EXPECT_EQ(sample.process_count, 0u);
    EXPECT_FALSE(sample.cpu_temperature_celsius.has_value());
    EXPECT_TRUE(sample.accelerators.empty());
    EXPECT_NE(sample.timestamp, Timestamp{});
}

TEST(LinuxMetricSourceLiveTest, RealProcNeverThrows) {
    LinuxMetricSource source;
    auto sample = source.collect();
    EXPECT_GE(sample.cpu_percent, 0.0f);
    EXPECT_LE(sample.cpu_percent, 100.0f);
    EXPECT_GE(sample.cpu_count, 1u);
    EXPECT_STREQ(source.name(), "linux");
}

TEST(ProcessResidentBytesTest, ReportsNonZeroForSelf) {
    EXPECT_GT(process_resident_bytes(), 0u);
}
