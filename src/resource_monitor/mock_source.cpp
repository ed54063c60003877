/**
 * @file mock_source.cpp
 * @brief MockMetricSource implementation — configurable samples for testing.
 */

#include "resource_monitor/metric_source.hpp"

#include <algorithm>

namespace model_keeper {

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

}  // anonymous namespace

MockMetricSource::MockMetricSource() {
    // Sensible defaults resembling a small workstation
    static_sample_.cpu_percent = 25.0f;
    static_sample_.cpu_count = 8;
    static_sample_.cpu_frequency_mhz = 2400.0f;
    static_sample_.memory_total_bytes = 16 * kGiB;
    static_sample_.memory_available_bytes = 10 * kGiB;
    static_sample_.memory_used_bytes = 6 * kGiB;
    static_sample_.disk_total_bytes = 512 * kGiB;
    static_sample_.disk_used_bytes = 128 * kGiB;
    static_sample_.disk_free_bytes = 384 * kGiB;
    static_sample_.process_count = 200;
    static_sample_.boot_time = std::chrono::system_clock::now() - std::chrono::hours(1);
}

MetricSample MockMetricSource::collect() {
    std::lock_guard lock(mutex_);
    ++collect_count_;
    MetricSample sample;
    if (!sequence_.empty()) {
        sample = std::move(sequence_.front());
        sequence_.pop_front();
    } else {
        sample = static_sample_;
    }
    sample.timestamp = std::chrono::system_clock::now();
    return sample;
}

void MockMetricSource::push_sample(MetricSample sample) {
    std::lock_guard lock(mutex_);
    sequence_.push_back(std::move(sample));
}

void MockMetricSource::set_static_sample(MetricSample sample) {
    std::lock_guard lock(mutex_);
    static_sample_ = std::move(sample);
}

void MockMetricSource::set_cpu(float percent) {
    std::lock_guard lock(mutex_);
    static_sample_.cpu_percent = percent;
}

void MockMetricSource::set_memory_percent(float percent) {
    std::lock_guard lock(mutex_);
    auto total = static_sample_.memory_total_bytes;
    auto used = static_cast<uint64_t>(static_cast<double>(total) * percent / 100.0);
    static_sample_.memory_used_bytes = std::min(used, total);
    static_sample_.memory_available_bytes = total - static_sample_.memory_used_bytes;
}

void MockMetricSource::set_disk_percent(float percent) {
    std::lock_guard lock(mutex_);
    auto total = static_sample_.disk_total_bytes;
    auto used = static_cast<uint64_t>(static_cast<double>(total) * percent / 100.0);
    static_sample_.disk_used_bytes = std::min(used, total);
    static_sample_.disk_free_bytes = total - static_sample_.disk_used_bytes;
}

void MockMetricSource::set_process_count(uint32_t count) {
    std::lock_guard lock(mutex_);
    static_sample_.process_count = count;
}

void MockMetricSource::set_temperature(std::optional<float> celsius) {
    std::lock_guard lock(mutex_);
    static_sample_.cpu_temperature_celsius = celsius;
}

void MockMetricSource::set_accelerators(std::vector<AcceleratorInfo> accelerators) {
    std::lock_guard lock(mutex_);
    static_sample_.accelerators = std::move(accelerators);
}

void MockMetricSource::set_network(uint64_t bytes_sent, uint64_t bytes_recv) {
    std::lock_guard lock(mutex_);
    static_sample_.network_bytes_sent = bytes_sent;
    static_sample_.network_bytes_recv = bytes_recv;
}

size_t MockMetricSource::collect_count() const {
    std::lock_guard lock(mutex_);
    return collect_count_;
}

}  // namespace model_keeper
