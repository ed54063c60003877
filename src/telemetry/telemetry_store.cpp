/**
 * @file telemetry_store.cpp
 * @brief TelemetryStore implementation.
 */

#include "telemetry/telemetry_store.hpp"

#include <algorithm>

namespace model_keeper {

TelemetryStore::TelemetryStore(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
    ring_.reserve(capacity_);
}

void TelemetryStore::append(MetricSample sample) {
    std::lock_guard lock(mutex_);
    if (ring_.size() < capacity_) {
        ring_.push_back(std::move(sample));
    } else {
        ring_[head_] = std::move(sample);
        head_ = (head_ + 1) % capacity_;
    }
    ++appended_;
}

const MetricSample& TelemetryStore::at(size_t i) const {
    return ring_[(head_ + i) % ring_.size()];
}

std::vector<MetricSample> TelemetryStore::history(size_t limit) const {
    std::lock_guard lock(mutex_);
    size_t count = ring_.size();
    size_t first = (limit > 0 && limit < count) ? count - limit : 0;

    std::vector<MetricSample> out;
    out.reserve(count - first);
    for (size_t i = first; i < count; ++i) {
        out.push_back(at(i));
    }
    return out;
}

std::optional<MetricSample> TelemetryStore::latest() const {
    std::lock_guard lock(mutex_);
    if (ring_.empty()) return std::nullopt;
    return at(ring_.size() - 1);
}

std::optional<MetricAverage> TelemetryStore::average_over(std::chrono::milliseconds window,
                                                          Timestamp now) const {
    std::lock_guard lock(mutex_);
    const Timestamp cutoff = now - window;

    MetricAverage avg;
    const MetricSample* first = nullptr;
    const MetricSample* last = nullptr;

    for (size_t i = 0; i < ring_.size(); ++i) {
        const auto& s = at(i);
        if (s.timestamp < cutoff || s.timestamp > now) continue;
        if (!first) first = &s;
        last = &s;
        avg.cpu_percent += s.cpu_percent;
        avg.memory_percent += s.memory_percent();
        avg.disk_percent += s.disk_percent();
        ++avg.sample_count;
    }

    if (avg.sample_count == 0) return std::nullopt;

    auto n = static_cast<double>(avg.sample_count);
    avg.cpu_percent /= n;
    avg.memory_percent /= n;
    avg.disk_percent /= n;

    if (avg.sample_count >= 2) {
        double elapsed = std::chrono::duration<double>(last->timestamp - first->timestamp).count();
        // Counters are cumulative; a decrease means the counters were reset
        if (elapsed > 0.0) {
            if (last->network_bytes_sent >= first->network_bytes_sent) {
                avg.network_bytes_sent_per_sec =
                    static_cast<double>(last->network_bytes_sent - first->network_bytes_sent) / elapsed;
            }
            if (last->network_bytes_recv >= first->network_bytes_recv) {
                avg.network_bytes_recv_per_sec =
                    static_cast<double>(last->network_bytes_recv - first->network_bytes_recv) / elapsed;
            }
        }
    }
    return avg;
}

std::optional<MetricTrend> TelemetryStore::trend(size_t window_count) const {
    std::lock_guard lock(mutex_);
    size_t count = ring_.size();
    size_t window = std::min(window_count, count);
    if (window < 2) return std::nullopt;

    const auto& oldest = at(count - window);
    const auto& newest = at(count - 1);

    MetricTrend t;
    t.window = window;
    t.cpu_delta = static_cast<double>(newest.cpu_percent) - oldest.cpu_percent;
    t.memory_delta = static_cast<double>(newest.memory_percent()) - oldest.memory_percent();
    return t;
}

size_t TelemetryStore::size() const {
    std::lock_guard lock(mutex_);
    return ring_.size();
}

uint64_t TelemetryStore::total_appended() const {
    std::lock_guard lock(mutex_);
    return appended_;
}

void TelemetryStore::clear() {
    std::lock_guard lock(mutex_);
    ring_.clear();
    head_ = 0;
}

}  // namespace model_keeper
