/**
 * @file test_sampler.cpp
 * @brief Unit tests for the background Sampler.
 */

#include "resource_monitor/metric_source.hpp"
#include "telemetry/sampler.hpp"
#include "telemetry/telemetry_store.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

using namespace model_keeper;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

// Source whose collect() blocks for a fixed delay.
class SlowSource : public IMetricSource {
public:
    explicit SlowSource(std::chrono::milliseconds delay) : delay_(delay) {}

    MetricSample collect() override {
        ++entered_;
        std::this_thread::sleep_for(delay_);
        return inner_.collect();
    }
    const char* name() const override { return "slow"; }

    int entered() const { return entered_.load(); }

private:
    std::chrono::milliseconds delay_;
    std::atomic<int> entered_{0};
    MockMetricSource inner_;
};

}  // namespace

TEST(SamplerTest, AppendsSamplesPeriodically) {
    MockMetricSource source;
    TelemetryStore store(100);
    Sampler sampler(source, store, 10ms);

    sampler.start();
    EXPECT_TRUE(sampler.running());
    EXPECT_TRUE(wait_until([&] { return store.size() >= 3; }));
    EXPECT_TRUE(sampler.stop(1000ms));
    EXPECT_FALSE(sampler.running());
    EXPECT_GE(sampler.samples_taken(), 3u);
}

TEST(SamplerTest, StopsWithinGraceDespiteLongInterval) {
    MockMetricSource source;
    TelemetryStore store(10);
    Sampler sampler(source, store, std::chrono::hours(1));

    sampler.start();
    ASSERT_TRUE(wait_until([&] { return store.size() == 1; }));

    auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(sampler.stop(500ms));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
    EXPECT_EQ(store.size(), 1u);
}

TEST(SamplerTest, StopWithoutStartIsHarmless) {
    MockMetricSource source;
    TelemetryStore store(10);
    Sampler sampler(source, store, 10ms);
    EXPECT_TRUE(sampler.stop());
    EXPECT_FALSE(sampler.running());
}

TEST(SamplerTest, CurrentIsIndependentOfCadence) {
    MockMetricSource source;
    source.set_cpu(64.0f);
    TelemetryStore store(10);
    Sampler sampler(source, store, std::chrono::hours(1));

    auto sample = sampler.current();
    EXPECT_FLOAT_EQ(sample.cpu_percent, 64.0f);
    EXPECT_EQ(store.size(), 0u);   // current() does not record
    EXPECT_EQ(sampler.samples_taken(), 0u);
}

TEST(SamplerTest, ObserversSeeStoredSamples) {
    MockMetricSource source;
    TelemetryStore store(10);
    Sampler sampler(source, store, 5ms);

    std::atomic<int> observed{0};
    std::atomic<bool> stored_first{true};
    sampler.on_sample([&](const MetricSample& sample) {
        auto latest = store.latest();
        if (!latest || latest->timestamp != sample.timestamp) stored_first = false;
        ++observed;
    });

    sampler.start();
    ASSERT_TRUE(wait_until([&] { return observed.load() >= 2; }));
    ASSERT_TRUE(sampler.stop());
    EXPECT_TRUE(stored_first.load());
}

TEST(SamplerTest, ThrowingObserverDoesNotStopSampling) {
    MockMetricSource source;
    TelemetryStore store(100);
    Sampler sampler(source, store, 5ms);
    sampler.on_sample([](const MetricSample&) { throw std::runtime_error("observer broke"); });

    sampler.start();
    EXPECT_TRUE(wait_until([&] { return store.size() >= 3; }));
    EXPECT_TRUE(sampler.stop());
}

TEST(SamplerTest, StartTwiceIsNoOp) {
    MockMetricSource source;
    TelemetryStore store(10);
    Sampler sampler(source, store, 1000ms);
    sampler.start();
    sampler.start();
    EXPECT_TRUE(sampler.running());
    EXPECT_TRUE(sampler.stop());
}

TEST(SamplerTest, StopTimesOutWhileCollectBlocks) {
    SlowSource source(300ms);
    TelemetryStore store(10);
    Sampler sampler(source, store, 5ms);

    sampler.start();
    ASSERT_TRUE(wait_until([&] { return source.entered() == 1; }));
    EXPECT_FALSE(sampler.stop(10ms));
    EXPECT_TRUE(sampler.running());

    // The pending stop request is honoured once collect() returns.
    EXPECT_TRUE(sampler.stop(2000ms));
    EXPECT_FALSE(sampler.running());
    EXPECT_EQ(source.entered(), 1);
    EXPECT_EQ(store.size(), 1u);
}

TEST(SamplerTest, DestructorJoinsAfterTimedOutStop) {
    SlowSource source(300ms);
    TelemetryStore store(10);
    std::atomic<int> observed{0};
    {
        Sampler sampler(source, store, 5ms);
        sampler.on_sample([&](const MetricSample&) { ++observed; });

        sampler.start();
        ASSERT_TRUE(wait_until([&] { return source.entered() == 1; }));
        EXPECT_FALSE(sampler.stop(10ms));
    }

    // The in-flight tick finished against live observers before teardown.
    EXPECT_EQ(observed.load(), 1);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(source.entered(), 1);
}
