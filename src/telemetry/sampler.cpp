/**
 * @file sampler.cpp
 * @brief Sampler implementation.
 */

#include "telemetry/sampler.hpp"

#include <string>

namespace model_keeper {

Sampler::Sampler(IMetricSource& source,
                 TelemetryStore& store,
                 std::chrono::milliseconds interval,
                 Logger* logger)
    : source_(source)
    , store_(store)
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1))
    , logger_(logger) {}

Sampler::~Sampler() {
    if (stop()) return;
    // A collect() outlasted the grace period; the loop exits once it returns.
    sampling_thread_.join();
    running_ = false;
}

void Sampler::start() {
    if (running_.exchange(true)) return;

    std::promise<void> exited;
    exited_ = exited.get_future();
    sampling_thread_ = std::jthread([this, done = std::move(exited)](std::stop_token stop) mutable {
        sampling_loop(stop);
        done.set_value();
    });

    if (logger_) {
        logger_->info("sampler", std::string{"Sampling "} + source_.name() + " metrics every "
                      + std::to_string(interval_.count()) + "ms");
    }
}

bool Sampler::stop(std::chrono::milliseconds grace) {
    if (!sampling_thread_.joinable()) {
        running_ = false;
        return true;
    }

    sampling_thread_.request_stop();
    wait_cv_.notify_all();

    if (exited_.valid()
        && exited_.wait_for(grace) != std::future_status::ready) {
        if (logger_) {
            logger_->warn("sampler", "Sampler did not stop within "
                          + std::to_string(grace.count()) + "ms grace period");
        }
        return false;
    }

    sampling_thread_.join();
    running_ = false;
    if (logger_) {
        logger_->info("sampler", "Sampler stopped after "
                      + std::to_string(samples_taken_.load()) + " samples");
    }
    return true;
}

MetricSample Sampler::current() {
    return source_.collect();
}

void Sampler::on_sample(SampleObserver observer) {
    std::lock_guard lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

void Sampler::sampling_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        tick();

        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop, interval_, [] { return false; });
    }
}

void Sampler::tick() {
    // collect() never throws; an observer might
    auto sample = source_.collect();
    store_.append(sample);
    ++samples_taken_;

    std::lock_guard lock(observers_mutex_);
    for (const auto& observer : observers_) {
        try {
            observer(sample);
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->error("sampler", std::string{"Sample observer failed: "} + e.what());
            }
        }
    }

    if (logger_) {
        logger_->debug("sampler", "CPU=" + std::to_string(sample.cpu_percent)
                       + "% memory=" + std::to_string(sample.memory_percent()) + "%");
    }
}

}  // namespace model_keeper
