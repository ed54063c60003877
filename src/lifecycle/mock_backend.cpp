/**
 * @file mock_backend.cpp
 * @brief MockBackend implementation — scriptable backend for testing.
 */

#include "lifecycle/backends.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <thread>

namespace model_keeper {

MockBackend::MockBackend(std::vector<std::string> accelerators)
    : accelerators_(std::move(accelerators)) {}

bool MockBackend::wait_unless_stopped(std::chrono::milliseconds delay, const std::stop_token& stop) {
    constexpr auto kStep = std::chrono::milliseconds(2);
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (stop.stop_requested()) return false;
        std::this_thread::sleep_for(kStep);
    }
    return !stop.stop_requested();
}

Result<void> MockBackend::fetch(const std::string& repo_reference,
                                const std::filesystem::path& destination,
                                std::stop_token stop) {
    ++fetch_count_;

    std::chrono::milliseconds delay;
    std::optional<std::string> failure;
    bool leave_partial = false;
    {
        std::lock_guard lock(mutex_);
        delay = fetch_delay_;
        failure = fetch_failure_;
        leave_partial = leave_partial_;
    }

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) return Error{ErrorCode::Io, "Cannot create " + destination.string()};

    if (!wait_unless_stopped(delay, stop)) {
        std::filesystem::remove_all(destination, ec);
        return Error{ErrorCode::Timeout, "Fetch of '" + repo_reference + "' cancelled"};
    }

    if (failure) {
        if (leave_partial) {
            std::ofstream(destination / "model.bin.partial") << "partial";
        } else {
            std::filesystem::remove_all(destination, ec);
        }
        return Error{ErrorCode::BackendFailure, *failure};
    }

    std::ofstream(destination / "config.json") << R"({"repo":")" << repo_reference << "\"}";
    std::ofstream(destination / "model.bin") << repo_reference;
    return {};
}

Result<Materialized> MockBackend::materialize(const std::filesystem::path& path,
                                              const std::string& device,
                                              QuantizationPolicy quantization,
                                              std::stop_token stop) {
    ++materialize_count_;

    std::chrono::milliseconds delay;
    std::optional<Error> failure;
    {
        std::lock_guard lock(mutex_);
        delay = materialize_delay_;
        failure = materialize_failure_;
        last_device_ = device;
        last_quantization_ = quantization;
    }

    if (!wait_unless_stopped(delay, stop)) {
        return Error{ErrorCode::Timeout, "Materialization of " + path.string() + " cancelled"};
    }
    if (failure) return *failure;
    if (!is_known_device(*this, device)) {
        return Error{ErrorCode::InvalidArgument, "Unsupported device '" + device + "'"};
    }

    std::lock_guard lock(mutex_);
    Materialized result{next_handle_++, footprint_};
    live_.insert(result.handle);
    max_live_ = std::max(max_live_, live_.size());
    return result;
}

Result<void> MockBackend::release(BackendHandle handle) {
    ++release_count_;
    std::lock_guard lock(mutex_);
    if (live_.erase(handle) == 0) {
        return Error{ErrorCode::BackendFailure, "Unknown handle " + std::to_string(handle)};
    }
    if (release_failure_) {
        return Error{ErrorCode::BackendFailure, *release_failure_};
    }
    return {};
}

std::vector<std::string> MockBackend::accelerators() const {
    std::lock_guard lock(mutex_);
    return accelerators_;
}

void MockBackend::set_fetch_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    fetch_delay_ = delay;
}

void MockBackend::set_materialize_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    materialize_delay_ = delay;
}

void MockBackend::set_fetch_failure(std::optional<std::string> message, bool leave_partial) {
    std::lock_guard lock(mutex_);
    fetch_failure_ = std::move(message);
    leave_partial_ = leave_partial;
}

void MockBackend::set_materialize_failure(std::optional<Error> error) {
    std::lock_guard lock(mutex_);
    materialize_failure_ = std::move(error);
}

void MockBackend::set_release_failure(std::optional<std::string> message) {
    std::lock_guard lock(mutex_);
    release_failure_ = std::move(message);
}

void MockBackend::set_footprint(uint64_t bytes) {
    std::lock_guard lock(mutex_);
    footprint_ = bytes;
}

void MockBackend::set_accelerators(std::vector<std::string> accelerators) {
    std::lock_guard lock(mutex_);
    accelerators_ = std::move(accelerators);
}

size_t MockBackend::live_handles() const {
    std::lock_guard lock(mutex_);
    return live_.size();
}

size_t MockBackend::max_live_handles() const {
    std::lock_guard lock(mutex_);
    return max_live_;
}

std::string MockBackend::last_device() const {
    std::lock_guard lock(mutex_);
    return last_device_;
}

std::optional<QuantizationPolicy> MockBackend::last_quantization() const {
    std::lock_guard lock(mutex_);
    return last_quantization_;
}

}  // namespace model_keeper
