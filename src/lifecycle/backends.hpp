/**
 * @file backends.hpp
 * @brief Concrete model backends.
 *
 * DirectoryBackend fetches from a local artifact mirror and materializes by
 * reading the artifacts into memory. MockBackend is scriptable and is used by
 * tests and demo mode.
 */

#pragma once

#include "lifecycle/model_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace model_keeper {

// ─────────────────────────────────────────────
// DirectoryBackend
// ─────────────────────────────────────────────

/**
 * @brief Backend over a local mirror: <mirror_dir>/<repo_reference>/...
 *
 * fetch() copies the mirror tree file by file, checking the stop token
 * between files. materialize() reads every artifact file into memory; the
 * footprint is the number of bytes held. An optional memory limit makes
 * materialize() fail with ResourceExhausted instead of over-committing.
 */
class DirectoryBackend final : public IModelBackend {
public:
    explicit DirectoryBackend(std::filesystem::path mirror_dir,
                              std::vector<std::string> accelerators = {},
                              uint64_t memory_limit_bytes = 0);
    ~DirectoryBackend() override;

    Result<void> fetch(const std::string& repo_reference,
                       const std::filesystem::path& destination,
                       std::stop_token stop) override;
    Result<Materialized> materialize(const std::filesystem::path& path,
                                     const std::string& device,
                                     QuantizationPolicy quantization,
                                     std::stop_token stop) override;
    Result<void> release(BackendHandle handle) override;
    void reclaim() override;
    [[nodiscard]] std::vector<std::string> accelerators() const override { return accelerators_; }
    [[nodiscard]] const char* name() const override { return "directory"; }

    [[nodiscard]] size_t live_handles() const;
    [[nodiscard]] uint64_t resident_bytes() const;

private:
    struct LoadedArtifacts {
        std::vector<std::vector<char>> buffers;
        uint64_t bytes{0};
        QuantizationPolicy quantization{QuantizationPolicy::None};
        std::string device;
    };

    std::filesystem::path mirror_dir_;
    std::vector<std::string> accelerators_;
    uint64_t memory_limit_bytes_;

    mutable std::mutex mutex_;
    std::map<BackendHandle, LoadedArtifacts> loaded_;
    uint64_t resident_bytes_{0};
    BackendHandle next_handle_{1};
};

// ─────────────────────────────────────────────
// MockBackend
// ─────────────────────────────────────────────

/**
 * @brief In-memory backend with scriptable failures, delays and counters.
 */
class MockBackend final : public IModelBackend {
public:
    static constexpr uint64_t kDefaultFootprint = 256ULL * 1024 * 1024;

    explicit MockBackend(std::vector<std::string> accelerators = {});

    Result<void> fetch(const std::string& repo_reference,
                       const std::filesystem::path& destination,
                       std::stop_token stop) override;
    Result<Materialized> materialize(const std::filesystem::path& path,
                                     const std::string& device,
                                     QuantizationPolicy quantization,
                                     std::stop_token stop) override;
    Result<void> release(BackendHandle handle) override;
    void reclaim() override { ++reclaim_count_; }
    [[nodiscard]] std::vector<std::string> accelerators() const override;
    [[nodiscard]] const char* name() const override { return "mock"; }

    // Scripting
    void set_fetch_delay(std::chrono::milliseconds delay);
    void set_materialize_delay(std::chrono::milliseconds delay);
    void set_fetch_failure(std::optional<std::string> message, bool leave_partial = false);
    void set_materialize_failure(std::optional<Error> error);
    void set_release_failure(std::optional<std::string> message);
    void set_footprint(uint64_t bytes);
    void set_accelerators(std::vector<std::string> accelerators);

    // Observation
    [[nodiscard]] uint64_t fetch_count() const noexcept { return fetch_count_.load(); }
    [[nodiscard]] uint64_t materialize_count() const noexcept { return materialize_count_.load(); }
    [[nodiscard]] uint64_t release_count() const noexcept { return release_count_.load(); }
    [[nodiscard]] uint64_t reclaim_count() const noexcept { return reclaim_count_.load(); }
    [[nodiscard]] size_t live_handles() const;
    [[nodiscard]] size_t max_live_handles() const;
    [[nodiscard]] std::string last_device() const;
    [[nodiscard]] std::optional<QuantizationPolicy> last_quantization() const;

private:
    /// Sleep for `delay` in short steps; false if stop was requested meanwhile.
    static bool wait_unless_stopped(std::chrono::milliseconds delay, const std::stop_token& stop);

    mutable std::mutex mutex_;
    std::vector<std::string> accelerators_;
    std::chrono::milliseconds fetch_delay_{0};
    std::chrono::milliseconds materialize_delay_{0};
    std::optional<std::string> fetch_failure_;
    bool leave_partial_{false};
    std::optional<Error> materialize_failure_;
    std::optional<std::string> release_failure_;
    uint64_t footprint_{kDefaultFootprint};

    std::set<BackendHandle> live_;
    size_t max_live_{0};
    BackendHandle next_handle_{1};
    std::string last_device_;
    std::optional<QuantizationPolicy> last_quantization_;

    std::atomic<uint64_t> fetch_count_{0};
    std::atomic<uint64_t> materialize_count_{0};
    std::atomic<uint64_t> release_count_{0};
    std::atomic<uint64_t> reclaim_count_{0};
};

}  // namespace model_keeper
