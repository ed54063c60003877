/**
 * @file model_backend.hpp
 * @brief Boundary to the component that actually fetches and materializes models.
 *
 * The backend is selected at startup (directory mirror or mock), so it is a
 * virtual interface. Long-running calls receive a stop_token and should poll
 * it; the lifecycle manager uses it to cancel attempts whose deadline expired.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace model_keeper {

/// Opaque, backend-owned token for a materialized model. 0 is never valid.
using BackendHandle = uint64_t;

struct Materialized {
    BackendHandle handle{0};
    uint64_t footprint_bytes{0};      ///< Measured memory held by the handle
};

class IModelBackend {
public:
    virtual ~IModelBackend() = default;

    /**
     * @brief Fetch all artifacts of `repo_reference` into `destination`.
     *
     * Must leave `destination` either absent or complete on return.
     */
    virtual Result<void> fetch(const std::string& repo_reference,
                               const std::filesystem::path& destination,
                               std::stop_token stop) = 0;

    /**
     * @brief Materialize the artifacts at `path` on `device`.
     *
     * Failures caused by insufficient memory or device capacity use
     * ErrorCode::ResourceExhausted.
     */
    virtual Result<Materialized> materialize(const std::filesystem::path& path,
                                             const std::string& device,
                                             QuantizationPolicy quantization,
                                             std::stop_token stop) = 0;

    /// Release a handle returned by materialize(). Called exactly once per handle.
    virtual Result<void> release(BackendHandle handle) = 0;

    /// Backend-side memory reclamation after a release (allocator trim, cache flush).
    virtual void reclaim() {}

    /// Accelerator device names usable by materialize(), e.g. "cuda:0".
    [[nodiscard]] virtual std::vector<std::string> accelerators() const = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

/// True for "cpu" and any device the backend lists as an accelerator.
[[nodiscard]] bool is_known_device(const IModelBackend& backend, const std::string& device);

}  // namespace model_keeper
