/**
 * @file materialized.hpp
 * @brief Scoped ownership of a materialized backend handle.
 */

#pragma once

#include "lifecycle/model_backend.hpp"

#include <utility>

namespace model_keeper {

/**
 * @brief Move-only owner of one backend handle.
 *
 * The handle is released exactly once: by an explicit release() whose result
 * the caller inspects, or by the destructor on every other exit path.
 */
class MaterializedResource {
public:
    MaterializedResource() = default;
    MaterializedResource(IModelBackend& backend, Materialized materialized, std::string device)
        : backend_(&backend), materialized_(materialized), device_(std::move(device)) {}

    ~MaterializedResource() {
        if (owns()) {
            (void)backend_->release(materialized_.handle);
        }
    }

    MaterializedResource(const MaterializedResource&) = delete;
    MaterializedResource& operator=(const MaterializedResource&) = delete;

    MaterializedResource(MaterializedResource&& other) noexcept
        : backend_(std::exchange(other.backend_, nullptr))
        , materialized_(std::exchange(other.materialized_, Materialized{}))
        , device_(std::move(other.device_)) {}

    MaterializedResource& operator=(MaterializedResource&& other) noexcept {
        if (this != &other) {
            if (owns()) {
                (void)backend_->release(materialized_.handle);
            }
            backend_ = std::exchange(other.backend_, nullptr);
            materialized_ = std::exchange(other.materialized_, Materialized{});
            device_ = std::move(other.device_);
        }
        return *this;
    }

    /// Release now and report the backend's result. The handle is gone either way.
    Result<void> release() {
        if (!owns()) return {};
        auto handle = std::exchange(materialized_.handle, BackendHandle{0});
        return std::exchange(backend_, nullptr)->release(handle);
    }

    [[nodiscard]] bool owns() const noexcept {
        return backend_ != nullptr && materialized_.handle != 0;
    }
    [[nodiscard]] BackendHandle handle() const noexcept { return materialized_.handle; }
    [[nodiscard]] uint64_t footprint_bytes() const noexcept { return materialized_.footprint_bytes; }
    [[nodiscard]] const std::string& device() const noexcept { return device_; }

private:
    IModelBackend* backend_{nullptr};
    Materialized materialized_{};
    std::string device_;
};

}  // namespace model_keeper
