/**
 * @file lifecycle_manager.hpp
 * @brief Owner of the runtime state of every catalog resource.
 *
 * The manager drives download -> materialize -> serve -> evict through the
 * model backend. Operations on one id are mutually exclusive (per-id
 * operation mutex); operations on different ids run in parallel. Readers
 * (list, get, state) only take the short per-record state mutex and never
 * wait for an in-flight backend call.
 *
 * Backend calls run on an internal WorkerPool so that the caller's wait is
 * bounded by a timeout. An abandoned attempt is cancelled through its stop
 * token and cleans up after itself if it still succeeds later.
 */

#pragma once

#include "catalog/resource_catalog.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "lifecycle/materialized.hpp"
#include "lifecycle/model_backend.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace model_keeper {

struct LifecycleOptions {
    size_t worker_threads = 4;
    Millis download_timeout{1'800'000};   ///< 0 = unbounded
    Millis load_timeout{600'000};         ///< 0 = unbounded
};

/// Serve-only reference to a loaded resource.
struct ServeRef {
    ResourceId id;
    BackendHandle handle{0};
    std::string device;
};

/// Read-only snapshot of one resource.
struct ResourceStatus {
    ResourceId id;
    const ResourceDescriptor* descriptor{nullptr};
    ResourcePhase phase{ResourcePhase::NotDownloaded};
    bool loaded{false};
    std::string device;                   ///< Empty unless loaded
    uint64_t footprint_bytes{0};
    Millis load_duration{0};
    Timestamp last_transition{};
    std::optional<Error> last_error;

    /// Phase label, or "error" when the last operation failed and nothing is loaded.
    [[nodiscard]] std::string status_label() const;
};

class LifecycleManager {
public:
    LifecycleManager(const ResourceCatalog& catalog,
                     IModelBackend& backend,
                     std::filesystem::path models_dir,
                     LifecycleOptions options = {},
                     Logger* logger = nullptr);

    /// Unloads everything that is still loaded.
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /**
     * @brief Fetch artifacts into models_dir/<id>.
     *
     * No-op success if already downloaded and `force` is false. A failed,
     * timed-out or cancelled attempt leaves no partial directory behind and
     * restores the pre-call phase.
     */
    Result<void> download(const ResourceId& id, bool force = false,
                          std::optional<Millis> timeout = std::nullopt);

    /**
     * @brief Materialize a downloaded resource on `device` ("auto", "cpu", or
     *        an accelerator name).
     *
     * Reloads if already loaded. Conflict while a download of the same id is
     * in flight or when the artifacts are absent.
     */
    Result<void> load(const ResourceId& id, const std::string& device = "auto",
                      std::optional<Millis> timeout = std::nullopt);

    /// Release the handle. Success no-op when not loaded.
    Result<void> unload(const ResourceId& id);

    /// Present only while the resource is loaded.
    [[nodiscard]] std::optional<ServeRef> get(const ResourceId& id) const;

    [[nodiscard]] Result<ResourceStatus> state(const ResourceId& id) const;
    [[nodiscard]] std::vector<ResourceStatus> list() const;

    /// Unload every loaded resource, continuing past failures.
    std::vector<Error> cleanup_all();

    [[nodiscard]] size_t loaded_count() const;
    [[nodiscard]] const ResourceCatalog& catalog() const noexcept { return catalog_; }

private:
    struct ResourceState {
        ResourcePhase phase{ResourcePhase::NotDownloaded};
        bool download_in_flight{false};
        uint64_t footprint_bytes{0};
        Millis load_duration{0};
        Timestamp last_transition{};
        std::optional<Error> last_error;
        std::optional<MaterializedResource> handle;
    };

    struct ResourceRecord {
        const ResourceDescriptor* descriptor{nullptr};
        std::mutex operation_mutex;       ///< Held for a whole download/load/unload
        mutable std::mutex state_mutex;   ///< Guards `state`
        ResourceState state;
    };

    ResourceRecord* find_record(const ResourceId& id) const;
    Result<ResourceRecord*> lookup(const ResourceId& id) const;
    [[nodiscard]] std::filesystem::path artifact_dir(const ResourceId& id) const;
    [[nodiscard]] std::filesystem::path next_staging_dir(const ResourceId& id);
    [[nodiscard]] std::string resolve_device(const std::string& requested) const;
    [[nodiscard]] Millis effective_timeout(std::optional<Millis> requested, Millis fallback) const;

    void set_phase(ResourceRecord& record, ResourcePhase phase);
    void record_failure(ResourceRecord& record, ResourcePhase phase, const Error& error);
    Result<void> unload_locked(ResourceRecord& record);
    Result<void> install_artifacts(const std::filesystem::path& staging,
                                   const std::filesystem::path& target);
    void remove_stale_staging();
    void log_pool_backlog(const Error& error) const;

    static ResourceStatus snapshot(const ResourceRecord& record);

    const ResourceCatalog& catalog_;
    IModelBackend& backend_;
    std::filesystem::path models_dir_;
    LifecycleOptions options_;
    Logger* logger_;

    std::map<ResourceId, std::unique_ptr<ResourceRecord>> records_;
    std::atomic<uint64_t> staging_counter_{0};

    WorkerPool pool_;  // declared last: joined before the records go away
};

}  // namespace model_keeper
