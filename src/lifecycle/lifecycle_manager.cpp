/**
 * @file lifecycle_manager.cpp
 * @brief LifecycleManager implementation.
 */

#include "lifecycle/lifecycle_manager.hpp"
#include "resource_monitor/metric_source.hpp"

#include <chrono>
#include <exception>
#include <system_error>

namespace model_keeper {

namespace {

constexpr const char* kComponent = "lifecycle";
constexpr const char* kStagingDirName = ".staging";

/// Shared between the caller and the worker running one backend call.
struct Attempt {
    std::mutex mutex;
    bool finished{false};    ///< Worker delivered its result to the caller
    bool abandoned{false};   ///< Caller gave up; worker must clean up
};

/**
 * @brief Wait for a backend call, bounded by `timeout` (0 = unbounded).
 *
 * On expiry the attempt is marked abandoned and cancelled; from then on the
 * worker owns whatever the backend produced.
 */
template <typename T>
Result<T> await_attempt(PendingTask<Result<T>>& task, Attempt& attempt,
                        Millis timeout, const std::string& what) {
    if (timeout.count() > 0
        && task.future.wait_for(timeout) == std::future_status::timeout) {
        bool abandoned = false;
        {
            std::lock_guard lock(attempt.mutex);
            if (!attempt.finished) {
                attempt.abandoned = true;
                abandoned = true;
            }
        }
        if (abandoned) {
            task.cancel();
            return Error{ErrorCode::Timeout,
                         what + " timed out after " + std::to_string(timeout.count()) + " ms"};
        }
    }

    try {
        return task.future.get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::BackendFailure, what + " failed: " + e.what()};
    }
}

void log_if(Logger* logger, LogLevel level, const std::string& message) {
    if (logger) logger->log(level, kComponent, message);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// ResourceStatus
// ─────────────────────────────────────────────

std::string ResourceStatus::status_label() const {
    if (last_error && !loaded && !is_transitional(phase)) return "error";
    return std::string{to_string(phase)};
}

// ─────────────────────────────────────────────
// Construction / teardown
// ─────────────────────────────────────────────

LifecycleManager::LifecycleManager(const ResourceCatalog& catalog,
                                   IModelBackend& backend,
                                   std::filesystem::path models_dir,
                                   LifecycleOptions options,
                                   Logger* logger)
    : catalog_(catalog)
    , backend_(backend)
    , models_dir_(std::move(models_dir))
    , options_(options)
    , logger_(logger)
    , pool_(options.worker_threads) {
    std::error_code ec;
    std::filesystem::create_directories(models_dir_, ec);
    if (ec) {
        log_if(logger_, LogLevel::Warn,
               "Cannot create models directory " + models_dir_.string() + ": " + ec.message());
    }
    remove_stale_staging();

    auto now = std::chrono::system_clock::now();
    for (const auto& [id, descriptor] : catalog_) {
        if (auto valid = validate_resource_id(id); !valid) {
            log_if(logger_, LogLevel::Error, "Skipping resource: " + valid.error().message);
            continue;
        }
        auto record = std::make_unique<ResourceRecord>();
        record->descriptor = &descriptor;
        record->state.last_transition = now;
        if (std::filesystem::is_directory(artifact_dir(id), ec)) {
            record->state.phase = ResourcePhase::Downloaded;
        }
        records_.emplace(id, std::move(record));
    }

    log_if(logger_, LogLevel::Info,
           "Managing " + std::to_string(records_.size()) + " resources in "
           + models_dir_.string() + " with backend " + backend_.name());
}

LifecycleManager::~LifecycleManager() {
    for (const auto& failure : cleanup_all()) {
        log_if(logger_, LogLevel::Warn, "Cleanup failure: " + failure.message);
    }
}

void LifecycleManager::remove_stale_staging() {
    auto staging_root = models_dir_ / kStagingDirName;
    std::error_code ec;
    if (!std::filesystem::exists(staging_root, ec)) return;

    auto removed = std::filesystem::remove_all(staging_root, ec);
    if (ec) {
        log_if(logger_, LogLevel::Warn,
               "Cannot remove stale staging area " + staging_root.string() + ": " + ec.message());
    } else if (removed > 1) {
        log_if(logger_, LogLevel::Info,
               "Removed " + std::to_string(removed - 1) + " stale staging entries");
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

void LifecycleManager::log_pool_backlog(const Error& error) const {
    if (error.code != ErrorCode::Timeout) return;
    log_if(logger_, LogLevel::Warn,
           "Worker pool after timeout: " + std::to_string(pool_.active_count()) + " active, "
           + std::to_string(pool_.queued_count()) + " queued of "
           + std::to_string(pool_.thread_count()) + " threads");
}

LifecycleManager::ResourceRecord* LifecycleManager::find_record(const ResourceId& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second.get();
}

Result<LifecycleManager::ResourceRecord*> LifecycleManager::lookup(const ResourceId& id) const {
    if (auto* record = find_record(id)) return record;
    if (auto valid = validate_resource_id(id); !valid) return valid.error();
    return Error{ErrorCode::NotFound, "Unknown resource '" + id + "'"};
}

std::filesystem::path LifecycleManager::artifact_dir(const ResourceId& id) const {
    return models_dir_ / id;
}

std::filesystem::path LifecycleManager::next_staging_dir(const ResourceId& id) {
    return models_dir_ / kStagingDirName / (id + "." + std::to_string(++staging_counter_));
}

std::string LifecycleManager::resolve_device(const std::string& requested) const {
    if (requested != "auto") return requested;
    auto accelerators = backend_.accelerators();
    return accelerators.empty() ? std::string{"cpu"} : accelerators.front();
}

Millis LifecycleManager::effective_timeout(std::optional<Millis> requested, Millis fallback) const {
    return requested.value_or(fallback);
}

void LifecycleManager::set_phase(ResourceRecord& record, ResourcePhase phase) {
    std::lock_guard lock(record.state_mutex);
    record.state.phase = phase;
    record.state.last_transition = std::chrono::system_clock::now();
}

void LifecycleManager::record_failure(ResourceRecord& record, ResourcePhase phase, const Error& error) {
    std::lock_guard lock(record.state_mutex);
    record.state.phase = phase;
    record.state.last_error = error;
    record.state.last_transition = std::chrono::system_clock::now();
}

Result<void> LifecycleManager::install_artifacts(const std::filesystem::path& staging,
                                                 const std::filesystem::path& target) {
    std::error_code ec;
    auto previous = staging;
    previous += ".previous";

    bool replaced = std::filesystem::exists(target, ec);
    if (replaced) {
        std::filesystem::rename(target, previous, ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot move aside " + target.string() + ": " + ec.message()};
        }
    }

    std::filesystem::rename(staging, target, ec);
    if (ec) {
        auto message = "Cannot install " + target.string() + ": " + ec.message();
        if (replaced) {
            std::error_code restore_ec;
            std::filesystem::rename(previous, target, restore_ec);
        }
        return Error{ErrorCode::Io, message};
    }

    if (replaced) {
        std::filesystem::remove_all(previous, ec);
        if (ec) {
            log_if(logger_, LogLevel::Warn,
                   "Cannot remove replaced artifacts " + previous.string() + ": " + ec.message());
        }
    }
    return {};
}

ResourceStatus LifecycleManager::snapshot(const ResourceRecord& record) {
    std::lock_guard lock(record.state_mutex);
    const auto& state = record.state;

    ResourceStatus status;
    status.id = record.descriptor->id;
    status.descriptor = record.descriptor;
    status.phase = state.phase;
    status.loaded = state.phase == ResourcePhase::Loaded && state.handle.has_value();
    status.device = state.handle ? state.handle->device() : std::string{};
    status.footprint_bytes = state.footprint_bytes;
    status.load_duration = state.load_duration;
    status.last_transition = state.last_transition;
    status.last_error = state.last_error;
    return status;
}

// ─────────────────────────────────────────────
// download
// ─────────────────────────────────────────────

Result<void> LifecycleManager::download(const ResourceId& id, bool force,
                                        std::optional<Millis> timeout) {
    auto found = lookup(id);
    if (!found) return found.error();
    auto* record = *found;

    std::lock_guard operation(record->operation_mutex);

    auto target = artifact_dir(id);
    std::error_code ec;
    if (!force && std::filesystem::is_directory(target, ec)) {
        std::lock_guard lock(record->state_mutex);
        if (record->state.phase == ResourcePhase::NotDownloaded) {
            record->state.phase = ResourcePhase::Downloaded;
            record->state.last_transition = std::chrono::system_clock::now();
        }
        log_if(logger_, LogLevel::Debug, "'" + id + "' already downloaded");
        return {};
    }

    ResourcePhase prior;
    {
        std::lock_guard lock(record->state_mutex);
        prior = record->state.phase;
        record->state.download_in_flight = true;
        if (prior != ResourcePhase::Loaded) {
            record->state.phase = ResourcePhase::Downloading;
            record->state.last_transition = std::chrono::system_clock::now();
        }
    }

    auto staging = next_staging_dir(id);
    std::filesystem::create_directories(staging.parent_path(), ec);

    log_if(logger_, LogLevel::Info,
           "Downloading '" + id + "' from " + record->descriptor->repo_reference);
    auto started = std::chrono::steady_clock::now();

    Result<void> outcome;
    if (ec) {
        outcome = Error{ErrorCode::Io, "Cannot create staging area: " + ec.message()};
    } else {
        auto attempt = std::make_shared<Attempt>();
        auto task = pool_.submit(
            [backend = &backend_, repo = record->descriptor->repo_reference,
             staging, attempt](std::stop_token stop) -> Result<void> {
                Result<void> result;
                try {
                    result = backend->fetch(repo, staging, stop);
                } catch (const std::exception& e) {
                    result = Error{ErrorCode::BackendFailure, e.what()};
                }

                std::lock_guard lock(attempt->mutex);
                if (attempt->abandoned) {
                    std::error_code cleanup_ec;
                    std::filesystem::remove_all(staging, cleanup_ec);
                    return Error{ErrorCode::Timeout, "Fetch of '" + repo + "' abandoned"};
                }
                attempt->finished = true;
                return result;
            });

        outcome = await_attempt(task, *attempt,
                                effective_timeout(timeout, options_.download_timeout),
                                "Download of '" + id + "'");
        if (outcome) {
            outcome = install_artifacts(staging, target);
        } else {
            log_pool_backlog(outcome.error());
        }
    }

    if (!outcome) {
        std::filesystem::remove_all(staging, ec);
        {
            std::lock_guard lock(record->state_mutex);
            record->state.download_in_flight = false;
        }
        record_failure(*record, prior, outcome.error());
        log_if(logger_, LogLevel::Error,
               "Download of '" + id + "' failed (" + std::string{to_string(outcome.error().code)}
               + "): " + outcome.error().message);
        return outcome;
    }

    auto elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - started);
    {
        std::lock_guard lock(record->state_mutex);
        record->state.download_in_flight = false;
        record->state.phase = prior == ResourcePhase::Loaded ? ResourcePhase::Loaded
                                                             : ResourcePhase::Downloaded;
        record->state.last_error.reset();
        record->state.last_transition = std::chrono::system_clock::now();
    }
    log_if(logger_, LogLevel::Info,
           "Downloaded '" + id + "' in " + std::to_string(elapsed.count()) + " ms");
    return {};
}

// ─────────────────────────────────────────────
// load
// ─────────────────────────────────────────────

Result<void> LifecycleManager::load(const ResourceId& id, const std::string& device,
                                    std::optional<Millis> timeout) {
    auto found = lookup(id);
    if (!found) return found.error();
    auto* record = *found;

    {
        std::lock_guard lock(record->state_mutex);
        if (record->state.download_in_flight) {
            return make_error<void>(ErrorCode::Conflict,
                                    "Download of '" + id + "' is in progress");
        }
    }

    std::lock_guard operation(record->operation_mutex);

    std::error_code ec;
    auto path = artifact_dir(id);
    if (!std::filesystem::is_directory(path, ec)) {
        std::lock_guard lock(record->state_mutex);
        if (record->state.phase != ResourcePhase::Loaded) {
            record->state.phase = ResourcePhase::NotDownloaded;
        }
        return make_error<void>(ErrorCode::Conflict, "'" + id + "' is not downloaded");
    }

    auto requested = device.empty() ? record->descriptor->default_device : device;
    auto resolved = resolve_device(requested);
    if (!is_known_device(backend_, resolved)) {
        return make_error<void>(ErrorCode::InvalidArgument,
                                "Unknown device '" + resolved + "' for '" + id + "'");
    }

    // Reload: the previous handle is gone before the new one is created.
    auto reload = unload_locked(*record);
    if (!reload) {
        log_if(logger_, LogLevel::Warn,
               "Releasing previous handle of '" + id + "' failed: " + reload.error().message);
    }

    set_phase(*record, ResourcePhase::Loading);
    log_if(logger_, LogLevel::Info, "Loading '" + id + "' on " + resolved
           + " (quantization " + std::string{to_string(record->descriptor->quantization)} + ")");

    auto rss_before = process_resident_bytes();
    auto started = std::chrono::steady_clock::now();

    auto attempt = std::make_shared<Attempt>();
    auto task = pool_.submit(
        [backend = &backend_, logger = logger_, path, resolved,
         quantization = record->descriptor->quantization,
         attempt](std::stop_token stop) -> Result<Materialized> {
            auto result = [&]() -> Result<Materialized> {
                try {
                    return backend->materialize(path, resolved, quantization, stop);
                } catch (const std::exception& e) {
                    return Error{ErrorCode::BackendFailure, e.what()};
                }
            }();

            std::lock_guard lock(attempt->mutex);
            if (attempt->abandoned) {
                if (result) {
                    auto released = backend->release(result->handle);
                    if (!released) {
                        log_if(logger, LogLevel::Warn,
                               "Releasing abandoned handle failed: " + released.error().message);
                    }
                }
                return Error{ErrorCode::Timeout, "Materialization abandoned"};
            }
            attempt->finished = true;
            return result;
        });

    auto materialized = await_attempt(task, *attempt,
                                      effective_timeout(timeout, options_.load_timeout),
                                      "Load of '" + id + "'");
    if (!materialized) {
        log_pool_backlog(materialized.error());
        {
            std::lock_guard lock(record->state_mutex);
            record->state.footprint_bytes = 0;
            record->state.load_duration = Millis{0};
        }
        record_failure(*record, ResourcePhase::Downloaded, materialized.error());
        log_if(logger_, LogLevel::Error,
               "Load of '" + id + "' failed (" + std::string{to_string(materialized.error().code)}
               + "): " + materialized.error().message);
        return materialized.error();
    }

    MaterializedResource resource(backend_, *materialized, resolved);
    auto elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - started);

    uint64_t footprint = resource.footprint_bytes();
    if (footprint == 0 && resolved == "cpu") {
        auto rss_after = process_resident_bytes();
        footprint = rss_after > rss_before ? rss_after - rss_before : 0;
    }

    {
        std::lock_guard lock(record->state_mutex);
        record->state.handle.emplace(std::move(resource));
        record->state.phase = ResourcePhase::Loaded;
        record->state.footprint_bytes = footprint;
        record->state.load_duration = elapsed;
        record->state.last_error.reset();
        record->state.last_transition = std::chrono::system_clock::now();
    }

    log_if(logger_, LogLevel::Info,
           "Loaded '" + id + "' on " + resolved + " in " + std::to_string(elapsed.count())
           + " ms, footprint " + std::to_string(footprint / (1024 * 1024)) + " MB");
    return {};
}

// ─────────────────────────────────────────────
// unload
// ─────────────────────────────────────────────

Result<void> LifecycleManager::unload(const ResourceId& id) {
    auto found = lookup(id);
    if (!found) return found.error();
    auto* record = *found;

    std::lock_guard operation(record->operation_mutex);
    return unload_locked(*record);
}

Result<void> LifecycleManager::unload_locked(ResourceRecord& record) {
    std::optional<MaterializedResource> handle;
    {
        std::lock_guard lock(record.state_mutex);
        if (record.state.phase != ResourcePhase::Loaded || !record.state.handle) {
            return {};
        }
        handle = std::move(record.state.handle);
        record.state.handle.reset();
        record.state.phase = ResourcePhase::Unloading;
        record.state.last_transition = std::chrono::system_clock::now();
    }

    const auto& id = record.descriptor->id;
    auto released = handle->release();
    handle.reset();
    backend_.reclaim();

    {
        std::lock_guard lock(record.state_mutex);
        record.state.phase = ResourcePhase::Downloaded;
        record.state.footprint_bytes = 0;
        record.state.load_duration = Millis{0};
        record.state.last_transition = std::chrono::system_clock::now();
        if (!released) record.state.last_error = released.error();
    }

    if (!released) {
        log_if(logger_, LogLevel::Error,
               "Release of '" + id + "' failed: " + released.error().message);
        return released;
    }
    log_if(logger_, LogLevel::Info, "Unloaded '" + id + "'");
    return {};
}

// ─────────────────────────────────────────────
// Readers
// ─────────────────────────────────────────────

std::optional<ServeRef> LifecycleManager::get(const ResourceId& id) const {
    auto* record = find_record(id);
    if (!record) return std::nullopt;

    std::lock_guard lock(record->state_mutex);
    const auto& state = record->state;
    if (state.phase != ResourcePhase::Loaded || !state.handle) return std::nullopt;
    return ServeRef{id, state.handle->handle(), state.handle->device()};
}

Result<ResourceStatus> LifecycleManager::state(const ResourceId& id) const {
    auto* record = find_record(id);
    if (!record) {
        return make_error<ResourceStatus>(ErrorCode::NotFound, "Unknown resource '" + id + "'");
    }
    return snapshot(*record);
}

std::vector<ResourceStatus> LifecycleManager::list() const {
    std::vector<ResourceStatus> statuses;
    statuses.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        statuses.push_back(snapshot(*record));
    }
    return statuses;
}

size_t LifecycleManager::loaded_count() const {
    size_t count = 0;
    for (const auto& [id, record] : records_) {
        std::lock_guard lock(record->state_mutex);
        if (record->state.phase == ResourcePhase::Loaded) ++count;
    }
    return count;
}

// ─────────────────────────────────────────────
// cleanup_all
// ─────────────────────────────────────────────

std::vector<Error> LifecycleManager::cleanup_all() {
    std::vector<Error> failures;
    size_t unloaded = 0;

    for (auto& [id, record] : records_) {
        std::lock_guard operation(record->operation_mutex);
        bool was_loaded = false;
        {
            std::lock_guard lock(record->state_mutex);
            was_loaded = record->state.phase == ResourcePhase::Loaded;
        }
        if (!was_loaded) continue;

        auto result = unload_locked(*record);
        if (result) {
            ++unloaded;
        } else {
            failures.emplace_back(result.error().code, id + ": " + result.error().message);
        }
    }

    if (unloaded > 0 || !failures.empty()) {
        log_if(logger_, LogLevel::Info,
               "Cleanup unloaded " + std::to_string(unloaded) + " resources, "
               + std::to_string(failures.size()) + " failures");
    }
    return failures;
}

}  // namespace model_keeper
