/**
 * @file directory_backend.cpp
 * @brief DirectoryBackend — fetch from a local mirror, materialize into memory.
 */

#include "lifecycle/backends.hpp"

#include <malloc.h>

#include <algorithm>
#include <fstream>
#include <new>
#include <system_error>

namespace model_keeper {

bool is_known_device(const IModelBackend& backend, const std::string& device) {
    if (device == "cpu") return true;
    auto accelerators = backend.accelerators();
    return std::find(accelerators.begin(), accelerators.end(), device) != accelerators.end();
}

namespace {

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

}  // anonymous namespace

DirectoryBackend::DirectoryBackend(std::filesystem::path mirror_dir,
                                   std::vector<std::string> accelerators,
                                   uint64_t memory_limit_bytes)
    : mirror_dir_(std::move(mirror_dir))
    , accelerators_(std::move(accelerators))
    , memory_limit_bytes_(memory_limit_bytes) {}

DirectoryBackend::~DirectoryBackend() = default;

Result<void> DirectoryBackend::fetch(const std::string& repo_reference,
                                     const std::filesystem::path& destination,
                                     std::stop_token stop) {
    auto source = mirror_dir_ / repo_reference;
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec)) {
        return Error{ErrorCode::BackendFailure,
                     "Repository '" + repo_reference + "' not found in mirror " + mirror_dir_.string()};
    }

    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create " + destination.string() + ": " + ec.message()};
    }

    for (auto it = std::filesystem::recursive_directory_iterator(source, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (stop.stop_requested()) {
            remove_quietly(destination);
            return Error{ErrorCode::Timeout, "Fetch of '" + repo_reference + "' cancelled"};
        }

        auto relative = std::filesystem::relative(it->path(), source, ec);
        if (ec) break;
        auto target = destination / relative;

        if (it->is_directory(ec)) {
            std::filesystem::create_directories(target, ec);
        } else if (it->is_regular_file(ec)) {
            std::filesystem::copy_file(it->path(), target,
                                       std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) break;
    }

    if (ec) {
        remove_quietly(destination);
        return Error{ErrorCode::BackendFailure,
                     "Fetch of '" + repo_reference + "' failed: " + ec.message()};
    }
    return {};
}

Result<Materialized> DirectoryBackend::materialize(const std::filesystem::path& path,
                                                   const std::string& device,
                                                   QuantizationPolicy quantization,
                                                   std::stop_token stop) {
    if (!is_known_device(*this, device)) {
        return Error{ErrorCode::InvalidArgument, "Unsupported device '" + device + "'"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return Error{ErrorCode::BackendFailure, "No artifacts at " + path.string()};
    }

    uint64_t required = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) required += it->file_size(ec);
    }
    if (ec) {
        return Error{ErrorCode::BackendFailure, "Cannot scan " + path.string() + ": " + ec.message()};
    }

    {
        std::lock_guard lock(mutex_);
        if (memory_limit_bytes_ > 0 && resident_bytes_ + required > memory_limit_bytes_) {
            return Error{ErrorCode::ResourceExhausted,
                         "Materializing " + std::to_string(required) + " bytes exceeds the "
                         + std::to_string(memory_limit_bytes_) + " byte limit"};
        }
    }

    LoadedArtifacts artifacts;
    artifacts.quantization = quantization;
    artifacts.device = device;
    try {
        for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (stop.stop_requested()) {
                return Error{ErrorCode::Timeout, "Materialization of " + path.string() + " cancelled"};
            }
            if (!it->is_regular_file(ec)) continue;

            std::ifstream ifs(it->path(), std::ios::binary);
            if (!ifs) {
                return Error{ErrorCode::BackendFailure, "Cannot read " + it->path().string()};
            }
            std::vector<char> buffer(it->file_size(ec));
            ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            artifacts.bytes += buffer.size();
            artifacts.buffers.push_back(std::move(buffer));
        }
    } catch (const std::bad_alloc&) {
        return Error{ErrorCode::ResourceExhausted, "Out of memory materializing " + path.string()};
    }
    if (ec) {
        return Error{ErrorCode::BackendFailure, "Cannot read " + path.string() + ": " + ec.message()};
    }

    std::lock_guard lock(mutex_);
    Materialized result{next_handle_++, artifacts.bytes};
    resident_bytes_ += artifacts.bytes;
    loaded_.emplace(result.handle, std::move(artifacts));
    return result;
}

Result<void> DirectoryBackend::release(BackendHandle handle) {
    std::lock_guard lock(mutex_);
    auto it = loaded_.find(handle);
    if (it == loaded_.end()) {
        return Error{ErrorCode::BackendFailure, "Unknown handle " + std::to_string(handle)};
    }
    resident_bytes_ -= it->second.bytes;
    loaded_.erase(it);
    return {};
}

void DirectoryBackend::reclaim() {
    ::malloc_trim(0);
}

size_t DirectoryBackend::live_handles() const {
    std::lock_guard lock(mutex_);
    return loaded_.size();
}

uint64_t DirectoryBackend::resident_bytes() const {
    std::lock_guard lock(mutex_);
    return resident_bytes_;
}

}  // namespace model_keeper
