/**
 * @file resource_catalog.hpp
 * @brief Registry of known models and their declared requirements.
 *
 * The catalog is persisted as TOML: one [resources.<id>] table per entry.
 * It is read once at startup and written only when absent (built-in
 * defaults). Descriptors are immutable after load.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace model_keeper {

struct ResourceDescriptor {
    ResourceId id;
    std::string name;
    std::string description;
    std::string repo_reference;                 ///< Where the backend fetches artifacts from
    std::string kind = "decoder";               ///< "decoder" or "encoder"
    std::set<std::string> capabilities;
    std::string size_class = "unknown";         ///< Declared size, e.g. "2.2GB"
    std::string default_device = "auto";
    QuantizationPolicy quantization = QuantizationPolicy::None;
    uint32_t max_context_length = 512;

    [[nodiscard]] bool has_capability(std::string_view capability) const {
        return capabilities.count(std::string{capability}) > 0;
    }
};

/**
 * @brief Check that `id` is usable as a single directory name under the
 *        models directory.
 *
 * Rejects empty ids, ids containing a path separator, and ids starting with '.'
 * (which covers "." and ".." and the staging area).
 */
[[nodiscard]] Result<void> validate_resource_id(std::string_view id);

class ResourceCatalog {
public:
    ResourceCatalog() = default;

    /**
     * @brief Read the catalog at `path`, or write the built-in defaults there
     *        if the file does not exist yet.
     */
    static Result<ResourceCatalog> load_or_create(const std::filesystem::path& path,
                                                  Logger* logger = nullptr);

    /// Parse a catalog file. NotFound if absent, InvalidArgument if malformed
    /// or if an id fails validate_resource_id().
    static Result<ResourceCatalog> load(const std::filesystem::path& path);

    static ResourceCatalog from_descriptors(std::vector<ResourceDescriptor> descriptors);
    static std::vector<ResourceDescriptor> builtin_descriptors();

    Result<void> save(const std::filesystem::path& path) const;

    [[nodiscard]] const ResourceDescriptor* find(const ResourceId& id) const;
    [[nodiscard]] std::vector<ResourceId> ids() const;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

private:
    std::map<ResourceId, ResourceDescriptor> entries_;
};

}  // namespace model_keeper
