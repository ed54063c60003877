/**
 * @file resource_catalog.cpp
 * @brief Catalog loading and persistence using toml++.
 */

#include "catalog/resource_catalog.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <system_error>

namespace model_keeper {

namespace {

Result<ResourceDescriptor> parse_descriptor(std::string_view id, const toml::table& entry) {
    if (auto valid = validate_resource_id(id); !valid) return valid.error();

    ResourceDescriptor d;
    d.id = std::string{id};
    d.name = entry["name"].value_or(std::string{d.id});
    d.description = entry["description"].value_or(std::string{});
    d.repo_reference = entry["repo_reference"].value_or(std::string{d.id});
    d.kind = entry["kind"].value_or(std::string{"decoder"});
    d.size_class = entry["size"].value_or(std::string{"unknown"});
    d.default_device = entry["device"].value_or(std::string{"auto"});

    auto quantization = entry["quantization"].value_or(std::string{"none"});
    auto policy = parse_quantization(quantization);
    if (!policy) {
        return Error{ErrorCode::InvalidArgument,
                     "Resource " + d.id + ": unknown quantization '" + quantization + "'"};
    }
    d.quantization = *policy;

    auto max_length = entry["max_length"].value_or(int64_t{512});
    if (max_length <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Resource " + d.id + ": max_length must be positive"};
    }
    d.max_context_length = static_cast<uint32_t>(max_length);

    if (const auto* capabilities = entry["capabilities"].as_array()) {
        for (const auto& cap : *capabilities) {
            if (auto value = cap.value<std::string>()) {
                d.capabilities.insert(*value);
            }
        }
    }
    return d;
}

toml::table to_toml(const ResourceDescriptor& d) {
    toml::array capabilities;
    for (const auto& cap : d.capabilities) {
        capabilities.push_back(cap);
    }

    return toml::table{
        {"name", d.name},
        {"description", d.description},
        {"repo_reference", d.repo_reference},
        {"kind", d.kind},
        {"capabilities", std::move(capabilities)},
        {"size", d.size_class},
        {"device", d.default_device},
        {"quantization", std::string{to_string(d.quantization)}},
        {"max_length", static_cast<int64_t>(d.max_context_length)},
    };
}

}  // anonymous namespace

Result<void> validate_resource_id(std::string_view id) {
    if (id.empty()) {
        return make_error<void>(ErrorCode::InvalidArgument, "Resource id must not be empty");
    }
    if (id.front() == '.' || id.find_first_of("/\\") != std::string_view::npos) {
        return make_error<void>(ErrorCode::InvalidArgument,
                                "Resource id '" + std::string{id} + "' is not a plain directory name");
    }
    return {};
}

std::vector<ResourceDescriptor> ResourceCatalog::builtin_descriptors() {
    std::vector<ResourceDescriptor> defaults;

    ResourceDescriptor codebert;
    codebert.id = "codebert-small";
    codebert.name = "CodeBERT Small";
    codebert.description = "Lightweight code understanding and generation model";
    codebert.repo_reference = "microsoft/codebert-small";
    codebert.kind = "encoder";
    codebert.capabilities = {"code-completion", "bug-detection", "documentation"};
    codebert.size_class = "500MB";
    codebert.max_context_length = 512;
    defaults.push_back(std::move(codebert));

    ResourceDescriptor distilgpt2;
    distilgpt2.id = "distilgpt2-code";
    distilgpt2.name = "DistilGPT2 Code";
    distilgpt2.description = "Lightweight code generation model";
    distilgpt2.repo_reference = "distilgpt2";
    distilgpt2.capabilities = {"code-generation", "translation"};
    distilgpt2.size_class = "350MB";
    distilgpt2.quantization = QuantizationPolicy::Int8;
    distilgpt2.max_context_length = 1024;
    defaults.push_back(std::move(distilgpt2));

    ResourceDescriptor tinyllama;
    tinyllama.id = "tinyllama";
    tinyllama.name = "TinyLLaMA";
    tinyllama.description = "Small but capable language model for code";
    tinyllama.repo_reference = "TinyLlama/TinyLlama-1.1B-Chat-v1.0";
    tinyllama.capabilities = {"code-generation", "explanation", "refactoring"};
    tinyllama.size_class = "2.2GB";
    tinyllama.quantization = QuantizationPolicy::Int4;
    tinyllama.max_context_length = 2048;
    defaults.push_back(std::move(tinyllama));

    ResourceDescriptor starcoder;
    starcoder.id = "starcoderbase";
    starcoder.name = "StarCoder Base";
    starcoder.description = "Code generation model trained on multiple languages";
    starcoder.repo_reference = "bigcode/starcoderbase";
    starcoder.capabilities = {"code-generation", "translation", "completion"};
    starcoder.size_class = "15GB";
    starcoder.quantization = QuantizationPolicy::Int8;
    starcoder.max_context_length = 4096;
    defaults.push_back(std::move(starcoder));

    return defaults;
}

ResourceCatalog ResourceCatalog::from_descriptors(std::vector<ResourceDescriptor> descriptors) {
    ResourceCatalog catalog;
    for (auto& d : descriptors) {
        auto id = d.id;
        catalog.entries_.insert_or_assign(std::move(id), std::move(d));
    }
    return catalog;
}

Result<ResourceCatalog> ResourceCatalog::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Catalog file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        ResourceCatalog catalog;

        if (const auto* resources = tbl["resources"].as_table()) {
            for (const auto& [key, node] : *resources) {
                const auto* entry = node.as_table();
                if (!entry) {
                    return Error{ErrorCode::InvalidArgument,
                                 "Catalog entry '" + std::string{key.str()} + "' is not a table"};
                }
                auto descriptor = parse_descriptor(key.str(), *entry);
                if (!descriptor) return descriptor.error();
                catalog.entries_.emplace(descriptor->id, std::move(*descriptor));
            }
        }
        return catalog;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{"Catalog parse error: "} + std::string{err.description()}};
    }
}

Result<ResourceCatalog> ResourceCatalog::load_or_create(const std::filesystem::path& path,
                                                        Logger* logger) {
    if (std::filesystem::exists(path)) {
        auto loaded = load(path);
        if (loaded && logger) {
            logger->info("catalog", "Loaded " + std::to_string(loaded->size())
                         + " resources from " + path.string());
        }
        return loaded;
    }

    auto catalog = from_descriptors(builtin_descriptors());
    if (auto saved = catalog.save(path); !saved) {
        return saved.error();
    }
    if (logger) {
        logger->info("catalog", "Wrote default catalog with " + std::to_string(catalog.size())
                     + " resources to " + path.string());
    }
    return catalog;
}

Result<void> ResourceCatalog::save(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create " + path.parent_path().string()
                                        + ": " + ec.message()};
        }
    }

    toml::table resources;
    for (const auto& [id, descriptor] : entries_) {
        resources.insert_or_assign(id, to_toml(descriptor));
    }
    toml::table root{{"resources", std::move(resources)}};

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        return Error{ErrorCode::Io, "Cannot write catalog file: " + path.string()};
    }
    ofs << root << '\n';
    if (!ofs) {
        return Error{ErrorCode::Io, "Failed writing catalog file: " + path.string()};
    }
    return {};
}

const ResourceDescriptor* ResourceCatalog::find(const ResourceId& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<ResourceId> ResourceCatalog::ids() const {
    std::vector<ResourceId> out;
    out.reserve(entries_.size());
    for (const auto& [id, descriptor] : entries_) {
        out.push_back(id);
    }
    return out;
}

}  // namespace model_keeper
