/**
 * @file types.hpp
 * @brief Fundamental types used throughout ModelKeeper.
 *
 * Defines ResourceId, the lifecycle phase and severity enumerations, and the
 * quantization policy vocabulary shared by the catalog, lifecycle and health
 * modules.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace model_keeper {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ResourceId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Quantization Policy
// ─────────────────────────────────────────────

enum class QuantizationPolicy : uint8_t {
    None,      ///< Full precision
    Int8,      ///< 8-bit weights
    Int4       ///< 4-bit weights (NF4)
};

[[nodiscard]] constexpr std::string_view to_string(QuantizationPolicy policy) noexcept {
    switch (policy) {
        case QuantizationPolicy::None: return "none";
        case QuantizationPolicy::Int8: return "8bit";
        case QuantizationPolicy::Int4: return "4bit";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<QuantizationPolicy> parse_quantization(std::string_view text) {
    if (text.empty() || text == "none") return QuantizationPolicy::None;
    if (text == "8bit") return QuantizationPolicy::Int8;
    if (text == "4bit") return QuantizationPolicy::Int4;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Resource Phase
// ─────────────────────────────────────────────

/**
 * @brief Lifecycle phase of a catalog resource.
 *
 * Stable phases are NotDownloaded, Downloaded and Loaded. The remaining
 * phases are only visible while an operation for the resource is in flight.
 */
enum class ResourcePhase : uint8_t {
    NotDownloaded,
    Downloading,
    Downloaded,
    Loading,
    Loaded,
    Unloading
};

[[nodiscard]] constexpr std::string_view to_string(ResourcePhase phase) noexcept {
    switch (phase) {
        case ResourcePhase::NotDownloaded: return "not_downloaded";
        case ResourcePhase::Downloading:   return "downloading";
        case ResourcePhase::Downloaded:    return "downloaded";
        case ResourcePhase::Loading:       return "loading";
        case ResourcePhase::Loaded:        return "loaded";
        case ResourcePhase::Unloading:     return "unloading";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_transitional(ResourcePhase phase) noexcept {
    return phase == ResourcePhase::Downloading
        || phase == ResourcePhase::Loading
        || phase == ResourcePhase::Unloading;
}

// ─────────────────────────────────────────────
// Severity
// ─────────────────────────────────────────────

/**
 * @brief Health severity, totally ordered for aggregation.
 */
enum class Severity : uint8_t {
    Healthy = 0,
    NotAvailable = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Healthy:      return "healthy";
        case Severity::NotAvailable: return "not_available";
        case Severity::Warning:      return "warning";
        case Severity::Error:        return "error";
        case Severity::Critical:     return "critical";
    }
    return "unknown";
}

[[nodiscard]] constexpr Severity worst(Severity a, Severity b) noexcept {
    return std::max(a, b);
}

}  // namespace model_keeper
