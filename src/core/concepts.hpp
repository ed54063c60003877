/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ModelKeeper interfaces.
 *
 * Compile-time interface constraints for the components that are called on
 * every sampling tick.
 */

#pragma once

#include <concepts>

namespace model_keeper {

struct MetricSample;

// ─────────────────────────────────────────────
// MetricSourceLike
// ─────────────────────────────────────────────

/**
 * @concept MetricSourceLike
 * @brief Constrains types that can produce a point-in-time MetricSample.
 *
 * collect() must never throw: a failed reading degrades to a default sample.
 */
template <typename T>
concept MetricSourceLike = requires(T source) {
    { source.collect() } -> std::same_as<MetricSample>;
    { source.name() } -> std::convertible_to<const char*>;
};

}  // namespace model_keeper
