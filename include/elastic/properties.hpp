#pragma once

/// @file include/elastic/properties.hpp
/// @brief Extent and elastic configuration for a damped harmonic oscillator.
///
/// # Module: Properties
///
/// ## Responsibility
/// Describe the region an oscillator is free to move in
/// (ElasticExtentProperties<T>) and the constants of its differential system
/// (ElasticProperties), and validate both before an ElasticSystem is built.
///
/// ## Validation Rules
/// | Rule                          | Error                  |
/// |-------------------------------|------------------------|
/// | every parameter finite        | NonFiniteParameter     |
/// | mass > 0                      | NonPositiveMass        |
/// | snap_radius > 0               | NonPositiveSnapRadius  |
/// | drag >= 0                     | NegativeDrag           |
/// | min_stretch <= max_stretch    | InvertedExtent         |
/// | every snap point finite       | NonFiniteSnapPoint     |
///
/// ## Guarantees
/// - Validation is `noexcept` and reports the first violated rule
/// - Both structs are plain aggregates, copied into the oscillator

#include "elastic/constants.hpp"
#include "elastic/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace elastic {

// ─── ElasticExtentProperties ──────────────────────────────────────────────────

/// Properties of the extent in which the oscillator is free to move.
template <typename T>
struct ElasticExtentProperties {
    /// Lower bound of the extent, compared against ValueSpace<T>::radial.
    Scalar min_stretch = constants::DEFAULT_MIN_STRETCH;

    /// Upper bound of the extent, compared against ValueSpace<T>::radial.
    Scalar max_stretch = constants::DEFAULT_MAX_STRETCH;

    /// When inside the extent, magnetize toward both bounds as if they were
    /// snap points.
    bool snap_to_end = false;

    /// Interior attractors. Order does not matter; all contributions add.
    std::vector<T> snap_points{};
};

// ─── ElasticProperties ────────────────────────────────────────────────────────

/// Constants of the damped harmonic oscillator differential system.
struct ElasticProperties {
    Scalar mass        = constants::DEFAULT_MASS;         ///< Simulated mass (> 0)
    Scalar hand_k      = constants::DEFAULT_HAND_K;       ///< Forcing spring constant
    Scalar end_k       = constants::DEFAULT_END_K;        ///< End-cap spring constant
    Scalar snap_k      = constants::DEFAULT_SNAP_K;       ///< Snap-point spring constant
    Scalar snap_radius = constants::DEFAULT_SNAP_RADIUS;  ///< Snap falloff distance (> 0)
    Scalar drag        = constants::DEFAULT_DRAG;         ///< Velocity damping (>= 0)
};

// ─── ConfigError ──────────────────────────────────────────────────────────────

/// Reason a configuration was rejected.
enum class ConfigError {
    NonFiniteParameter,
    NonPositiveMass,
    NonPositiveSnapRadius,
    NegativeDrag,
    InvertedExtent,
    NonFiniteSnapPoint,
};

/// Convert ConfigError to a human-readable string.
[[nodiscard]] const char* to_string(ConfigError e) noexcept;

/// Validate the elastic constants.
///
/// # Returns
/// `nullopt` if the properties are usable, otherwise the first violated rule.
[[nodiscard]] std::optional<ConfigError>
validate(const ElasticProperties& properties) noexcept;

/// Validate an extent: finite, ordered bounds and finite snap points.
///
/// Instantiated for Scalar, Vector2, Vector3 and Quaternion.
template <typename T>
[[nodiscard]] std::optional<ConfigError>
validate(const ElasticExtentProperties<T>& extent) noexcept;

/// One-line summary, e.g. `mass=1.0000 hand_k=10.0000 ...`.
[[nodiscard]] std::string to_string(const ElasticProperties& properties);

extern template std::optional<ConfigError>
validate<Scalar>(const ElasticExtentProperties<Scalar>&) noexcept;
extern template std::optional<ConfigError>
validate<Vector2>(const ElasticExtentProperties<Vector2>&) noexcept;
extern template std::optional<ConfigError>
validate<Vector3>(const ElasticExtentProperties<Vector3>&) noexcept;
extern template std::optional<ConfigError>
validate<Quaternion>(const ElasticExtentProperties<Quaternion>&) noexcept;

} // namespace elastic
