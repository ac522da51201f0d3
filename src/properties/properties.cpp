/// @file src/properties/properties.cpp
/// @brief Validation and text rendering for ElasticProperties / extents.

#include "elastic/properties.hpp"
#include "elastic/value_space.hpp"

#include <fmt/format.h>

#include <cmath>

namespace elastic {

// ─── to_string(ConfigError) ───────────────────────────────────────────────────

const char* to_string(ConfigError e) noexcept {
    switch (e) {
        case ConfigError::NonFiniteParameter:    return "NonFiniteParameter";
        case ConfigError::NonPositiveMass:       return "NonPositiveMass";
        case ConfigError::NonPositiveSnapRadius: return "NonPositiveSnapRadius";
        case ConfigError::NegativeDrag:          return "NegativeDrag";
        case ConfigError::InvertedExtent:        return "InvertedExtent";
        case ConfigError::NonFiniteSnapPoint:    return "NonFiniteSnapPoint";
    }
    return "Unknown";
}

// ─── validate(ElasticProperties) ──────────────────────────────────────────────

std::optional<ConfigError>
validate(const ElasticProperties& p) noexcept {
    for (Scalar v : {p.mass, p.hand_k, p.end_k, p.snap_k, p.snap_radius, p.drag}) {
        if (!std::isfinite(v)) {
            return ConfigError::NonFiniteParameter;
        }
    }
    if (p.mass <= 0.0f) {
        return ConfigError::NonPositiveMass;
    }
    if (p.snap_radius <= 0.0f) {
        return ConfigError::NonPositiveSnapRadius;
    }
    if (p.drag < 0.0f) {
        return ConfigError::NegativeDrag;
    }
    return std::nullopt;
}

// ─── validate(ElasticExtentProperties<T>) ─────────────────────────────────────

template <typename T>
std::optional<ConfigError>
validate(const ElasticExtentProperties<T>& extent) noexcept {
    if (!std::isfinite(extent.min_stretch) || !std::isfinite(extent.max_stretch)) {
        return ConfigError::NonFiniteParameter;
    }
    // A value can only sit beyond both bounds at once if they are inverted.
    if (extent.min_stretch > extent.max_stretch) {
        return ConfigError::InvertedExtent;
    }
    for (const T& point : extent.snap_points) {
        if (!ValueSpace<T>::is_finite(point)) {
            return ConfigError::NonFiniteSnapPoint;
        }
    }
    return std::nullopt;
}

template std::optional<ConfigError>
validate<Scalar>(const ElasticExtentProperties<Scalar>&) noexcept;
template std::optional<ConfigError>
validate<Vector2>(const ElasticExtentProperties<Vector2>&) noexcept;
template std::optional<ConfigError>
validate<Vector3>(const ElasticExtentProperties<Vector3>&) noexcept;
template std::optional<ConfigError>
validate<Quaternion>(const ElasticExtentProperties<Quaternion>&) noexcept;

// ─── to_string(ElasticProperties) ─────────────────────────────────────────────

std::string to_string(const ElasticProperties& p) {
    return fmt::format(
        "mass={:.4f} hand_k={:.4f} end_k={:.4f} snap_k={:.4f} "
        "snap_radius={:.4f} drag={:.4f}",
        p.mass, p.hand_k, p.end_k, p.snap_k, p.snap_radius, p.drag);
}

}  // namespace elastic
