/// @file src/system/elastic_system.cpp
/// @brief ElasticSystem<T>: force model and semi-implicit Euler integration.
///
/// Each step:
///   1. Sum the hand, upper end, lower end and snap-point forces
///   2. a = F / mass
///   3. v += a·dt, then x += v·dt with the updated velocity
///
/// Definitions live here and are explicitly instantiated for the four
/// supported value types at the bottom of the file.

#include "elastic/elastic_system.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace elastic {

namespace {

Scalar clamp01(Scalar v) noexcept {
    return std::clamp(v, 0.0f, 1.0f);
}

/// Falloff shared by snap points and end magnetism: 1 at distance 0,
/// linearly down to 0 at snap_radius, and 0 beyond.
Scalar proximity(Scalar distance, Scalar snap_radius) noexcept {
    return 1.0f - clamp01(std::abs(distance / snap_radius));
}

}  // anonymous namespace

// ─── ForceBreakdown ───────────────────────────────────────────────────────────

template <typename T>
T ForceBreakdown<T>::total() const noexcept {
    using S = ValueSpace<T>;
    return S::add(S::add(hand, upper_end), S::add(lower_end, snap));
}

template <typename T>
std::string ForceBreakdown<T>::to_string() const {
    using S = ValueSpace<T>;
    return fmt::format(
        "hand      = {}\n"
        "upper_end = {}\n"
        "lower_end = {}\n"
        "snap      = {}\n"
        "total     = {}\n",
        S::format(hand), S::format(upper_end), S::format(lower_end),
        S::format(snap), S::format(total()));
}

// ─── Construction ─────────────────────────────────────────────────────────────

template <typename T>
ElasticSystem<T>::ElasticSystem(const T& initial_value,
                                const T& initial_velocity,
                                ElasticExtentProperties<T> extent,
                                ElasticProperties properties) noexcept
    : extent_(std::move(extent)),
      properties_(properties),
      value_(initial_value),
      velocity_(initial_velocity) {}

template <typename T>
std::optional<ElasticSystem<T>>
ElasticSystem<T>::create(const T& initial_value,
                         const T& initial_velocity,
                         ElasticExtentProperties<T> extent,
                         ElasticProperties properties) noexcept {
    if (validate(properties) || validate(extent)) {
        return std::nullopt;
    }
    if (!Space::is_finite(initial_value) || !Space::is_finite(initial_velocity)) {
        return std::nullopt;
    }
    return ElasticSystem(initial_value, initial_velocity,
                         std::move(extent), properties);
}

// ─── Force terms ──────────────────────────────────────────────────────────────

template <typename T>
T ElasticSystem<T>::end_force(Scalar bound, bool outside) const noexcept {
    // Signed distance from the current radial coordinate to the bound.
    const Scalar dist_from_end = bound - Space::radial(value_);

    Scalar magnitude = 0.0f;
    if (outside) {
        // One-sided restoring spring back into the extent.
        magnitude = dist_from_end * properties_.end_k;
    } else if (extent_.snap_to_end) {
        magnitude = dist_from_end * properties_.end_k
                  * proximity(dist_from_end, properties_.snap_radius);
    }
    return Space::scale(Space::radial_direction(value_), magnitude);
}

template <typename T>
T ElasticSystem<T>::snap_force(const T& point) const noexcept {
    const T dist_from_point = Space::subtract(point, value_);

    // −kx scaled by the clamped distance factor: full strength at the point,
    // nothing beyond snap_radius.
    return Space::scale(dist_from_point,
                        properties_.snap_k
                        * proximity(Space::norm(dist_from_point),
                                    properties_.snap_radius));
}

template <typename T>
ForceBreakdown<T>
ElasticSystem<T>::compute_forces(const T& forcing_value) const noexcept {
    // F = −kx − drag·v
    const T hand = Space::subtract(
        Space::scale(Space::subtract(forcing_value, value_), properties_.hand_k),
        Space::scale(velocity_, properties_.drag));

    const Scalar r = Space::radial(value_);

    T snap = Space::zero();
    for (const T& point : extent_.snap_points) {
        snap = Space::add(snap, snap_force(point));
    }

    return ForceBreakdown<T>{
        .hand      = hand,
        .upper_end = end_force(extent_.max_stretch, r > extent_.max_stretch),
        .lower_end = end_force(extent_.min_stretch, r < extent_.min_stretch),
        .snap      = snap,
    };
}

// ─── step ─────────────────────────────────────────────────────────────────────

template <typename T>
T ElasticSystem<T>::step(const T& forcing_value, Scalar delta_time) noexcept {
    // dt == 0 returns before the force is evaluated: inf·0 would be NaN.
    if (!std::isfinite(delta_time) || delta_time <= 0.0f ||
        !Space::is_finite(forcing_value)) {
        return value_;
    }

    const T force = compute_forces(forcing_value).total();

    // a = F / m
    const T accel = Space::scale(force, 1.0f / properties_.mass);

    // Velocity first; the new velocity advances the position.
    velocity_ = Space::add(velocity_, Space::scale(accel, delta_time));
    value_    = Space::add(value_, Space::scale(velocity_, delta_time));

    return value_;
}

// ─── Accessors ────────────────────────────────────────────────────────────────

template <typename T>
T ElasticSystem<T>::current_value() const noexcept {
    return value_;
}

template <typename T>
T ElasticSystem<T>::current_velocity() const noexcept {
    return velocity_;
}

template <typename T>
bool ElasticSystem<T>::is_finite() const noexcept {
    return Space::is_finite(value_) && Space::is_finite(velocity_);
}

template <typename T>
bool ElasticSystem<T>::reset(const T& value, const T& velocity) noexcept {
    if (!Space::is_finite(value) || !Space::is_finite(velocity)) {
        return false;
    }
    value_    = value;
    velocity_ = velocity;
    return true;
}

template <typename T>
ElasticExtentProperties<T> ElasticSystem<T>::extent() const {
    return extent_;
}

template <typename T>
ElasticProperties ElasticSystem<T>::properties() const noexcept {
    return properties_;
}

// ─── Explicit instantiations ──────────────────────────────────────────────────

template struct ForceBreakdown<Scalar>;
template struct ForceBreakdown<Vector2>;
template struct ForceBreakdown<Vector3>;
template struct ForceBreakdown<Quaternion>;

template class ElasticSystem<Scalar>;
template class ElasticSystem<Vector2>;
template class ElasticSystem<Vector3>;
template class ElasticSystem<Quaternion>;

}  // namespace elastic
