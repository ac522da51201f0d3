#pragma once

/// @file include/elastic/elastic_system.hpp
/// @brief ElasticSystem<T>: damped harmonic oscillator over a value space T.
///
/// # Module: Elastic System
///
/// ## Responsibility
/// Own the (value, velocity) state of one oscillator together with its
/// extent and elastic configuration, and advance that state one step at a
/// time toward a caller-supplied forcing value.
///
/// ## Force Model
/// Written for the scalar case; vector spaces substitute ValueSpace<T>::radial
/// for x in the end-cap terms and apply them along radial_direction(x).
///
///   F_hand  = (forcing − x)·hand_k − drag·v
///   F_upper = (max − x)·end_k                    if x > max
///           = (max − x)·end_k·(1 − clamp01(|max − x| / r))   if snap_to_end
///   F_lower = (min − x)·end_k                    if x < min
///           = (min − x)·end_k·(1 − clamp01(|min − x| / r))   if snap_to_end
///   F_snap  = Σ_p (p − x)·snap_k·(1 − clamp01(‖p − x‖ / r))
///
/// where r = snap_radius. Integration is semi-implicit Euler:
///
///   v ← v + (F / mass)·dt
///   x ← x + v·dt            (uses the updated v)
///
/// ## Usage
/// ```cpp
/// ElasticExtentProperties<float> extent{.min_stretch = -1.0f, .max_stretch = 1.0f};
/// auto sys = LinearElasticSystem::create(0.0f, 0.0f, extent, ElasticProperties{});
/// if (sys) {
///     float x = sys->step(hand_position, frame_dt);
/// }
/// ```
///
/// ## Guarantees
/// - An instance only exists with a validated configuration
/// - `step` is `noexcept`; rejected inputs leave the state untouched
/// - Not thread-safe: one logical owner per instance

#include "elastic/properties.hpp"
#include "elastic/types.hpp"
#include "elastic/value_space.hpp"

#include <optional>
#include <string>

namespace elastic {

// ─── ForceBreakdown ───────────────────────────────────────────────────────────

/// The four additive force terms acting on an oscillator in its current state.
template <typename T>
struct ForceBreakdown {
    T hand;       ///< Forcing spring minus drag
    T upper_end;  ///< End cap or end magnetism at max_stretch
    T lower_end;  ///< End cap or end magnetism at min_stretch
    T snap;       ///< Sum over all snap points

    /// hand + upper_end + lower_end + snap
    [[nodiscard]] T total() const noexcept;

    /// Multi-line rendering of every term and the total.
    [[nodiscard]] std::string to_string() const;
};

// ─── ElasticSystem ────────────────────────────────────────────────────────────

/// Damped harmonic oscillator with end caps and snap points.
///
/// Instantiated for Scalar, Vector2, Vector3 and Quaternion; see the aliases
/// at the bottom of this file.
template <typename T>
class ElasticSystem {
public:
    using Space = ValueSpace<T>;

    /// Build an oscillator from its initial state and configuration.
    ///
    /// All arguments are copied. The extent and properties are validated
    /// with `validate()`.
    ///
    /// # Returns
    /// `nullopt` if either configuration is rejected, or if the initial
    /// value or velocity is non-finite.
    [[nodiscard]] static std::optional<ElasticSystem>
    create(const T& initial_value,
           const T& initial_velocity,
           ElasticExtentProperties<T> extent,
           ElasticProperties properties) noexcept;

    /// Advance the oscillator by one step toward `forcing_value`.
    ///
    /// A negative or non-finite `delta_time`, or a non-finite
    /// `forcing_value`, is rejected: the state is not modified and the
    /// current value is returned. `delta_time == 0` is a no-op as well.
    /// Large `delta_time` or stiff springs can
    /// make the explicit scheme diverge; that is not corrected here (see
    /// `is_finite()` and `reset()`).
    ///
    /// # Returns
    /// The new current value.
    T step(const T& forcing_value, Scalar delta_time) noexcept;

    /// Force terms for the current state. Does not modify the state.
    [[nodiscard]] ForceBreakdown<T>
    compute_forces(const T& forcing_value) const noexcept;

    [[nodiscard]] T current_value() const noexcept;
    [[nodiscard]] T current_velocity() const noexcept;

    /// True iff both value and velocity are finite.
    [[nodiscard]] bool is_finite() const noexcept;

    /// Overwrite the state, keeping the configuration. Affects later steps only.
    ///
    /// # Returns
    /// `false`, leaving the state untouched, if either argument is non-finite.
    [[nodiscard]] bool reset(const T& value, const T& velocity) noexcept;

    [[nodiscard]] ElasticExtentProperties<T> extent() const;
    [[nodiscard]] ElasticProperties properties() const noexcept;

private:
    ElasticSystem(const T& initial_value,
                  const T& initial_velocity,
                  ElasticExtentProperties<T> extent,
                  ElasticProperties properties) noexcept;

    /// One end-cap term for the bound at radial coordinate `bound`.
    ///
    /// `outside` is true when the value has crossed the bound; the force is
    /// then a one-sided linear spring. Otherwise end magnetism applies when
    /// snap_to_end is set.
    [[nodiscard]] T end_force(Scalar bound, bool outside) const noexcept;

    /// Attraction toward a single snap point.
    [[nodiscard]] T snap_force(const T& point) const noexcept;

    ElasticExtentProperties<T> extent_;
    ElasticProperties          properties_;
    T                          value_;
    T                          velocity_;
};

// ─── Variants ─────────────────────────────────────────────────────────────────

using LinearElasticSystem     = ElasticSystem<Scalar>;
using PlanarElasticSystem     = ElasticSystem<Vector2>;
using VolumeElasticSystem     = ElasticSystem<Vector3>;
using QuaternionElasticSystem = ElasticSystem<Quaternion>;

extern template struct ForceBreakdown<Scalar>;
extern template struct ForceBreakdown<Vector2>;
extern template struct ForceBreakdown<Vector3>;
extern template struct ForceBreakdown<Quaternion>;

extern template class ElasticSystem<Scalar>;
extern template class ElasticSystem<Vector2>;
extern template class ElasticSystem<Vector3>;
extern template class ElasticSystem<Quaternion>;

} // namespace elastic
