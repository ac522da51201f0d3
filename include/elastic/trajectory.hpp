#pragma once

/// @file include/elastic/trajectory.hpp
/// @brief Fixed-step drivers that run an ElasticSystem over many frames.
///
/// # Module: Trajectory
///
/// ## Responsibility
/// Batch helpers for callers that already hold a whole forcing sequence
/// (offline tuning, tests, benchmarks):
///   - `simulate`  one step per forcing sample, recording every state
///   - `settle`    step toward a constant forcing value until at rest
///
/// Both mutate the system they are given; its state after the call is the
/// state after the last step taken.

#include "elastic/constants.hpp"
#include "elastic/elastic_system.hpp"
#include "elastic/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <vector>

namespace elastic {

// ─── TrajectoryOptions ────────────────────────────────────────────────────────

/// Configuration for simulate().
struct TrajectoryOptions {
    /// Fixed step applied to every sample. Must be finite and > 0.
    Scalar delta_time = constants::DEFAULT_DELTA_TIME;

    /// If true, emit one line per step to stderr.
    bool verbose = false;
};

// ─── TrajectorySample ─────────────────────────────────────────────────────────

/// State of the oscillator after one step of simulate().
template <typename T>
struct TrajectorySample {
    Scalar time;      ///< Elapsed time at the end of the step
    T      forcing;   ///< Forcing value applied during the step
    T      value;     ///< Value after the step
    T      velocity;  ///< Velocity after the step
};

// ─── simulate ─────────────────────────────────────────────────────────────────

/// Step `system` once per entry of `forcing` with a fixed delta time.
///
/// # Returns
/// One sample per forcing entry, or `nullopt` if `forcing` is empty or
/// `options.delta_time` is not finite and positive.
template <typename T>
[[nodiscard]] std::optional<std::vector<TrajectorySample<T>>>
simulate(ElasticSystem<T>& system,
         std::span<const std::type_identity_t<T>> forcing,
         const TrajectoryOptions& options = TrajectoryOptions{}) noexcept;

// ─── settle ───────────────────────────────────────────────────────────────────

/// Step toward a constant `forcing` value until the system comes to rest.
///
/// At rest means ‖v‖ < tolerance and ‖forcing − x‖ < tolerance. With snap
/// points or end magnetism active the rest point may differ from `forcing`;
/// such a system only settles if the tolerance admits the offset.
///
/// # Returns
/// Number of steps taken, or `nullopt` if the system did not settle within
/// `max_steps` (clamped to MAX_SETTLE_STEPS), diverged, or the arguments
/// are invalid.
template <typename T>
[[nodiscard]] std::optional<std::size_t>
settle(ElasticSystem<T>& system,
       const std::type_identity_t<T>& forcing,
       Scalar delta_time,
       Scalar tolerance = constants::DEFAULT_SETTLE_TOLERANCE,
       std::size_t max_steps = 10'000) noexcept;

extern template std::optional<std::vector<TrajectorySample<Scalar>>>
simulate<Scalar>(ElasticSystem<Scalar>&, std::span<const Scalar>,
                 const TrajectoryOptions&) noexcept;
extern template std::optional<std::vector<TrajectorySample<Vector2>>>
simulate<Vector2>(ElasticSystem<Vector2>&, std::span<const Vector2>,
                  const TrajectoryOptions&) noexcept;
extern template std::optional<std::vector<TrajectorySample<Vector3>>>
simulate<Vector3>(ElasticSystem<Vector3>&, std::span<const Vector3>,
                  const TrajectoryOptions&) noexcept;
extern template std::optional<std::vector<TrajectorySample<Quaternion>>>
simulate<Quaternion>(ElasticSystem<Quaternion>&, std::span<const Quaternion>,
                     const TrajectoryOptions&) noexcept;

extern template std::optional<std::size_t>
settle<Scalar>(ElasticSystem<Scalar>&, const Scalar&, Scalar, Scalar,
               std::size_t) noexcept;
extern template std::optional<std::size_t>
settle<Vector2>(ElasticSystem<Vector2>&, const Vector2&, Scalar, Scalar,
                std::size_t) noexcept;
extern template std::optional<std::size_t>
settle<Vector3>(ElasticSystem<Vector3>&, const Vector3&, Scalar, Scalar,
                std::size_t) noexcept;
extern template std::optional<std::size_t>
settle<Quaternion>(ElasticSystem<Quaternion>&, const Quaternion&, Scalar,
                   Scalar, std::size_t) noexcept;

} // namespace elastic
