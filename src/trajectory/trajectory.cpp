/// @file src/trajectory/trajectory.cpp
/// @brief simulate() / settle(): fixed-step drivers over ElasticSystem<T>.

#include "elastic/trajectory.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace elastic {

namespace {

bool valid_step(Scalar dt) noexcept {
    return std::isfinite(dt) && dt > 0.0f;
}

}  // anonymous namespace

// ─── simulate ─────────────────────────────────────────────────────────────────

template <typename T>
std::optional<std::vector<TrajectorySample<T>>>
simulate(ElasticSystem<T>& system,
         std::span<const std::type_identity_t<T>> forcing,
         const TrajectoryOptions& options) noexcept {
    using S = ValueSpace<T>;

    if (forcing.empty() || !valid_step(options.delta_time)) {
        return std::nullopt;
    }

    std::vector<TrajectorySample<T>> samples;
    samples.reserve(forcing.size());

    Scalar time = 0.0f;
    for (const T& f : forcing) {
        system.step(f, options.delta_time);
        time += options.delta_time;

        samples.push_back(TrajectorySample<T>{
            .time     = time,
            .forcing  = f,
            .value    = system.current_value(),
            .velocity = system.current_velocity(),
        });

        if (options.verbose) {
            fmt::print(stderr, "[elastic] t={:.4f}  forcing={}  x={}  v={}\n",
                       time, S::format(f),
                       S::format(samples.back().value),
                       S::format(samples.back().velocity));
        }
    }

    return samples;
}

// ─── settle ───────────────────────────────────────────────────────────────────

template <typename T>
std::optional<std::size_t>
settle(ElasticSystem<T>& system,
       const std::type_identity_t<T>& forcing,
       Scalar delta_time,
       Scalar tolerance,
       std::size_t max_steps) noexcept {
    using S = ValueSpace<T>;

    if (!valid_step(delta_time) || !std::isfinite(tolerance) ||
        tolerance <= 0.0f || !S::is_finite(forcing)) {
        return std::nullopt;
    }

    const std::size_t limit = std::min<std::size_t>(
        max_steps, constants::MAX_SETTLE_STEPS);

    for (std::size_t i = 1; i <= limit; ++i) {
        system.step(forcing, delta_time);
        if (!system.is_finite()) {
            return std::nullopt;
        }
        const Scalar speed  = S::norm(system.current_velocity());
        const Scalar offset = S::norm(S::subtract(forcing, system.current_value()));
        if (speed < tolerance && offset < tolerance) {
            return i;
        }
    }
    return std::nullopt;
}

// ─── Explicit instantiations ──────────────────────────────────────────────────

template std::optional<std::vector<TrajectorySample<Scalar>>>
simulate<Scalar>(ElasticSystem<Scalar>&, std::span<const Scalar>,
                 const TrajectoryOptions&) noexcept;
template std::optional<std::vector<TrajectorySample<Vector2>>>
simulate<Vector2>(ElasticSystem<Vector2>&, std::span<const Vector2>,
                  const TrajectoryOptions&) noexcept;
template std::optional<std::vector<TrajectorySample<Vector3>>>
simulate<Vector3>(ElasticSystem<Vector3>&, std::span<const Vector3>,
                  const TrajectoryOptions&) noexcept;
template std::optional<std::vector<TrajectorySample<Quaternion>>>
simulate<Quaternion>(ElasticSystem<Quaternion>&, std::span<const Quaternion>,
                     const TrajectoryOptions&) noexcept;

template std::optional<std::size_t>
settle<Scalar>(ElasticSystem<Scalar>&, const Scalar&, Scalar, Scalar,
               std::size_t) noexcept;
template std::optional<std::size_t>
settle<Vector2>(ElasticSystem<Vector2>&, const Vector2&, Scalar, Scalar,
                std::size_t) noexcept;
template std::optional<std::size_t>
settle<Vector3>(ElasticSystem<Vector3>&, const Vector3&, Scalar, Scalar,
                std::size_t) noexcept;
template std::optional<std::size_t>
settle<Quaternion>(ElasticSystem<Quaternion>&, const Quaternion&, Scalar,
                   Scalar, std::size_t) noexcept;

}  // namespace elastic
