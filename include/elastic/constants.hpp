#pragma once

/// @file include/elastic/constants.hpp
/// @brief Default parameters and numerical tolerances for the Elastic kernel.

#include <cstddef>

namespace elastic::constants {

// ─── Elastic Property Defaults ────────────────────────────────────────────────

/// Mass of the simulated element. Must stay strictly positive.
static constexpr float DEFAULT_MASS = 1.0f;

/// Spring constant pulling the value toward the forcing input.
static constexpr float DEFAULT_HAND_K = 10.0f;

/// Spring constant of the end caps.
static constexpr float DEFAULT_END_K = 5.0f;

/// Spring constant of each snap point.
static constexpr float DEFAULT_SNAP_K = 5.0f;

/// Distance beyond which snap points and end magnetism exert no force.
static constexpr float DEFAULT_SNAP_RADIUS = 1.0f;

/// Velocity-proportional damping factor.
static constexpr float DEFAULT_DRAG = 1.0f;

// ─── Extent Defaults ──────────────────────────────────────────────────────────

static constexpr float DEFAULT_MIN_STRETCH = 0.0f;
static constexpr float DEFAULT_MAX_STRETCH = 1.0f;

// ─── Integration ──────────────────────────────────────────────────────────────

/// Default fixed step used by the trajectory driver (60 Hz frame).
static constexpr float DEFAULT_DELTA_TIME = 1.0f / 60.0f;

/// Hard upper bound on the step count accepted by settle().
static constexpr std::size_t MAX_SETTLE_STEPS = 1'000'000;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Below this norm a vector value has no defined radial direction; end-cap
/// forces are not applied to it.
static constexpr float DIRECTION_EPSILON = 1e-6f;

/// Default convergence band used by settle() for |v| and |forcing − x|.
static constexpr float DEFAULT_SETTLE_TOLERANCE = 1e-4f;

} // namespace elastic::constants
