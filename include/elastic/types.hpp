#pragma once

/// @file include/elastic/types.hpp
/// @brief Shared primitive types for the Elastic oscillator kernel.
///
/// Every module includes this file. It fixes the scalar precision of the
/// force model and defines the Eigen-based value types the oscillator can be
/// instantiated over.

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace elastic {

// ─── Scalar ───────────────────────────────────────────────────────────────────

/// Precision of every stretch bound, spring constant, mass and time step.
using Scalar = float;

// ─── Value Types ──────────────────────────────────────────────────────────────

/// A point or displacement in a planar extent (e.g. a 2-D slider).
using Vector2 = Eigen::Vector<Scalar, 2>;

/// A point or displacement in a volumetric extent (e.g. a bounding box).
using Vector3 = Eigen::Vector<Scalar, 3>;

/// A rotation-like value. The oscillator treats it as the 4-vector of its
/// coefficients (x, y, z, w); it is not kept on the unit sphere.
using Quaternion = Eigen::Quaternion<Scalar>;

} // namespace elastic
