#pragma once

/// @file include/elastic/value_space.hpp
/// @brief ValueSpace<T>: vector-space operations the oscillator needs from T.
///
/// # Module: Value Spaces
///
/// ## Responsibility
/// Supply, per value type, the arithmetic and metric hooks used by the force
/// model in ElasticSystem<T>:
///   - vector-space arithmetic: zero, add, subtract, scale
///   - `norm`             : magnitude of a displacement (snap-point falloff)
///   - `radial`           : coordinate compared against min/max stretch
///   - `radial_direction` : unit direction along which end-cap forces act
///
/// ## Radial Coordinate
/// | T          | radial(x) | radial_direction(x)            |
/// |------------|-----------|--------------------------------|
/// | Scalar     | x         | 1                              |
/// | Vector2/3  | ‖x‖       | x / ‖x‖, or 0 at the origin    |
/// | Quaternion | ‖coeffs‖  | coeffs / ‖coeffs‖, or 0        |
///
/// For scalars the extent is signed, so [min, max] may straddle zero. For
/// every other space the extent is a shell around the origin.
///
/// ## Guarantees
/// - All operations are `noexcept` and stateless
/// - `radial_direction` never divides by a norm below DIRECTION_EPSILON

#include "elastic/types.hpp"

#include <string>

namespace elastic {

/// Primary template. Only the specialisations below are defined.
template <typename T>
struct ValueSpace;

// ─── Scalar ───────────────────────────────────────────────────────────────────

template <>
struct ValueSpace<Scalar> {
    [[nodiscard]] static Scalar zero() noexcept;
    [[nodiscard]] static Scalar add(Scalar a, Scalar b) noexcept;
    [[nodiscard]] static Scalar subtract(Scalar a, Scalar b) noexcept;
    [[nodiscard]] static Scalar scale(Scalar a, Scalar k) noexcept;
    [[nodiscard]] static Scalar norm(Scalar a) noexcept;
    [[nodiscard]] static Scalar radial(Scalar a) noexcept;
    [[nodiscard]] static Scalar radial_direction(Scalar a) noexcept;
    [[nodiscard]] static bool   is_finite(Scalar a) noexcept;

    /// Render as text, e.g. `0.2500`.
    [[nodiscard]] static std::string format(Scalar a);
};

// ─── Vector2 ──────────────────────────────────────────────────────────────────

template <>
struct ValueSpace<Vector2> {
    [[nodiscard]] static Vector2 zero() noexcept;
    [[nodiscard]] static Vector2 add(const Vector2& a, const Vector2& b) noexcept;
    [[nodiscard]] static Vector2 subtract(const Vector2& a, const Vector2& b) noexcept;
    [[nodiscard]] static Vector2 scale(const Vector2& a, Scalar k) noexcept;
    [[nodiscard]] static Scalar  norm(const Vector2& a) noexcept;
    [[nodiscard]] static Scalar  radial(const Vector2& a) noexcept;
    [[nodiscard]] static Vector2 radial_direction(const Vector2& a) noexcept;
    [[nodiscard]] static bool    is_finite(const Vector2& a) noexcept;

    /// Render as text, e.g. `(0.2500, -1.0000)`.
    [[nodiscard]] static std::string format(const Vector2& a);
};

// ─── Vector3 ──────────────────────────────────────────────────────────────────

template <>
struct ValueSpace<Vector3> {
    [[nodiscard]] static Vector3 zero() noexcept;
    [[nodiscard]] static Vector3 add(const Vector3& a, const Vector3& b) noexcept;
    [[nodiscard]] static Vector3 subtract(const Vector3& a, const Vector3& b) noexcept;
    [[nodiscard]] static Vector3 scale(const Vector3& a, Scalar k) noexcept;
    [[nodiscard]] static Scalar  norm(const Vector3& a) noexcept;
    [[nodiscard]] static Scalar  radial(const Vector3& a) noexcept;
    [[nodiscard]] static Vector3 radial_direction(const Vector3& a) noexcept;
    [[nodiscard]] static bool    is_finite(const Vector3& a) noexcept;

    [[nodiscard]] static std::string format(const Vector3& a);
};

// ─── Quaternion ───────────────────────────────────────────────────────────────

/// Quaternions are springs in the 4-D space of their coefficients.
///
/// Values produced by the oscillator drift off the unit sphere; use
/// `orientation()` to obtain a proper rotation for display.
template <>
struct ValueSpace<Quaternion> {
    [[nodiscard]] static Quaternion zero() noexcept;
    [[nodiscard]] static Quaternion add(const Quaternion& a, const Quaternion& b) noexcept;
    [[nodiscard]] static Quaternion subtract(const Quaternion& a, const Quaternion& b) noexcept;
    [[nodiscard]] static Quaternion scale(const Quaternion& a, Scalar k) noexcept;
    [[nodiscard]] static Scalar     norm(const Quaternion& a) noexcept;
    [[nodiscard]] static Scalar     radial(const Quaternion& a) noexcept;
    [[nodiscard]] static Quaternion radial_direction(const Quaternion& a) noexcept;
    [[nodiscard]] static bool       is_finite(const Quaternion& a) noexcept;

    /// Normalized rotation for `a`; identity when ‖coeffs‖ < DIRECTION_EPSILON.
    [[nodiscard]] static Quaternion orientation(const Quaternion& a) noexcept;

    /// Render as text in (w, x, y, z) order.
    [[nodiscard]] static std::string format(const Quaternion& a);
};

} // namespace elastic
