/// @file src/system/value_space.cpp
/// @brief ValueSpace<T> specialisations for Scalar, Vector2, Vector3, Quaternion.

#include "elastic/value_space.hpp"
#include "elastic/constants.hpp"

#include <fmt/format.h>

#include <cmath>

namespace elastic {

namespace {

/// x / ‖x‖ for any fixed-size Eigen vector, or zero at the origin.
template <typename V>
V unit_or_zero(const V& v) noexcept {
    const Scalar n = v.norm();
    if (!(n >= constants::DIRECTION_EPSILON)) {
        return V::Zero();
    }
    return v / n;
}

Quaternion from_coeffs(const Eigen::Vector<Scalar, 4>& c) noexcept {
    Quaternion q;
    q.coeffs() = c;
    return q;
}

}  // anonymous namespace

// ─── Scalar ───────────────────────────────────────────────────────────────────

Scalar ValueSpace<Scalar>::zero() noexcept { return 0.0f; }

Scalar ValueSpace<Scalar>::add(Scalar a, Scalar b) noexcept { return a + b; }

Scalar ValueSpace<Scalar>::subtract(Scalar a, Scalar b) noexcept { return a - b; }

Scalar ValueSpace<Scalar>::scale(Scalar a, Scalar k) noexcept { return a * k; }

Scalar ValueSpace<Scalar>::norm(Scalar a) noexcept { return std::abs(a); }

Scalar ValueSpace<Scalar>::radial(Scalar a) noexcept {
    // The scalar extent is signed: compare the raw value, not |x|.
    return a;
}

Scalar ValueSpace<Scalar>::radial_direction(Scalar) noexcept { return 1.0f; }

bool ValueSpace<Scalar>::is_finite(Scalar a) noexcept { return std::isfinite(a); }

std::string ValueSpace<Scalar>::format(Scalar a) {
    return fmt::format("{:.4f}", a);
}

// ─── Vector2 ──────────────────────────────────────────────────────────────────

Vector2 ValueSpace<Vector2>::zero() noexcept { return Vector2::Zero(); }

Vector2 ValueSpace<Vector2>::add(const Vector2& a, const Vector2& b) noexcept {
    return a + b;
}

Vector2 ValueSpace<Vector2>::subtract(const Vector2& a, const Vector2& b) noexcept {
    return a - b;
}

Vector2 ValueSpace<Vector2>::scale(const Vector2& a, Scalar k) noexcept {
    return a * k;
}

Scalar ValueSpace<Vector2>::norm(const Vector2& a) noexcept { return a.norm(); }

Scalar ValueSpace<Vector2>::radial(const Vector2& a) noexcept { return a.norm(); }

Vector2 ValueSpace<Vector2>::radial_direction(const Vector2& a) noexcept {
    return unit_or_zero(a);
}

bool ValueSpace<Vector2>::is_finite(const Vector2& a) noexcept {
    return a.allFinite();
}

std::string ValueSpace<Vector2>::format(const Vector2& a) {
    return fmt::format("({:.4f}, {:.4f})", a.x(), a.y());
}

// ─── Vector3 ──────────────────────────────────────────────────────────────────

Vector3 ValueSpace<Vector3>::zero() noexcept { return Vector3::Zero(); }

Vector3 ValueSpace<Vector3>::add(const Vector3& a, const Vector3& b) noexcept {
    return a + b;
}

Vector3 ValueSpace<Vector3>::subtract(const Vector3& a, const Vector3& b) noexcept {
    return a - b;
}

Vector3 ValueSpace<Vector3>::scale(const Vector3& a, Scalar k) noexcept {
    return a * k;
}

Scalar ValueSpace<Vector3>::norm(const Vector3& a) noexcept { return a.norm(); }

Scalar ValueSpace<Vector3>::radial(const Vector3& a) noexcept { return a.norm(); }

Vector3 ValueSpace<Vector3>::radial_direction(const Vector3& a) noexcept {
    return unit_or_zero(a);
}

bool ValueSpace<Vector3>::is_finite(const Vector3& a) noexcept {
    return a.allFinite();
}

std::string ValueSpace<Vector3>::format(const Vector3& a) {
    return fmt::format("({:.4f}, {:.4f}, {:.4f})", a.x(), a.y(), a.z());
}

// ─── Quaternion ───────────────────────────────────────────────────────────────

Quaternion ValueSpace<Quaternion>::zero() noexcept {
    return from_coeffs(Eigen::Vector<Scalar, 4>::Zero());
}

Quaternion ValueSpace<Quaternion>::add(const Quaternion& a,
                                       const Quaternion& b) noexcept {
    return from_coeffs(a.coeffs() + b.coeffs());
}

Quaternion ValueSpace<Quaternion>::subtract(const Quaternion& a,
                                            const Quaternion& b) noexcept {
    return from_coeffs(a.coeffs() - b.coeffs());
}

Quaternion ValueSpace<Quaternion>::scale(const Quaternion& a, Scalar k) noexcept {
    return from_coeffs(a.coeffs() * k);
}

Scalar ValueSpace<Quaternion>::norm(const Quaternion& a) noexcept {
    return a.coeffs().norm();
}

Scalar ValueSpace<Quaternion>::radial(const Quaternion& a) noexcept {
    return a.coeffs().norm();
}

Quaternion ValueSpace<Quaternion>::radial_direction(const Quaternion& a) noexcept {
    return from_coeffs(unit_or_zero(Eigen::Vector<Scalar, 4>(a.coeffs())));
}

bool ValueSpace<Quaternion>::is_finite(const Quaternion& a) noexcept {
    return a.coeffs().allFinite();
}

Quaternion ValueSpace<Quaternion>::orientation(const Quaternion& a) noexcept {
    if (!(a.coeffs().norm() >= constants::DIRECTION_EPSILON)) {
        return Quaternion::Identity();
    }
    return a.normalized();
}

std::string ValueSpace<Quaternion>::format(const Quaternion& a) {
    return fmt::format("({:.4f}, {:.4f}, {:.4f}, {:.4f})",
                       a.w(), a.x(), a.y(), a.z());
}

}  // namespace elastic
