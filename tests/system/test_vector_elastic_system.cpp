/// @file tests/system/test_vector_elastic_system.cpp
/// @brief Tests for PlanarElasticSystem and VolumeElasticSystem.

#include "elastic/elastic_system.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace elastic;

// ─── Hand term ────────────────────────────────────────────────────────────────

TEST(VolumeHand, ActsComponentWise) {
    ElasticExtentProperties<Vector3> extent{.min_stretch = 0.0f, .max_stretch = 10.0f};
    ElasticProperties props{.hand_k = 2.0f, .drag = 0.5f};
    auto sys = VolumeElasticSystem::create(Vector3(1.0f, 0.0f, 0.0f),
                                           Vector3(0.0f, 2.0f, 0.0f), extent, props);
    ASSERT_TRUE(sys.has_value());

    // (forcing − x)·2 − v·0.5
    const Vector3 hand = sys->compute_forces(Vector3(1.0f, 1.0f, 3.0f)).hand;
    EXPECT_NEAR(hand.x(), 0.0f, 1e-6f);
    EXPECT_NEAR(hand.y(), 1.0f, 1e-6f);
    EXPECT_NEAR(hand.z(), 6.0f, 1e-6f);
}

// ─── End caps on the norm ─────────────────────────────────────────────────────

TEST(VolumeEndCap, PullsRadiallyInward) {
    ElasticExtentProperties<Vector3> extent{.min_stretch = 0.0f, .max_stretch = 1.0f};
    ElasticProperties props{.end_k = 5.0f};
    const Vector3 x(0.0f, 2.0f, 0.0f);
    auto sys = VolumeElasticSystem::create(x, Vector3::Zero(), extent, props);
    ASSERT_TRUE(sys.has_value());

    const auto f = sys->compute_forces(x);
    // ‖x‖ = 2 > 1 → (1 − 2)·5 along +y
    EXPECT_NEAR(f.upper_end.x(), 0.0f, 1e-6f);
    EXPECT_NEAR(f.upper_end.y(), -5.0f, 1e-5f);
    EXPECT_NEAR(f.upper_end.z(), 0.0f, 1e-6f);
    EXPECT_TRUE(f.lower_end.isZero());
}

TEST(VolumeEndCap, LowerBoundPushesOutward) {
    ElasticExtentProperties<Vector3> extent{.min_stretch = 1.0f, .max_stretch = 2.0f};
    ElasticProperties props{.end_k = 4.0f};
    const Vector3 x(0.3f, 0.0f, 0.4f);  // ‖x‖ = 0.5
    auto sys = VolumeElasticSystem::create(x, Vector3::Zero(), extent, props);
    ASSERT_TRUE(sys.has_value());

    const Vector3 lower = sys->compute_forces(x).lower_end;
    // (1 − 0.5)·4 = 2 along x/‖x‖ = (0.6, 0, 0.8)
    EXPECT_NEAR(lower.x(), 1.2f, 1e-5f);
    EXPECT_NEAR(lower.y(), 0.0f, 1e-6f);
    EXPECT_NEAR(lower.z(), 1.6f, 1e-5f);
}

TEST(VolumeEndCap, NoDirectionAtOrigin) {
    ElasticExtentProperties<Vector3> extent{.min_stretch = 0.5f, .max_stretch = 2.0f};
    auto sys = VolumeElasticSystem::create(Vector3::Zero(), Vector3::Zero(),
                                           extent, ElasticProperties{});
    ASSERT_TRUE(sys.has_value());
    EXPECT_TRUE(sys->compute_forces(Vector3::Zero()).lower_end.isZero());

    sys->step(Vector3::Zero(), 0.1f);
    EXPECT_TRUE(sys->is_finite());
}

// ─── Snap points ──────────────────────────────────────────────────────────────

TEST(VolumeSnap, FalloffUsesEuclideanDistance) {
    ElasticExtentProperties<Vector3> extent{
        .min_stretch = 0.0f, .max_stretch = 5.0f,
        .snap_points = {Vector3(1.0f, 0.0f, 0.0f)}};
    ElasticProperties props{.snap_k = 10.0f, .snap_radius = 0.5f};
    const Vector3 x(1.0f, 0.3f, 0.0f);
    auto sys = VolumeElasticSystem::create(x, Vector3::Zero(), extent, props);
    ASSERT_TRUE(sys.has_value());

    // d = (0, −0.3, 0), factor = 1 − 0.6 = 0.4 → (0, −1.2, 0)
    const Vector3 snap = sys->compute_forces(x).snap;
    EXPECT_NEAR(snap.x(), 0.0f, 1e-6f);
    EXPECT_NEAR(snap.y(), -1.2f, 1e-5f);
    EXPECT_NEAR(snap.z(), 0.0f, 1e-6f);
}

TEST(VolumeSnap, BeyondRadiusContributesNothing) {
    ElasticExtentProperties<Vector3> extent{
        .min_stretch = 0.0f, .max_stretch = 5.0f,
        .snap_points = {Vector3(1.0f, 0.0f, 0.0f)}};
    ElasticProperties props{.snap_k = 10.0f, .snap_radius = 0.5f};
    const Vector3 x(1.0f, 0.4f, 0.4f);  // distance ≈ 0.566
    auto sys = VolumeElasticSystem::create(x, Vector3::Zero(), extent, props);
    ASSERT_TRUE(sys.has_value());
    EXPECT_NEAR(sys->compute_forces(x).snap.norm(), 0.0f, 1e-6f);
}

// ─── Reduction to the scalar model ────────────────────────────────────────────

TEST(PlanarModel, MatchesLinearModelAlongPositiveAxis) {
    ElasticProperties props{.mass = 1.0f, .hand_k = 8.0f, .end_k = 5.0f,
                            .snap_k = 6.0f, .snap_radius = 0.3f, .drag = 3.0f};
    auto linear = LinearElasticSystem::create(
        0.6f, 0.0f,
        {.min_stretch = 0.2f, .max_stretch = 1.0f, .snap_to_end = true, .snap_points = {0.5f}},
        props);
    auto planar = PlanarElasticSystem::create(
        Vector2(0.6f, 0.0f), Vector2::Zero(),
        {.min_stretch = 0.2f, .max_stretch = 1.0f, .snap_to_end = true,
         .snap_points = {Vector2(0.5f, 0.0f)}},
        props);
    ASSERT_TRUE(linear.has_value());
    ASSERT_TRUE(planar.has_value());

    for (int i = 0; i < 200; ++i) {
        const Scalar x = linear->step(0.9f, 0.02f);
        const Vector2 p = planar->step(Vector2(0.9f, 0.0f), 0.02f);
        ASSERT_NEAR(p.x(), x, 1e-4f) << "step " << i;
        ASSERT_NEAR(p.y(), 0.0f, 1e-6f) << "step " << i;
    }
}

TEST(PlanarModel, EquilibriumAtForcingValue) {
    ElasticProperties props{.mass = 1.0f, .hand_k = 10.0f, .end_k = 5.0f,
                            .snap_k = 0.0f, .snap_radius = 1.0f, .drag = 4.0f};
    auto sys = PlanarElasticSystem::create(
        Vector2::Zero(), Vector2::Zero(),
        {.min_stretch = 0.0f, .max_stretch = 5.0f}, props);
    ASSERT_TRUE(sys.has_value());

    const Vector2 target(0.3f, -0.4f);
    for (int i = 0; i < 2000; ++i) {
        sys->step(target, 0.01f);
    }
    EXPECT_LT((sys->current_value() - target).norm(), 1e-4f);
    EXPECT_LT(sys->current_velocity().norm(), 1e-4f);
}

TEST(VolumeStep, RejectedInputLeavesStateUnchanged) {
    auto sys = VolumeElasticSystem::create(Vector3(0.1f, 0.2f, 0.3f), Vector3::Zero(),
                                           {.min_stretch = 0.0f, .max_stretch = 1.0f},
                                           ElasticProperties{});
    ASSERT_TRUE(sys.has_value());
    sys->step(Vector3(NAN, 0.0f, 0.0f), 0.1f);
    sys->step(Vector3::Ones(), -1.0f);
    EXPECT_TRUE(sys->current_value().isApprox(Vector3(0.1f, 0.2f, 0.3f)));
    EXPECT_TRUE(sys->current_velocity().isZero());
}
