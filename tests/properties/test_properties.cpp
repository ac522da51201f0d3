/// @file tests/properties/test_properties.cpp
/// @brief Tests for configuration validation and rendering.

#include "elastic/properties.hpp"
#include "elastic/constants.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace elastic;
using namespace elastic::constants;

// ─── validate(ElasticProperties) ──────────────────────────────────────────────

TEST(ValidateProperties, DefaultsAreValid) {
    EXPECT_FALSE(validate(ElasticProperties{}).has_value());
}

TEST(ValidateProperties, DefaultsMatchConstants) {
    const ElasticProperties p;
    EXPECT_FLOAT_EQ(p.mass, DEFAULT_MASS);
    EXPECT_FLOAT_EQ(p.hand_k, DEFAULT_HAND_K);
    EXPECT_FLOAT_EQ(p.snap_radius, DEFAULT_SNAP_RADIUS);
    EXPECT_FLOAT_EQ(p.drag, DEFAULT_DRAG);
}

TEST(ValidateProperties, RejectsNonPositiveMass) {
    ElasticProperties p;
    p.mass = 0.0f;
    EXPECT_EQ(validate(p), ConfigError::NonPositiveMass);
    p.mass = -1.0f;
    EXPECT_EQ(validate(p), ConfigError::NonPositiveMass);
}

TEST(ValidateProperties, RejectsNonPositiveSnapRadius) {
    ElasticProperties p;
    p.snap_radius = 0.0f;
    EXPECT_EQ(validate(p), ConfigError::NonPositiveSnapRadius);
}

TEST(ValidateProperties, RejectsNegativeDrag) {
    ElasticProperties p;
    p.drag = -0.1f;
    EXPECT_EQ(validate(p), ConfigError::NegativeDrag);
}

TEST(ValidateProperties, ZeroDragAndSpringsAreValid) {
    ElasticProperties p{.mass = 1.0f, .hand_k = 0.0f, .end_k = 0.0f,
                        .snap_k = 0.0f, .snap_radius = 1.0f, .drag = 0.0f};
    EXPECT_FALSE(validate(p).has_value());
}

TEST(ValidateProperties, RejectsNonFinite) {
    ElasticProperties p;
    p.end_k = std::numeric_limits<Scalar>::infinity();
    EXPECT_EQ(validate(p), ConfigError::NonFiniteParameter);

    p = ElasticProperties{};
    p.mass = std::numeric_limits<Scalar>::quiet_NaN();
    EXPECT_EQ(validate(p), ConfigError::NonFiniteParameter);
}

// ─── validate(ElasticExtentProperties) ────────────────────────────────────────

TEST(ValidateExtent, DefaultsAreValid) {
    EXPECT_FALSE(validate(ElasticExtentProperties<Scalar>{}).has_value());
    EXPECT_FALSE(validate(ElasticExtentProperties<Vector3>{}).has_value());
}

TEST(ValidateExtent, EqualBoundsAreValid) {
    ElasticExtentProperties<Scalar> e{.min_stretch = 0.5f, .max_stretch = 0.5f};
    EXPECT_FALSE(validate(e).has_value());
}

TEST(ValidateExtent, RejectsInvertedBounds) {
    ElasticExtentProperties<Vector2> e{.min_stretch = 1.0f, .max_stretch = 0.0f};
    EXPECT_EQ(validate(e), ConfigError::InvertedExtent);
}

TEST(ValidateExtent, RejectsNonFiniteBounds) {
    ElasticExtentProperties<Scalar> e;
    e.max_stretch = std::numeric_limits<Scalar>::infinity();
    EXPECT_EQ(validate(e), ConfigError::NonFiniteParameter);
}

TEST(ValidateExtent, RejectsNonFiniteSnapPoint) {
    ElasticExtentProperties<Vector3> e;
    e.snap_points = {Vector3::Zero(),
                     Vector3(0.0f, std::numeric_limits<Scalar>::quiet_NaN(), 0.0f)};
    EXPECT_EQ(validate(e), ConfigError::NonFiniteSnapPoint);
}

TEST(ValidateExtent, QuaternionSnapPoints) {
    ElasticExtentProperties<Quaternion> e{.min_stretch = 0.0f, .max_stretch = 2.0f};
    e.snap_points = {Quaternion::Identity()};
    EXPECT_FALSE(validate(e).has_value());
}

// ─── Rendering ────────────────────────────────────────────────────────────────

TEST(ConfigErrorToString, AllValuesNamed) {
    EXPECT_STREQ(to_string(ConfigError::NonFiniteParameter),    "NonFiniteParameter");
    EXPECT_STREQ(to_string(ConfigError::NonPositiveMass),       "NonPositiveMass");
    EXPECT_STREQ(to_string(ConfigError::NonPositiveSnapRadius), "NonPositiveSnapRadius");
    EXPECT_STREQ(to_string(ConfigError::NegativeDrag),          "NegativeDrag");
    EXPECT_STREQ(to_string(ConfigError::InvertedExtent),        "InvertedExtent");
    EXPECT_STREQ(to_string(ConfigError::NonFiniteSnapPoint),    "NonFiniteSnapPoint");
}

TEST(PropertiesToString, ListsEveryField) {
    const std::string s = to_string(ElasticProperties{});
    EXPECT_NE(s.find("mass=1.0000"), std::string::npos);
    EXPECT_NE(s.find("hand_k=10.0000"), std::string::npos);
    EXPECT_NE(s.find("snap_radius=1.0000"), std::string::npos);
    EXPECT_NE(s.find("drag=1.0000"), std::string::npos);
}
