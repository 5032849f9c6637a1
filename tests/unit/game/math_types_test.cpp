#include <gtest/gtest.h>

#include <cmath>

#include "interact/game/math_types.hpp"
#include "interact/game/object_types.hpp"

using namespace interact::game;

// ═══════════════════════════════════════════════════════════════════════════
// Vector3
// ═══════════════════════════════════════════════════════════════════════════

TEST(Vector3Test, DefaultIsZero) {
    Vector3 v;
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
    EXPECT_FLOAT_EQ(v.z, 0.0f);
    EXPECT_EQ(v, Vector3::Zero());
}

TEST(Vector3Test, Arithmetic) {
    Vector3 a(1.0f, 2.0f, 3.0f);
    Vector3 b(4.0f, 5.0f, 6.0f);

    auto sum = a + b;
    EXPECT_FLOAT_EQ(sum.x, 5.0f);
    EXPECT_FLOAT_EQ(sum.z, 9.0f);

    auto diff = b - a;
    EXPECT_FLOAT_EQ(diff.y, 3.0f);

    auto scaled = 2.0f * a;
    EXPECT_FLOAT_EQ(scaled.z, 6.0f);
    EXPECT_FLOAT_EQ(a.Dot(b), 32.0f);
}

TEST(Vector3Test, LengthOfPythagoreanTriple) {
    Vector3 v(3.0f, 4.0f, 0.0f);
    EXPECT_FLOAT_EQ(v.LengthSquared(), 25.0f);
    EXPECT_FLOAT_EQ(v.Length(), 5.0f);
}

TEST(Vector3Test, DistanceIsEuclideanInAllThreeAxes) {
    Vector3 a(1.0f, 2.0f, 3.0f);
    Vector3 b(3.0f, 5.0f, 9.0f);   // dx=2 dy=3 dz=6
    EXPECT_FLOAT_EQ(a.DistanceTo(b), 7.0f);
}

TEST(Vector3Test, DistanceIsSymmetric) {
    const Vector3 points[] = {
        {0.0f, 0.0f, 0.0f},
        {-1234.5f, 877.25f, 12.0f},
        {4.99f, 0.0f, 0.0f},
        {-0.001f, 1e-3f, 250.0f},
    };
    for (const auto& a : points) {
        for (const auto& b : points) {
            EXPECT_EQ(a.DistanceTo(b), b.DistanceTo(a));
        }
    }
}

TEST(Vector3Test, DistanceToSelfIsZero) {
    const Vector3 points[] = {
        {0.0f, 0.0f, 0.0f},
        {-8123.25f, 1533.5f, 56.0f},
        {1e-6f, -1e-6f, 3.0f},
    };
    for (const auto& p : points) {
        EXPECT_EQ(p.DistanceTo(p), 0.0f);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ObjectType
// ═══════════════════════════════════════════════════════════════════════════

TEST(ObjectTypeTest, RawValuesMatchHost) {
    EXPECT_EQ(ObjectTypeFromRaw(3), ObjectType::Unit);
    EXPECT_EQ(ObjectTypeFromRaw(4), ObjectType::Player);
    EXPECT_EQ(ObjectTypeFromRaw(5), ObjectType::GameObject);
    EXPECT_EQ(ObjectTypeFromRaw(7), ObjectType::Corpse);
}

TEST(ObjectTypeTest, UnknownRawValuesNormalizeToNone) {
    EXPECT_EQ(ObjectTypeFromRaw(0), ObjectType::None);
    EXPECT_EQ(ObjectTypeFromRaw(8), ObjectType::None);
    EXPECT_EQ(ObjectTypeFromRaw(0xFFFFFFFFu), ObjectType::None);
}

TEST(ObjectTypeTest, Names) {
    EXPECT_EQ(ObjectTypeName(ObjectType::Unit), "Unit");
    EXPECT_EQ(ObjectTypeName(ObjectType::GameObject), "GameObject");
    EXPECT_EQ(ObjectTypeName(ObjectType::None), "None");
}

TEST(InteractionConstantsTest, SentinelLiesOutsideRange) {
    EXPECT_FLOAT_EQ(kMaxInteractDistance, 5.0f);
    EXPECT_FLOAT_EQ(kUnsetCandidateDistance, 1000.0f);
    EXPECT_GT(kUnsetCandidateDistance, kMaxInteractDistance);
}
