#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "interact/game/candidate.hpp"

using namespace interact::game;

namespace {

ObjectHandle handleOf(uint64_t guid) {
    return ObjectHandle{static_cast<std::uintptr_t>(guid * 16)};
}

}  // namespace

TEST(CandidateTest, FreshCandidateIsInvalid) {
    Candidate candidate;
    EXPECT_FALSE(candidate.IsValid());
    EXPECT_EQ(candidate.type, ObjectType::None);
    EXPECT_FLOAT_EQ(candidate.distance, kUnsetCandidateDistance);
    EXPECT_FALSE(candidate.guid.isValid());
}

TEST(CandidateTest, FirstUpdateMakesItValid) {
    Candidate candidate;
    EXPECT_TRUE(candidate.Update(ObjectGuid{10}, handleOf(10), ObjectType::Unit, 4.0f));
    EXPECT_TRUE(candidate.IsValid());
    EXPECT_EQ(candidate.guid, ObjectGuid{10});
    EXPECT_EQ(candidate.handle, handleOf(10));
    EXPECT_FLOAT_EQ(candidate.distance, 4.0f);
}

TEST(CandidateTest, CloserObjectReplaces) {
    Candidate candidate;
    candidate.Update(ObjectGuid{10}, handleOf(10), ObjectType::Unit, 4.0f);
    EXPECT_TRUE(candidate.Update(ObjectGuid{11}, handleOf(11), ObjectType::Unit, 2.5f));
    EXPECT_EQ(candidate.guid, ObjectGuid{11});
}

TEST(CandidateTest, FartherObjectIsIgnored) {
    Candidate candidate;
    candidate.Update(ObjectGuid{10}, handleOf(10), ObjectType::Unit, 2.0f);
    EXPECT_FALSE(candidate.Update(ObjectGuid{11}, handleOf(11), ObjectType::Unit, 3.0f));
    EXPECT_EQ(candidate.guid, ObjectGuid{10});
    EXPECT_FLOAT_EQ(candidate.distance, 2.0f);
}

TEST(CandidateTest, ExactTieKeepsFirstSeen) {
    Candidate candidate;
    candidate.Update(ObjectGuid{10}, handleOf(10), ObjectType::GameObject, 3.0f);
    EXPECT_FALSE(candidate.Update(ObjectGuid{11}, handleOf(11), ObjectType::GameObject, 3.0f));
    EXPECT_EQ(candidate.guid, ObjectGuid{10});
}

TEST(CandidateTest, NaNDistanceNeverUpdates) {
    Candidate candidate;
    EXPECT_FALSE(candidate.Update(ObjectGuid{10}, handleOf(10), ObjectType::Unit,
                                  std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(candidate.IsValid());
}

TEST(CandidateTest, DistanceIsMonotonicAndTracksFirstMinimum) {
    const std::vector<float> distances = {4.5f, 4.9f, 1.0f, 3.0f, 1.0f, 0.75f, 2.0f, 0.75f};

    Candidate candidate;
    float previous = candidate.distance;
    float minimum = kUnsetCandidateDistance;
    uint64_t expectedGuid = 0;

    for (std::size_t i = 0; i < distances.size(); ++i) {
        const uint64_t guid = 100 + i;
        candidate.Update(ObjectGuid{guid}, handleOf(guid), ObjectType::Unit, distances[i]);

        EXPECT_LE(candidate.distance, previous);
        previous = candidate.distance;

        if (distances[i] < minimum) {
            minimum = distances[i];
            expectedGuid = guid;
        }
        EXPECT_EQ(candidate.guid, ObjectGuid{expectedGuid});
        EXPECT_FLOAT_EQ(candidate.distance, minimum);
    }
    // 0.75 first seen at index 5.
    EXPECT_EQ(candidate.guid, ObjectGuid{105});
}

TEST(PriorityClassTest, OrderIsLootObjectSkinLiving) {
    ASSERT_EQ(kPriorityOrder.size(), kPriorityClassCount);
    EXPECT_EQ(kPriorityOrder[0], PriorityClass::LootableRemains);
    EXPECT_EQ(kPriorityOrder[1], PriorityClass::WorldObject);
    EXPECT_EQ(kPriorityOrder[2], PriorityClass::SkinnableRemains);
    EXPECT_EQ(kPriorityOrder[3], PriorityClass::LivingCreature);
    EXPECT_EQ(PriorityClassName(PriorityClass::SkinnableRemains), "SkinnableRemains");
}
