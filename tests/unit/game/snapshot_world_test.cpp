#include <gtest/gtest.h>

#include <vector>

#include "interact/game/snapshot_world.hpp"
#include "support/world_builder.hpp"

using namespace interact::game;
using namespace interact::test;
using interact::foundation::ErrorCode;

using SnapshotWorldTest = WorldTest;

namespace {

std::vector<ObjectGuid> walk(const SnapshotWorld& world) {
    std::vector<ObjectGuid> guids;
    for (auto link = world.FirstObject(); !world.IsTerminal(link);
         link = world.NextObject(link)) {
        guids.push_back(world.GetLinkGuid(link));
    }
    return guids;
}

}  // namespace

TEST(SnapshotWorldBasicTest, EmptyListStartsAtSentinel) {
    SnapshotWorld world;
    EXPECT_TRUE(world.IsTerminal(world.FirstObject()));
    EXPECT_FALSE(world.GetPlayerGuid().isValid());
    EXPECT_FALSE(world.ResolveObject(ObjectGuid{}).has_value());
}

TEST_F(SnapshotWorldTest, ListFollowsInsertionOrderWithHostEncoding) {
    Add(MakeUnit(0x10, {1, 0, 0}, 100));
    Add(MakeGameObject(0x20, {2, 0, 0}, 1731));

    auto guids = walk(world_);
    ASSERT_EQ(guids.size(), 3u);
    EXPECT_EQ(guids[0], kPlayerGuid);
    EXPECT_EQ(guids[1], ObjectGuid{0x10});
    EXPECT_EQ(guids[2], ObjectGuid{0x20});

    for (auto link = world_.FirstObject(); !world_.IsTerminal(link);
         link = world_.NextObject(link)) {
        EXPECT_EQ(link.value() % 2, 0u);
    }
}

TEST_F(SnapshotWorldTest, RejectsZeroAndDuplicateGuids) {
    auto zero = world_.Add(MakeUnit(0, {0, 0, 0}, 1));
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidArgument);

    auto duplicate = world_.Add(MakeUnit(kPlayerGuid.value(), {0, 0, 0}, 1));
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::AlreadyExists);
    ASSERT_NE(duplicate.error().context<ObjectGuid>(), nullptr);
    EXPECT_EQ(*duplicate.error().context<ObjectGuid>(), kPlayerGuid);
}

TEST_F(SnapshotWorldTest, DespawnedStaysLinkedButDoesNotResolve) {
    Add(MakeUnit(0x10, {1, 0, 0}, 100));
    ASSERT_TRUE(world_.ResolveObject(ObjectGuid{0x10}).has_value());

    EXPECT_TRUE(world_.Despawn(ObjectGuid{0x10}));
    EXPECT_FALSE(world_.ResolveObject(ObjectGuid{0x10}).has_value());
    EXPECT_EQ(walk(world_).size(), 2u);
    EXPECT_FALSE(world_.Despawn(ObjectGuid{0x99}));
}

TEST_F(SnapshotWorldTest, AttributesComeFromTheRecord) {
    auto corpse = MakeCorpse(0x10, {1, 2, 3}, true, true);
    corpse.summonedBy = ObjectGuid{0x77};
    Add(corpse);
    Add(MakeGameObject(0x20, {4, 5, 6}, 179830));

    auto unit = world_.ResolveObject(ObjectGuid{0x10}).value();
    EXPECT_EQ(world_.GetObjectType(unit), ObjectType::Unit);
    EXPECT_EQ(world_.GetPosition(unit, ObjectType::Unit), Vector3(1, 2, 3));
    EXPECT_EQ(world_.GetHealth(unit), 0);
    EXPECT_TRUE(world_.IsLootable(unit));
    EXPECT_TRUE(world_.IsSkinnable(unit));
    EXPECT_EQ(world_.GetSummonedBy(unit), ObjectGuid{0x77});

    auto object = world_.ResolveObject(ObjectGuid{0x20}).value();
    EXPECT_EQ(world_.GetObjectType(object), ObjectType::GameObject);
    EXPECT_EQ(world_.GetGameObjectEntry(object), 179830u);
    EXPECT_EQ(world_.GetPosition(object, ObjectType::GameObject), Vector3(4, 5, 6));
    EXPECT_FALSE(world_.IsLootable(object));
}

TEST_F(SnapshotWorldTest, UnknownRawTypeReadsAsNone) {
    EntityRecord odd;
    odd.guid = ObjectGuid{0x10};
    odd.rawType = 99;
    Add(odd);
    auto handle = world_.ResolveObject(ObjectGuid{0x10}).value();
    EXPECT_EQ(world_.GetObjectType(handle), ObjectType::None);
}

TEST_F(SnapshotWorldTest, ForeignHandlesReadAsEmpty) {
    const ObjectHandle bogus{0x12345};
    EXPECT_EQ(world_.GetObjectType(bogus), ObjectType::None);
    EXPECT_EQ(world_.GetHealth(bogus), 0);
    EXPECT_FALSE(world_.IsLootable(bogus));
    EXPECT_TRUE(world_.IsTerminal(world_.NextObject(ObjectLink{0x12345})));
}

TEST_F(SnapshotWorldTest, RecordsActionsInOrder) {
    Add(MakeUnit(0x10, {1, 0, 0}, 100));
    auto unit = world_.ResolveObject(ObjectGuid{0x10}).value();

    world_.SetFocus(ObjectGuid{0x10});
    world_.Interact(unit, 1);

    const auto& actions = world_.GetActions();
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].kind, WorldActionKind::SetFocus);
    EXPECT_EQ(actions[0].guid, ObjectGuid{0x10});
    EXPECT_EQ(actions[1].kind, WorldActionKind::Interact);
    EXPECT_EQ(actions[1].guid, ObjectGuid{0x10});
    EXPECT_EQ(actions[1].autoloot, 1);

    world_.ClearActions();
    EXPECT_TRUE(world_.GetActions().empty());
}

TEST_F(SnapshotWorldTest, InWorldFlag) {
    EXPECT_TRUE(world_.IsInWorld());
    world_.SetInWorld(false);
    EXPECT_FALSE(world_.IsInWorld());
}
