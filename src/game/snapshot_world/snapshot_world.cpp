/// @file snapshot_world.cpp
/// @brief SnapshotWorld implementation.

#include "interact/game/snapshot_world.hpp"

#include <string>

#include "interact/foundation/game_logger.hpp"

namespace interact::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

GameResult<void> SnapshotWorld::Add(const EntityRecord& record) {
    if (!record.guid.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "entity guid must be non-zero"));
    }
    if (index_.count(record.guid) > 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists,
                      "duplicate entity guid " + std::to_string(record.guid.value()),
                      record.guid));
    }

    index_.emplace(record.guid, records_.size());
    records_.push_back(record);
    return GameResult<void>::ok();
}

GameResult<void> SnapshotWorld::SetPlayer(ObjectGuid guid, const Vector3& position) {
    EntityRecord player;
    player.guid = guid;
    player.rawType = static_cast<uint32_t>(ObjectType::Player);
    player.position = position;
    player.health = 1;

    auto added = Add(player);
    if (!added) {
        return added;
    }
    playerGuid_ = guid;
    return GameResult<void>::ok();
}

bool SnapshotWorld::Despawn(ObjectGuid guid) {
    auto it = index_.find(guid);
    if (it == index_.end()) {
        return false;
    }
    records_[it->second].despawned = true;
    INTERACT_LOG_TRACE(LogCategory::World,
                       "despawned snapshot entity " + std::to_string(guid.value()));
    return true;
}

const EntityRecord* SnapshotWorld::FindRecord(ObjectGuid guid) const {
    auto it = index_.find(guid);
    return it != index_.end() ? &records_[it->second] : nullptr;
}

const EntityRecord* SnapshotWorld::recordAt(std::uintptr_t address) const noexcept {
    if (address == 0 || address % kRecordStride != 0) {
        return nullptr;
    }
    const std::size_t index = address / kRecordStride - 1;
    return index < records_.size() ? &records_[index] : nullptr;
}

std::optional<ObjectHandle> SnapshotWorld::ResolveObject(ObjectGuid guid) const {
    auto it = index_.find(guid);
    if (it == index_.end() || records_[it->second].despawned) {
        return std::nullopt;
    }
    return ObjectHandle{addressOf(it->second)};
}

// ── List traversal ──────────────────────────────────────────────────

ObjectLink SnapshotWorld::FirstObject() const {
    return ObjectLink{records_.empty() ? kListSentinel : addressOf(0)};
}

ObjectLink SnapshotWorld::NextObject(ObjectLink current) const {
    if (recordAt(current.value()) == nullptr) {
        return ObjectLink{kListSentinel};
    }
    const std::size_t next = current.value() / kRecordStride;
    return ObjectLink{next < records_.size() ? addressOf(next) : kListSentinel};
}

ObjectGuid SnapshotWorld::GetLinkGuid(ObjectLink link) const {
    const auto* record = recordAt(link.value());
    return record != nullptr ? record->guid : ObjectGuid{};
}

// ── Attributes ──────────────────────────────────────────────────────

ObjectType SnapshotWorld::GetObjectType(ObjectHandle object) const {
    const auto* record = recordAt(object.value());
    return record != nullptr ? ObjectTypeFromRaw(record->rawType) : ObjectType::None;
}

Vector3 SnapshotWorld::GetPosition(ObjectHandle object, ObjectType type) const {
    const auto* record = recordAt(object.value());
    if (record == nullptr) {
        return Vector3::Zero();
    }
    switch (type) {
        case ObjectType::Unit:
        case ObjectType::Player:
        case ObjectType::GameObject:
            return record->position;
        default:
            return Vector3::Zero();
    }
}

int32_t SnapshotWorld::GetHealth(ObjectHandle unit) const {
    const auto* record = recordAt(unit.value());
    return record != nullptr ? record->health : 0;
}

bool SnapshotWorld::IsLootable(ObjectHandle unit) const {
    const auto* record = recordAt(unit.value());
    return record != nullptr && (record->dynamicFlags & kDynamicFlagLootable) != 0;
}

bool SnapshotWorld::IsSkinnable(ObjectHandle unit) const {
    const auto* record = recordAt(unit.value());
    return record != nullptr && (record->unitFlags & kUnitFlagSkinnable) != 0;
}

ObjectGuid SnapshotWorld::GetSummonedBy(ObjectHandle object) const {
    const auto* record = recordAt(object.value());
    return record != nullptr ? record->summonedBy : ObjectGuid{};
}

uint32_t SnapshotWorld::GetGameObjectEntry(ObjectHandle object) const {
    const auto* record = recordAt(object.value());
    return record != nullptr ? record->gameObjectEntry : 0;
}

// ── Actions ─────────────────────────────────────────────────────────

void SnapshotWorld::SetFocus(ObjectGuid guid) {
    actions_.push_back(WorldAction{WorldActionKind::SetFocus, guid, 0});
}

void SnapshotWorld::Interact(ObjectHandle object, int32_t autoloot) {
    const auto* record = recordAt(object.value());
    actions_.push_back(WorldAction{WorldActionKind::Interact,
                                   record != nullptr ? record->guid : ObjectGuid{},
                                   autoloot});
}

}  // namespace interact::game
