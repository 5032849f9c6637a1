#pragma once

/// @file snapshot_world.hpp
/// @brief SnapshotWorld: in-memory IWorldAccessor.
///
/// Holds a list of entity records and hands them out with the same link
/// encoding as the host client: every entry sits at an even address and
/// the list ends at an odd sentinel.  Used by the unit tests and by the
/// replay tool to run selection passes without a live client.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "interact/foundation/game_result.hpp"
#include "interact/game/world_accessor.hpp"

namespace interact::game {

/// One object in a snapshot.  Field meanings follow the host's object
/// descriptor.
struct EntityRecord {
    ObjectGuid guid;
    uint32_t rawType = 0;           ///< Host type value; see ObjectTypeFromRaw.
    Vector3 position;
    int32_t health = 0;
    uint32_t dynamicFlags = 0;      ///< kDynamicFlagLootable lives here.
    uint32_t unitFlags = 0;         ///< kUnitFlagSkinnable lives here.
    ObjectGuid summonedBy;
    uint32_t gameObjectEntry = 0;
    bool despawned = false;         ///< Still linked but no longer resolvable.
};

enum class WorldActionKind : uint8_t {
    SetFocus,
    Interact
};

/// Action primitive invoked on the snapshot, in call order.
struct WorldAction {
    WorldActionKind kind = WorldActionKind::Interact;
    ObjectGuid guid;
    int32_t autoloot = 0;           ///< Interact only.
};

class SnapshotWorld : public IWorldAccessor {
public:
    /// Distance between consecutive fake object addresses.
    static constexpr std::uintptr_t kRecordStride = 0x10;

    /// Odd end-of-list marker returned after the last entry.
    static constexpr std::uintptr_t kListSentinel = 0x1;

    SnapshotWorld() = default;

    // ── Building ────────────────────────────────────────────────────

    /// Add an entity to the end of the visible-object list.
    ///
    /// Fails with InvalidArgument for a zero GUID and AlreadyExists for
    /// a GUID that is already present.
    foundation::GameResult<void> Add(const EntityRecord& record);

    /// Add the controlling player at @p position and make it the agent.
    foundation::GameResult<void> SetPlayer(ObjectGuid guid, const Vector3& position);

    /// Keep the entity linked but make its GUID unresolvable.
    /// @return false if the GUID is unknown.
    bool Despawn(ObjectGuid guid);

    void SetInWorld(bool inWorld) noexcept { inWorld_ = inWorld; }

    [[nodiscard]] std::size_t GetEntityCount() const noexcept { return records_.size(); }

    [[nodiscard]] const EntityRecord* FindRecord(ObjectGuid guid) const;

    // ── Recorded actions ────────────────────────────────────────────

    [[nodiscard]] const std::vector<WorldAction>& GetActions() const noexcept {
        return actions_;
    }

    void ClearActions() noexcept { actions_.clear(); }

    // ── IWorldAccessor ──────────────────────────────────────────────

    [[nodiscard]] bool IsInWorld() const override { return inWorld_; }
    [[nodiscard]] ObjectGuid GetPlayerGuid() const override { return playerGuid_; }
    [[nodiscard]] std::optional<ObjectHandle> ResolveObject(ObjectGuid guid) const override;

    [[nodiscard]] ObjectLink FirstObject() const override;
    [[nodiscard]] ObjectLink NextObject(ObjectLink current) const override;
    [[nodiscard]] ObjectGuid GetLinkGuid(ObjectLink link) const override;

    [[nodiscard]] ObjectType GetObjectType(ObjectHandle object) const override;
    [[nodiscard]] Vector3 GetPosition(ObjectHandle object, ObjectType type) const override;
    [[nodiscard]] int32_t GetHealth(ObjectHandle unit) const override;
    [[nodiscard]] bool IsLootable(ObjectHandle unit) const override;
    [[nodiscard]] bool IsSkinnable(ObjectHandle unit) const override;
    [[nodiscard]] ObjectGuid GetSummonedBy(ObjectHandle object) const override;
    [[nodiscard]] uint32_t GetGameObjectEntry(ObjectHandle object) const override;

    void SetFocus(ObjectGuid guid) override;
    void Interact(ObjectHandle object, int32_t autoloot) override;

private:
    [[nodiscard]] static std::uintptr_t addressOf(std::size_t index) noexcept {
        return (index + 1) * kRecordStride;
    }

    /// Record behind a fake address, or nullptr for a foreign value.
    [[nodiscard]] const EntityRecord* recordAt(std::uintptr_t address) const noexcept;

    std::vector<EntityRecord> records_;
    std::unordered_map<ObjectGuid, std::size_t> index_;
    std::vector<WorldAction> actions_;
    ObjectGuid playerGuid_;
    bool inWorld_ = true;
};

}  // namespace interact::game
