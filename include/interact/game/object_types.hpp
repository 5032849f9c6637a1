#pragma once

/// @file object_types.hpp
/// @brief Object kinds, host flag bits and interaction constants.

#include <cstdint>
#include <string_view>

namespace interact::game {

/// Maximum distance (yards) at which an object can be interacted with.
inline constexpr float kMaxInteractDistance = 5.0f;

/// Distance stored in a candidate that has not recorded anything yet.
inline constexpr float kUnsetCandidateDistance = 1000.0f;

static_assert(kUnsetCandidateDistance > kMaxInteractDistance,
              "unset candidate distance must lie outside interaction range");

/// Classification of world objects, using the host's raw type values.
enum class ObjectType : uint32_t {
    None          = 0,  ///< Unknown or unrecognized; never a target.
    Item          = 1,
    Container     = 2,
    Unit          = 3,  ///< Creature or NPC character.
    Player        = 4,  ///< Player-controlled character.
    GameObject    = 5,  ///< Chest, herb, ore vein, door...
    DynamicObject = 6,  ///< Spell effect area.
    Corpse        = 7   ///< Player corpse.
};

/// Normalize a raw type value read from the host.
///
/// Values outside the known range map to ObjectType::None.
constexpr ObjectType ObjectTypeFromRaw(uint32_t raw) noexcept {
    if (raw >= static_cast<uint32_t>(ObjectType::Item)
        && raw <= static_cast<uint32_t>(ObjectType::Corpse)) {
        return static_cast<ObjectType>(raw);
    }
    return ObjectType::None;
}

constexpr std::string_view ObjectTypeName(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::None:          return "None";
        case ObjectType::Item:          return "Item";
        case ObjectType::Container:     return "Container";
        case ObjectType::Unit:          return "Unit";
        case ObjectType::Player:        return "Player";
        case ObjectType::GameObject:    return "GameObject";
        case ObjectType::DynamicObject: return "DynamicObject";
        case ObjectType::Corpse:        return "Corpse";
    }
    return "None";
}

/// Unit dynamic-flags bit: the corpse has loot for this player.
inline constexpr uint32_t kDynamicFlagLootable = 0x00000001u;

/// Unit flags bit: the corpse can be skinned.
inline constexpr uint32_t kUnitFlagSkinnable = 0x04000000u;

}  // namespace interact::game
