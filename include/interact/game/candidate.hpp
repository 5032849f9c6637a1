#pragma once

/// @file candidate.hpp
/// @brief Best-so-far interaction candidate per priority class.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "interact/game/object_types.hpp"
#include "interact/game/world_accessor.hpp"

namespace interact::game {

/// Candidate buckets.  Declaration order is the selection order.
enum class PriorityClass : uint8_t {
    LootableRemains,   ///< Dead unit with loot.
    WorldObject,       ///< Non-blacklisted GameObject.
    SkinnableRemains,  ///< Dead unit without loot that can be skinned.
    LivingCreature     ///< Any unit that is not dead.
};

inline constexpr std::size_t kPriorityClassCount = 4;

/// Classes from highest to lowest priority.
inline constexpr std::array<PriorityClass, kPriorityClassCount> kPriorityOrder = {
    PriorityClass::LootableRemains,
    PriorityClass::WorldObject,
    PriorityClass::SkinnableRemains,
    PriorityClass::LivingCreature
};

constexpr std::string_view PriorityClassName(PriorityClass priority) noexcept {
    switch (priority) {
        case PriorityClass::LootableRemains:  return "LootableRemains";
        case PriorityClass::WorldObject:      return "WorldObject";
        case PriorityClass::SkinnableRemains: return "SkinnableRemains";
        case PriorityClass::LivingCreature:   return "LivingCreature";
    }
    return "Unknown";
}

/// Nearest object seen so far for one priority class.
///
/// Starts invalid (type None, distance kUnsetCandidateDistance).  Only a
/// strictly closer object replaces the stored one, so on an exact tie
/// the object found first is kept.
struct Candidate {
    ObjectGuid guid;
    ObjectHandle handle;
    ObjectType type = ObjectType::None;
    float distance = kUnsetCandidateDistance;

    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return type != ObjectType::None;
    }

    /// Record the object if it is strictly closer than the current one.
    ///
    /// The caller has already checked range and class membership.
    /// @return true if the candidate changed.
    constexpr bool Update(ObjectGuid newGuid, ObjectHandle newHandle,
                          ObjectType newType, float newDistance) noexcept {
        if (!(newDistance < distance)) {
            return false;
        }
        guid = newGuid;
        handle = newHandle;
        type = newType;
        distance = newDistance;
        return true;
    }
};

/// Winning candidate of a selection pass.
struct Selection {
    Candidate candidate;
    PriorityClass priority = PriorityClass::LivingCreature;
};

}  // namespace interact::game
