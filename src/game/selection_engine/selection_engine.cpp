/// @file selection_engine.cpp
/// @brief SelectionEngine implementation.

#include "interact/game/selection_engine.hpp"

#include <string>

#include "interact/foundation/game_logger.hpp"

namespace interact::game {

using foundation::LogCategory;

namespace {

constexpr std::size_t slot(PriorityClass priority) noexcept {
    return static_cast<std::size_t>(priority);
}

}  // namespace

SelectionEngine::SelectionEngine(EligibilityFilter filter)
    : filter_(filter) {}

std::optional<Selection> SelectionEngine::Select(const IWorldAccessor& world) {
    lastPass_ = {};

    const auto playerGuid = world.GetPlayerGuid();
    const auto player = world.ResolveObject(playerGuid);
    if (!player) {
        INTERACT_LOG_DEBUG(LogCategory::Selection, "player object did not resolve");
        return std::nullopt;
    }
    const Vector3 origin = world.GetPosition(*player, ObjectType::Player);

    CandidateSet candidates{};

    for (auto link = world.FirstObject(); !world.IsTerminal(link);
         link = world.NextObject(link)) {
        ++lastPass_.visited;

        const auto guid = world.GetLinkGuid(link);
        const auto object = world.ResolveObject(guid);
        if (!object) {
            ++lastPass_.unresolved;
            INTERACT_LOG_TRACE(LogCategory::Selection,
                               "skipping unresolved object " + std::to_string(guid.value()));
            continue;
        }

        const auto type = world.GetObjectType(*object);
        if (!filter_.IsEligible(world, *object, type)) {
            ++lastPass_.ineligible;
            continue;
        }

        // Only units and game objects have a position worth measuring.
        if (type != ObjectType::Unit && type != ObjectType::GameObject) {
            continue;
        }

        const float distance = origin.DistanceTo(world.GetPosition(*object, type));
        if (distance > kMaxInteractDistance) {
            ++lastPass_.outOfRange;
            continue;
        }

        ++lastPass_.considered;
        if (type == ObjectType::Unit) {
            rankUnit(world, guid, *object, distance, candidates);
        } else {
            candidates[slot(PriorityClass::WorldObject)].Update(guid, *object, type, distance);
        }
    }

    for (auto priority : kPriorityOrder) {
        const auto& candidate = candidates[slot(priority)];
        if (candidate.IsValid()) {
            return Selection{candidate, priority};
        }
    }
    return std::nullopt;
}

void SelectionEngine::rankUnit(const IWorldAccessor& world, ObjectGuid guid,
                               ObjectHandle unit, float distance,
                               CandidateSet& candidates) {
    const auto health = world.GetHealth(unit);

    if (health != 0) {
        // Negative health is not a host encoding we have seen; it is
        // ranked as alive rather than guessed to be a corpse.
        candidates[slot(PriorityClass::LivingCreature)].Update(
            guid, unit, ObjectType::Unit, distance);
        return;
    }

    // Lootable takes precedence; a corpse that is both lootable and
    // skinnable is looted first and skinned on a later press.
    if (world.IsLootable(unit)) {
        candidates[slot(PriorityClass::LootableRemains)].Update(
            guid, unit, ObjectType::Unit, distance);
    } else if (world.IsSkinnable(unit)) {
        candidates[slot(PriorityClass::SkinnableRemains)].Update(
            guid, unit, ObjectType::Unit, distance);
    }
}

}  // namespace interact::game
