#pragma once

/// @file world_accessor.hpp
/// @brief IWorldAccessor: read-only view of the live world plus the two
///        action primitives the addon is allowed to perform.
///
/// The world is owned by the host and keeps changing while it is read.
/// Every lookup by GUID may fail; callers treat a failed lookup as
/// "object gone" and move on.

#include <cstdint>
#include <optional>

#include "interact/foundation/types.hpp"
#include "interact/game/math_types.hpp"
#include "interact/game/object_types.hpp"

namespace interact::game {

using foundation::ObjectGuid;

struct ObjectHandleTag {};
struct ObjectLinkTag {};

/// Resolved reference to a live object (the host's object pointer).
/// Only valid until control returns to the host.
using ObjectHandle = foundation::StrongId<ObjectHandleTag, std::uintptr_t>;

/// Raw entry of the host's visible-object list.
using ObjectLink = foundation::StrongId<ObjectLinkTag, std::uintptr_t>;

/// Host rule for the end of the visible-object list.
///
/// Object entries are always at even addresses; the list ends at a null
/// link or at a sentinel whose lowest bit is set.
constexpr bool IsTerminalLink(ObjectLink link) noexcept {
    return link.value() == 0 || (link.value() & 1u) != 0;
}

/// Capability interface over the host's object manager.
///
/// Implementations:
///   - the in-process accessor reading client memory (lives with the
///     injected module, outside this library)
///   - SnapshotWorld, an in-memory world used by tests and the replay tool
class IWorldAccessor {
public:
    virtual ~IWorldAccessor() = default;

    // ── World state ─────────────────────────────────────────────────

    /// True while the player is logged in and present in the world.
    [[nodiscard]] virtual bool IsInWorld() const = 0;

    /// GUID of the controlling player character.
    [[nodiscard]] virtual ObjectGuid GetPlayerGuid() const = 0;

    /// Resolve a GUID to a live object, or std::nullopt if it is gone.
    [[nodiscard]] virtual std::optional<ObjectHandle> ResolveObject(ObjectGuid guid) const = 0;

    // ── Visible-object list ─────────────────────────────────────────

    [[nodiscard]] virtual ObjectLink FirstObject() const = 0;
    [[nodiscard]] virtual ObjectLink NextObject(ObjectLink current) const = 0;

    /// End-of-list test for a link.  Defaults to the host encoding.
    [[nodiscard]] virtual bool IsTerminal(ObjectLink link) const {
        return IsTerminalLink(link);
    }

    /// GUID stored in a (non-terminal) list entry.
    [[nodiscard]] virtual ObjectGuid GetLinkGuid(ObjectLink link) const = 0;

    // ── Object attributes (handle must be freshly resolved) ─────────

    /// Object kind, already normalized through ObjectTypeFromRaw.
    [[nodiscard]] virtual ObjectType GetObjectType(ObjectHandle object) const = 0;

    /// World position.  Unit and Player read the live unit position;
    /// GameObject goes through its position record.  Other kinds have
    /// no position and must not be asked.
    [[nodiscard]] virtual Vector3 GetPosition(ObjectHandle object, ObjectType type) const = 0;

    [[nodiscard]] virtual int32_t GetHealth(ObjectHandle unit) const = 0;
    [[nodiscard]] virtual bool IsLootable(ObjectHandle unit) const = 0;
    [[nodiscard]] virtual bool IsSkinnable(ObjectHandle unit) const = 0;

    /// GUID of the object that summoned or created this one; zero if none.
    [[nodiscard]] virtual ObjectGuid GetSummonedBy(ObjectHandle object) const = 0;

    /// Entry id of a GameObject (its template, not its GUID).
    [[nodiscard]] virtual uint32_t GetGameObjectEntry(ObjectHandle object) const = 0;

    // ── Actions ─────────────────────────────────────────────────────

    /// Make @p guid the player's current target.
    virtual void SetFocus(ObjectGuid guid) = 0;

    /// Right-click the object.  @p autoloot non-zero loots without
    /// opening the loot window.
    virtual void Interact(ObjectHandle object, int32_t autoloot) = 0;
};

}  // namespace interact::game
