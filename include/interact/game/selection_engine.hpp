#pragma once

/// @file selection_engine.hpp
/// @brief SelectionEngine: one pass over the visible-object list that
///        picks the single best object to interact with.
///
/// Per object:
///   1. resolve its GUID (skip if gone);
///   2. apply the EligibilityFilter;
///   3. read its position (Unit and GameObject only);
///   4. drop it if farther than kMaxInteractDistance;
///   5. offer it to the candidate of its priority class.
///
/// The winner is the first valid candidate in kPriorityOrder.  Priority
/// always beats distance; distance only orders objects of one class.

#include <array>
#include <cstdint>
#include <optional>

#include "interact/game/candidate.hpp"
#include "interact/game/eligibility_filter.hpp"
#include "interact/game/world_accessor.hpp"

namespace interact::game {

/// Counters describing the most recent selection pass.
struct SelectionPassStats {
    uint32_t visited = 0;       ///< List entries walked.
    uint32_t unresolved = 0;    ///< Entries whose GUID no longer resolved.
    uint32_t ineligible = 0;    ///< Rejected by the EligibilityFilter.
    uint32_t outOfRange = 0;    ///< Farther than kMaxInteractDistance.
    uint32_t considered = 0;    ///< Offered to a candidate.
};

class SelectionEngine {
public:
    explicit SelectionEngine(EligibilityFilter filter = EligibilityFilter{});

    /// Run one selection pass over @p world.
    ///
    /// Returns std::nullopt when the player's own GUID does not resolve
    /// or when no eligible object is in range.  Never fails otherwise;
    /// objects that vanish mid-pass are skipped.
    [[nodiscard]] std::optional<Selection> Select(const IWorldAccessor& world);

    /// Statistics of the last Select() call.
    [[nodiscard]] const SelectionPassStats& GetLastPassStats() const noexcept {
        return lastPass_;
    }

    [[nodiscard]] const EligibilityFilter& GetFilter() const noexcept { return filter_; }

private:
    using CandidateSet = std::array<Candidate, kPriorityClassCount>;

    /// Route a unit in range to the lootable, skinnable or living bucket.
    void rankUnit(const IWorldAccessor& world, ObjectGuid guid,
                  ObjectHandle unit, float distance, CandidateSet& candidates);

    EligibilityFilter filter_;
    SelectionPassStats lastPass_;
};

}  // namespace interact::game
