#pragma once

/// @file eligibility_filter.hpp
/// @brief Exclusion set and per-object eligibility rules.
///
/// Decides whether an object may be considered at all.  Range and
/// priority class are the SelectionEngine's business, not the filter's.

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <unordered_set>

#include "interact/game/world_accessor.hpp"

namespace interact::game {

/// GameObject entries never auto-interacted with: the Warsong Gulch
/// flags, both on their stands and dropped on the ground.
inline constexpr std::array<uint32_t, 4> kBlacklistedGameObjectEntries = {
    179830, 179831, 179785, 179786
};

/// Immutable set of GameObject entry ids.
///
/// Built once and never modified, so concurrent readers need no lock.
class ExclusionSet {
public:
    ExclusionSet(std::initializer_list<uint32_t> entries);

    template <typename It>
    ExclusionSet(It first, It last) : entries_(first, last) {}

    [[nodiscard]] bool Contains(uint32_t entry) const noexcept {
        return entries_.count(entry) > 0;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    /// The built-in blacklist, constructed on first use.
    static const ExclusionSet& Default();

private:
    const std::unordered_set<uint32_t> entries_;
};

/// Eligibility rules applied to every resolved object:
///   - objects summoned or created by a player are skipped (pets,
///     totems, a warlock's summoning portal);
///   - GameObjects whose entry is in the exclusion set are skipped.
///
/// The referenced ExclusionSet must outlive the filter.
class EligibilityFilter {
public:
    explicit EligibilityFilter(const ExclusionSet& exclusions = ExclusionSet::Default());

    /// True if the object may become an interaction candidate.
    [[nodiscard]] bool IsEligible(const IWorldAccessor& world,
                                  ObjectHandle object, ObjectType type) const;

    /// True if the object's summoner resolves to a Player.
    ///
    /// A zero summoner or one that no longer resolves counts as "not
    /// summoned".
    [[nodiscard]] bool IsPlayerSummoned(const IWorldAccessor& world,
                                        ObjectHandle object) const;

    [[nodiscard]] bool IsExcludedEntry(uint32_t entry) const noexcept {
        return exclusions_.Contains(entry);
    }

private:
    const ExclusionSet& exclusions_;
};

}  // namespace interact::game
