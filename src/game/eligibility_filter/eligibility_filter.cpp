/// @file eligibility_filter.cpp
/// @brief ExclusionSet and EligibilityFilter implementation.

#include "interact/game/eligibility_filter.hpp"

namespace interact::game {

ExclusionSet::ExclusionSet(std::initializer_list<uint32_t> entries)
    : entries_(entries) {}

const ExclusionSet& ExclusionSet::Default() {
    // Function-local static: initialized exactly once, thread-safe.
    static const ExclusionSet blacklist(kBlacklistedGameObjectEntries.begin(),
                                        kBlacklistedGameObjectEntries.end());
    return blacklist;
}

EligibilityFilter::EligibilityFilter(const ExclusionSet& exclusions)
    : exclusions_(exclusions) {}

bool EligibilityFilter::IsEligible(const IWorldAccessor& world,
                                   ObjectHandle object, ObjectType type) const {
    if (IsPlayerSummoned(world, object)) {
        return false;
    }

    if (type == ObjectType::GameObject
        && IsExcludedEntry(world.GetGameObjectEntry(object))) {
        return false;
    }

    return true;
}

bool EligibilityFilter::IsPlayerSummoned(const IWorldAccessor& world,
                                         ObjectHandle object) const {
    const auto summonerGuid = world.GetSummonedBy(object);
    if (!summonerGuid.isValid()) {
        return false;
    }

    const auto summoner = world.ResolveObject(summonerGuid);
    if (!summoner) {
        return false;
    }

    return world.GetObjectType(*summoner) == ObjectType::Player;
}

}  // namespace interact::game
