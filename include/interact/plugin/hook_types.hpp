#pragma once

/// @file hook_types.hpp
/// @brief Host routines the addon detours, and the installer seam.

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

#include "interact/foundation/game_result.hpp"

namespace interact::plugin {

/// Host routines the addon attaches to.
enum class HookPoint : uint8_t {
    SysMsgInitialize,    ///< Runs once the client's core systems are up.
    LoadScriptFunctions  ///< Runs each time the client (re)builds its script globals.
};

inline constexpr std::size_t kHookPointCount = 2;

inline constexpr std::array<HookPoint, kHookPointCount> kAllHookPoints = {
    HookPoint::SysMsgInitialize,
    HookPoint::LoadScriptFunctions
};

constexpr std::string_view HookPointName(HookPoint point) noexcept {
    switch (point) {
        case HookPoint::SysMsgInitialize:    return "SysMsgInitialize";
        case HookPoint::LoadScriptFunctions: return "LoadScriptFunctions";
    }
    return "Unknown";
}

/// Code run by a detour after the host's original routine has returned.
using DetourCallback = std::function<void()>;

/// Installs detours on host routines.
///
/// The in-process implementation patches the routine so that the
/// original runs first and @p callback right after it.  A failed
/// install leaves the routine untouched and reports HookInitFailed
/// (trampoline creation) or HookEnableFailed (activation), with the
/// HookPoint as error context.
class IDetourInstaller {
public:
    virtual ~IDetourInstaller() = default;

    virtual foundation::GameResult<void> Install(HookPoint point, DetourCallback callback) = 0;
};

}  // namespace interact::plugin
