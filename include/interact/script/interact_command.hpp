#pragma once

/// @file interact_command.hpp
/// @brief InteractNearest: the script-facing entry point.
///
/// Script usage:
/// @code
///   InteractNearest(1)   -- interact and autoloot
///   InteractNearest(0)   -- interact, open the loot window
/// @endcode

#include <cstdint>
#include <string_view>

#include "interact/foundation/game_result.hpp"
#include "interact/game/selection_engine.hpp"
#include "interact/game/world_accessor.hpp"
#include "interact/script/script_host.hpp"

namespace interact::script {

/// Global name the command is registered under.
inline constexpr std::string_view kInteractNearestName = "InteractNearest";

/// Error raised for a missing or non-numeric argument.
inline constexpr std::string_view kInteractNearestUsage = "Usage: InteractNearest(autoloot)";

/// What one invocation did.
enum class CommandOutcome : uint8_t {
    NotInWorld,        ///< Player not in the world; arguments not inspected.
    NothingToDo,       ///< Nothing eligible in range.
    InteractedUnit,    ///< Focused and interacted with a unit.
    InteractedObject   ///< Interacted with a game object.
};

constexpr std::string_view CommandOutcomeName(CommandOutcome outcome) noexcept {
    switch (outcome) {
        case CommandOutcome::NotInWorld:       return "NotInWorld";
        case CommandOutcome::NothingToDo:      return "NothingToDo";
        case CommandOutcome::InteractedUnit:   return "InteractedUnit";
        case CommandOutcome::InteractedObject: return "InteractedObject";
    }
    return "Unknown";
}

/// Convert the script's autoloot argument to the host's int parameter.
///
/// Truncates toward zero and saturates at the int32 limits; NaN maps
/// to 0.
[[nodiscard]] int32_t AutolootFromNumber(double value) noexcept;

/// Validates the call, runs one selection pass and performs the action.
///
/// The world accessor must outlive the command.
class InteractNearestCommand {
public:
    explicit InteractNearestCommand(game::IWorldAccessor& world,
                                    game::SelectionEngine engine = game::SelectionEngine{});

    /// Run the command against @p args.
    ///
    /// Order of checks:
    ///   1. player not in world  -> NotInWorld (arguments ignored);
    ///   2. argument 1 not numeric -> ScriptUsage error, nothing read;
    ///   3. selection pass and action.
    [[nodiscard]] foundation::GameResult<CommandOutcome> Invoke(const IScriptStack& args);

    /// Script-facing wrapper around Invoke().
    ///
    /// Raises the usage error on @p stack, pushes `true` after an
    /// interaction and returns the number of pushed values.
    int Dispatch(IScriptStack& stack);

    [[nodiscard]] const game::SelectionEngine& GetEngine() const noexcept { return engine_; }

private:
    CommandOutcome perform(const game::Selection& selection, int32_t autoloot);

    game::IWorldAccessor& world_;
    game::SelectionEngine engine_;
};

/// Register @p command with @p host under kInteractNearestName.
///
/// @p command must outlive every call the host makes to the function.
foundation::GameResult<void> RegisterInteractFunctions(IScriptHost& host,
                                                       InteractNearestCommand& command);

}  // namespace interact::script
