/// @file interact_command.cpp
/// @brief InteractNearestCommand implementation.

#include "interact/script/interact_command.hpp"

#include <cmath>
#include <limits>
#include <string>

#include "interact/foundation/game_logger.hpp"

namespace interact::script {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

int32_t AutolootFromNumber(double value) noexcept {
    if (std::isnan(value)) {
        return 0;
    }
    constexpr auto kMin = static_cast<double>(std::numeric_limits<int32_t>::min());
    constexpr auto kMax = static_cast<double>(std::numeric_limits<int32_t>::max());
    if (value <= kMin) {
        return std::numeric_limits<int32_t>::min();
    }
    if (value >= kMax) {
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(value);
}

InteractNearestCommand::InteractNearestCommand(game::IWorldAccessor& world,
                                               game::SelectionEngine engine)
    : world_(world), engine_(engine) {}

GameResult<CommandOutcome> InteractNearestCommand::Invoke(const IScriptStack& args) {
    if (!world_.IsInWorld()) {
        return GameResult<CommandOutcome>::ok(CommandOutcome::NotInWorld);
    }

    if (!args.IsNumber(1)) {
        return GameResult<CommandOutcome>::err(
            GameError(ErrorCode::ScriptUsage, std::string(kInteractNearestUsage)));
    }
    const int32_t autoloot = AutolootFromNumber(args.ToNumber(1));

    const auto selection = engine_.Select(world_);
    if (!selection) {
        return GameResult<CommandOutcome>::ok(CommandOutcome::NothingToDo);
    }
    return GameResult<CommandOutcome>::ok(perform(*selection, autoloot));
}

CommandOutcome InteractNearestCommand::perform(const game::Selection& selection,
                                               int32_t autoloot) {
    const auto& winner = selection.candidate;

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Selection)) {
        LogContext ctx;
        ctx.objectGuid = winner.guid;
        ctx.distance = winner.distance;
        ctx.extra["class"] = std::string(game::PriorityClassName(selection.priority));
        ctx.extra["autoloot"] = std::to_string(autoloot);
        logger.logWithContext(LogLevel::Debug, LogCategory::Selection,
                              "Selected candidate", ctx);
    }

    switch (winner.type) {
        case game::ObjectType::Unit:
            world_.SetFocus(winner.guid);
            world_.Interact(winner.handle, autoloot);
            return CommandOutcome::InteractedUnit;
        case game::ObjectType::GameObject:
            world_.Interact(winner.handle, autoloot);
            return CommandOutcome::InteractedObject;
        default:
            INTERACT_LOG_WARN(LogCategory::Selection,
                              "winner of unexpected kind "
                                  + std::string(game::ObjectTypeName(winner.type)));
            return CommandOutcome::NothingToDo;
    }
}

int InteractNearestCommand::Dispatch(IScriptStack& stack) {
    auto result = Invoke(stack);
    if (!result) {
        INTERACT_LOG_DEBUG(LogCategory::Script,
                           "InteractNearest rejected: " + std::string(result.error().message()));
        stack.RaiseError(result.error().message());
        return 0;
    }

    const auto outcome = result.value();
    INTERACT_LOG_DEBUG(LogCategory::Script,
                       "InteractNearest -> " + std::string(CommandOutcomeName(outcome)));

    if (outcome == CommandOutcome::InteractedUnit
        || outcome == CommandOutcome::InteractedObject) {
        stack.PushBoolean(true);
        return 1;
    }
    return 0;
}

GameResult<void> RegisterInteractFunctions(IScriptHost& host,
                                           InteractNearestCommand& command) {
    const std::string name(kInteractNearestName);
    auto registered = host.RegisterFunction(
        name, [&command](IScriptStack& stack) { return command.Dispatch(stack); });
    if (!registered) {
        INTERACT_LOG_ERROR(LogCategory::Script,
                           "failed to register " + name + ": "
                               + std::string(registered.error().message()));
        return GameResult<void>::err(
            GameError(ErrorCode::FunctionRegistrationFailed,
                      "failed to register " + name, name));
    }

    INTERACT_LOG_INFO(LogCategory::Script, "registered script function " + name);
    return GameResult<void>::ok();
}

}  // namespace interact::script
