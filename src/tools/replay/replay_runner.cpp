/// @file replay_runner.cpp
/// @brief interact_replay argument parsing and scenario execution.

#include "replay_runner.hpp"

#include <ios>
#include <string>
#include <string_view>

#include "interact/script/interact_command.hpp"

namespace interact::tools {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

GameResult<ReplayOptions> parseReplayArgs(int argc, char* argv[]) {
    ReplayOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return GameResult<ReplayOptions>::err(
                    GameError(ErrorCode::InvalidArgument, "--config needs a file"));
            }
            options.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (!arg.empty() && arg.front() == '-') {
            return GameResult<ReplayOptions>::err(
                GameError(ErrorCode::InvalidArgument, "unknown option " + std::string(arg)));
        } else if (options.scenarioPath.empty()) {
            options.scenarioPath = arg;
        } else {
            return GameResult<ReplayOptions>::err(
                GameError(ErrorCode::InvalidArgument, "only one scenario may be given"));
        }
    }

    if (options.scenarioPath.empty()) {
        return GameResult<ReplayOptions>::err(
            GameError(ErrorCode::InvalidArgument,
                      "usage: interact_replay [--config <file>] [--verbose] <scenario.yaml>"));
    }
    return GameResult<ReplayOptions>::ok(std::move(options));
}

int runScenario(Scenario& scenario, std::ostream& out) {
    script::InteractNearestCommand command(scenario.world);
    script::ValueScriptStack stack(scenario.args);

    const int pushed = command.Dispatch(stack);

    if (const auto& raised = stack.GetRaisedError()) {
        out << "error: " << *raised << '\n';
        return 1;
    }

    out << "returned:";
    if (pushed == 0) {
        out << " (nothing)";
    }
    for (const auto& value : stack.GetResults()) {
        out << ' ' << script::ValueScriptStack::Describe(value);
    }
    out << '\n';

    for (const auto& action : scenario.world.GetActions()) {
        out << (action.kind == game::WorldActionKind::SetFocus ? "focus" : "interact")
            << " 0x" << std::hex << action.guid.value() << std::dec;
        if (action.kind == game::WorldActionKind::Interact) {
            out << " autoloot=" << action.autoloot;
        }
        out << '\n';
    }
    return 0;
}

}  // namespace interact::tools
