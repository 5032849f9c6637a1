#pragma once

/// @file replay_runner.hpp
/// @brief Command-line handling and execution for interact_replay.

#include <filesystem>
#include <ostream>

#include "interact/foundation/game_result.hpp"
#include "scenario_loader.hpp"

namespace interact::tools {

struct ReplayOptions {
    std::filesystem::path scenarioPath;
    std::filesystem::path configPath;   ///< Empty: kDefaultConfigPath / env.
    bool verbose = false;               ///< Force every log category to Debug.
};

/// Parse `interact_replay [--config <file>] [--verbose] <scenario.yaml>`.
foundation::GameResult<ReplayOptions> parseReplayArgs(int argc, char* argv[]);

/// Run InteractNearest once against @p scenario and describe the result
/// on @p out.
///
/// @return 0 when the call succeeded (including "nothing to do"),
///         1 when it raised a script error.
int runScenario(Scenario& scenario, std::ostream& out);

}  // namespace interact::tools
