#pragma once

/// @file scenario_loader.hpp
/// @brief Build a SnapshotWorld and call arguments from a YAML scenario.
///
/// @code{.yaml}
///   in_world: true
///   args: [1]                 # InteractNearest arguments
///   player:
///     guid: 0x1
///     position: [0, 0, 0]
///   entities:
///     - guid: 0x10
///       type: unit            # name or raw host value
///       position: [3, 0, 0]
///       health: 0
///       lootable: true
///     - guid: 0x11
///       type: gameobject
///       entry: 1731
///       position: [1, 0, 0]
/// @endcode

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "interact/foundation/game_result.hpp"
#include "interact/game/snapshot_world.hpp"
#include "interact/script/value_script_stack.hpp"

namespace interact::tools {

struct Scenario {
    game::SnapshotWorld world;
    std::vector<script::ScriptValue> args;
};

/// Parse a type field: a name ("unit", "gameobject", ...) or a raw number.
[[nodiscard]] std::optional<uint32_t> ParseObjectTypeName(std::string_view name);

foundation::GameResult<Scenario> LoadScenarioFile(const std::filesystem::path& path);

foundation::GameResult<Scenario> LoadScenarioString(std::string_view yaml);

/// Build a scenario from an already parsed document.
foundation::GameResult<Scenario> BuildScenario(const YAML::Node& root);

}  // namespace interact::tools
