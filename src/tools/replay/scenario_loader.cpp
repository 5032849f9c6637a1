/// @file scenario_loader.cpp
/// @brief YAML scenario loading for the replay tool.

#include "scenario_loader.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace interact::tools {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError invalid(std::string message) {
    return GameError(ErrorCode::InvalidArgument, std::move(message));
}

game::Vector3 readPosition(const YAML::Node& node) {
    if (!node) {
        return game::Vector3::Zero();
    }
    if (!node.IsSequence() || node.size() != 3) {
        throw YAML::RepresentationException(node.Mark(), "position must be [x, y, z]");
    }
    return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
}

game::ObjectGuid readGuid(const YAML::Node& node) {
    return game::ObjectGuid{node ? node.as<uint64_t>() : 0};
}

/// Script values: numbers stay numbers, true/false become booleans,
/// everything else is passed as a string.
script::ScriptValue readScriptValue(const YAML::Node& node) {
    if (node.IsNull()) {
        return std::monostate{};
    }
    const auto& text = node.Scalar();
    if (node.Tag() != "!") {
        bool flag = false;
        if (YAML::convert<bool>::decode(node, flag)) {
            return flag;
        }
        double number = 0.0;
        if (YAML::convert<double>::decode(node, number)) {
            return number;
        }
    }
    return text;
}

GameResult<game::EntityRecord> readEntity(const YAML::Node& node, std::size_t index) {
    game::EntityRecord record;
    const auto where = "entities[" + std::to_string(index) + "]";

    record.guid = readGuid(node["guid"]);
    if (!record.guid.isValid()) {
        return GameResult<game::EntityRecord>::err(invalid(where + ": guid is required"));
    }

    const auto typeNode = node["type"];
    if (!typeNode) {
        return GameResult<game::EntityRecord>::err(invalid(where + ": type is required"));
    }
    const auto rawType = ParseObjectTypeName(typeNode.Scalar());
    if (!rawType) {
        return GameResult<game::EntityRecord>::err(
            GameError(ErrorCode::InvalidObjectType,
                      where + ": unknown type '" + typeNode.Scalar() + "'"));
    }
    record.rawType = *rawType;

    record.position = readPosition(node["position"]);
    record.health = node["health"].as<int32_t>(0);
    record.dynamicFlags = node["dynamic_flags"].as<uint32_t>(0);
    record.unitFlags = node["unit_flags"].as<uint32_t>(0);
    if (node["lootable"].as<bool>(false)) {
        record.dynamicFlags |= game::kDynamicFlagLootable;
    }
    if (node["skinnable"].as<bool>(false)) {
        record.unitFlags |= game::kUnitFlagSkinnable;
    }
    record.summonedBy = readGuid(node["summoned_by"]);
    record.gameObjectEntry = node["entry"].as<uint32_t>(0);
    record.despawned = node["despawned"].as<bool>(false);

    return GameResult<game::EntityRecord>::ok(record);
}

}  // namespace

std::optional<uint32_t> ParseObjectTypeName(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (uint32_t raw = 0; raw <= static_cast<uint32_t>(game::ObjectType::Corpse); ++raw) {
        std::string candidate(game::ObjectTypeName(static_cast<game::ObjectType>(raw)));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lowered) {
            return raw;
        }
    }

    // Raw host values, including ones the addon does not recognize.
    if (!lowered.empty()
        && std::all_of(lowered.begin(), lowered.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        try {
            return static_cast<uint32_t>(std::stoul(lowered));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

GameResult<Scenario> BuildScenario(const YAML::Node& root) {
    if (!root.IsMap()) {
        return GameResult<Scenario>::err(invalid("scenario must be a mapping"));
    }

    try {
        Scenario scenario;
        scenario.world.SetInWorld(root["in_world"].as<bool>(true));

        if (const auto args = root["args"]) {
            if (!args.IsSequence()) {
                return GameResult<Scenario>::err(invalid("args must be a list"));
            }
            for (const auto& arg : args) {
                scenario.args.push_back(readScriptValue(arg));
            }
        }

        const auto player = root["player"];
        if (!player) {
            return GameResult<Scenario>::err(invalid("player is required"));
        }
        auto placed = scenario.world.SetPlayer(readGuid(player["guid"]),
                                               readPosition(player["position"]));
        if (!placed) {
            return GameResult<Scenario>::err(placed.error());
        }
        const bool playerDespawned = player["despawned"].as<bool>(false);

        if (const auto entities = root["entities"]) {
            std::size_t index = 0;
            for (const auto& node : entities) {
                auto record = readEntity(node, index++);
                if (!record) {
                    return GameResult<Scenario>::err(record.error());
                }
                auto added = scenario.world.Add(record.value());
                if (!added) {
                    return GameResult<Scenario>::err(added.error());
                }
            }
        }

        if (playerDespawned) {
            scenario.world.Despawn(scenario.world.GetPlayerGuid());
        }
        return GameResult<Scenario>::ok(std::move(scenario));
    } catch (const YAML::Exception& e) {
        return GameResult<Scenario>::err(
            invalid(std::string("malformed scenario: ") + e.what()));
    }
}

GameResult<Scenario> LoadScenarioString(std::string_view yaml) {
    try {
        return BuildScenario(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return GameResult<Scenario>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

GameResult<Scenario> LoadScenarioFile(const std::filesystem::path& path) {
    try {
        return BuildScenario(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GameResult<Scenario>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open scenario: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<Scenario>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

}  // namespace interact::tools
