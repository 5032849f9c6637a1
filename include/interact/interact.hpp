#pragma once

/// @file interact.hpp
/// @brief Umbrella header for the interact addon core.

#include "interact/version.hpp"
#include "interact/core/result.hpp"

#include "interact/foundation/error_code.hpp"
#include "interact/foundation/game_error.hpp"
#include "interact/foundation/game_result.hpp"
#include "interact/foundation/game_logger.hpp"
#include "interact/foundation/config_manager.hpp"
#include "interact/foundation/logging_config.hpp"

#include "interact/game/candidate.hpp"
#include "interact/game/eligibility_filter.hpp"
#include "interact/game/selection_engine.hpp"
#include "interact/game/world_accessor.hpp"

#include "interact/script/interact_command.hpp"
#include "interact/script/script_host.hpp"

#include "interact/plugin/addon_bootstrap.hpp"
