#pragma once

/// @file logging_config.hpp
/// @brief Apply the `logging` section of the configuration to a GameLogger.
///
/// @code{.yaml}
///   logging:
///     level: info            # every category
///     categories:
///       selection: debug     # per-category override
/// @endcode

#include "interact/foundation/config_manager.hpp"
#include "interact/foundation/game_logger.hpp"

namespace interact::foundation {

inline constexpr const char* kLoggingLevelKey = "logging.level";
inline constexpr const char* kLoggingCategoriesKey = "logging.categories";

/// Set category levels from @p config.
///
/// `logging.level` is applied first, then each override.  Unknown
/// category or level names are skipped and reported in a single
/// InvalidArgument error after every valid entry has been applied.
GameResult<void> applyLoggingConfig(const ConfigManager& config, GameLogger& logger);

} // namespace interact::foundation
