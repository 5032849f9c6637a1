/// @file logging_config.cpp
/// @brief applyLoggingConfig implementation.

#include "interact/foundation/logging_config.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace interact::foundation {

GameResult<void> applyLoggingConfig(const ConfigManager& config, GameLogger& logger) {
    std::vector<std::string> rejected;

    if (config.hasKey(kLoggingLevelKey)) {
        auto name = config.get<std::string>(kLoggingLevelKey);
        auto level = name ? logLevelFromName(name.value()) : std::nullopt;
        if (level) {
            logger.setAllCategoryLevels(*level);
        } else {
            rejected.emplace_back(kLoggingLevelKey);
        }
    }

    auto categories = config.keysUnder(kLoggingCategoriesKey);
    // Deterministic order for the error message.
    std::sort(categories.begin(), categories.end());

    for (const auto& categoryName : categories) {
        const std::string key = std::string(kLoggingCategoriesKey) + "." + categoryName;
        auto cat = logCategoryFromName(categoryName);
        auto name = config.get<std::string>(key);
        auto level = name ? logLevelFromName(name.value()) : std::nullopt;
        if (!cat || !level) {
            rejected.push_back(key);
            continue;
        }
        logger.setCategoryLevel(*cat, *level);
    }

    if (rejected.empty()) {
        return GameResult<void>::ok();
    }

    std::string message = "invalid logging settings:";
    for (const auto& key : rejected) {
        message += ' ';
        message += key;
    }
    return GameResult<void>::err(GameError(ErrorCode::InvalidArgument, std::move(message)));
}

} // namespace interact::foundation
