/// @file main.cpp
/// @brief interact_replay entry point.
///
/// Replays one InteractNearest call against a world described in YAML
/// and prints what the addon would have done.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "console_logger.hpp"
#include "interact/foundation/config_manager.hpp"
#include "interact/foundation/game_logger.hpp"
#include "interact/foundation/logging_config.hpp"
#include "interact/plugin/addon_bootstrap.hpp"
#include "interact/version.hpp"
#include "replay_runner.hpp"
#include "scenario_loader.hpp"

int main(int argc, char* argv[]) {
    namespace foundation = interact::foundation;

    auto options = interact::tools::parseReplayArgs(argc, argv);
    if (!options) {
        std::cerr << options.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto console = std::make_shared<interact::tools::ConsoleLogger>(
        std::clog, kcenon::common::interfaces::log_level::trace);
    kcenon::common::interfaces::GlobalLoggerRegistry::instance().set_default_logger(console);

    auto& logger = foundation::GameLogger::instance();

    auto configPath = options.value().configPath;
    if (configPath.empty()) {
        configPath = interact::plugin::kDefaultConfigPath;
    }
    foundation::ConfigManager config;
    auto loaded = foundation::loadConfig(config, configPath);
    if (loaded) {
        auto applied = foundation::applyLoggingConfig(config, logger);
        if (!applied) {
            std::cerr << "Ignoring logging settings: " << applied.error().message() << "\n";
        }
    } else if (!options.value().configPath.empty()) {
        std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (options.value().verbose) {
        logger.setAllCategoryLevels(foundation::LogLevel::Debug);
    }

    INTERACT_LOG_INFO(foundation::LogCategory::Core,
                      std::string("interact_replay ") + interact::Version::string);

    auto scenario = interact::tools::LoadScenarioFile(options.value().scenarioPath);
    if (!scenario) {
        std::cerr << "Failed to load scenario: " << scenario.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const int status = interact::tools::runScenario(scenario.value(), std::cout);

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << flushed.error().message() << "\n";
    }
    return status == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
