/// @file addon_bootstrap.cpp
/// @brief AddonBootstrap implementation.

#include "interact/plugin/addon_bootstrap.hpp"

#include <string>
#include <utility>

#include "interact/foundation/game_logger.hpp"
#include "interact/foundation/logging_config.hpp"
#include "interact/version.hpp"

namespace interact::plugin {

using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;

AddonBootstrap::AddonBootstrap(IDetourInstaller& detours,
                               game::IWorldAccessor& world,
                               script::IScriptHost& host,
                               std::filesystem::path configPath)
    : detours_(detours),
      host_(host),
      configPath_(std::move(configPath)),
      command_(world) {}

GameResult<void> AddonBootstrap::Load() {
    return installHook(HookPoint::SysMsgInitialize, [this] { OnSystemInitialized(); });
}

void AddonBootstrap::OnSystemInitialized() {
    // The host may run SysMsgInitialize more than once; only the first
    // call initializes.
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    loadConfiguration();

    INTERACT_LOG_INFO(LogCategory::Core,
                      std::string("Interact v") + Version::string + " initializing");

    auto hooked = installHook(HookPoint::LoadScriptFunctions, [this] {
        auto registered = OnScriptFunctionsLoaded();
        if (!registered) {
            INTERACT_LOG_ERROR(LogCategory::Script,
                               std::string(registered.error().message()));
        }
    });
    if (!hooked) {
        INTERACT_LOG_ERROR(LogCategory::Core,
                           "InteractNearest will be unavailable: "
                               + std::string(hooked.error().message()));
    }
}

GameResult<void> AddonBootstrap::OnScriptFunctionsLoaded() {
    return script::RegisterInteractFunctions(host_, command_);
}

GameResult<void> AddonBootstrap::Unload() {
    INTERACT_LOG_INFO(LogCategory::Core, "Interact unloading");
    return GameLogger::instance().flush();
}

GameResult<void> AddonBootstrap::installHook(HookPoint point, DetourCallback callback) {
    const auto index = static_cast<std::size_t>(point);
    const std::string name(HookPointName(point));

    if (hooksInstalled_[index]) {
        return GameResult<void>::err(
            foundation::GameError(foundation::ErrorCode::HookAlreadyInstalled,
                                  name + " hook already installed", point));
    }

    auto installed = detours_.Install(point, std::move(callback));
    if (!installed) {
        INTERACT_LOG_ERROR(LogCategory::Hook,
                           "failed to install " + name + " hook: "
                               + std::string(installed.error().message()));
        return installed;
    }

    hooksInstalled_[index] = true;
    INTERACT_LOG_INFO(LogCategory::Hook, name + " hook installed");
    return GameResult<void>::ok();
}

void AddonBootstrap::loadConfiguration() {
    auto loaded = foundation::loadConfig(config_, configPath_);
    if (!loaded) {
        INTERACT_LOG_WARN(LogCategory::Core,
                          "using default settings: " + std::string(loaded.error().message()));
        return;
    }

    auto applied = foundation::applyLoggingConfig(config_, GameLogger::instance());
    if (!applied) {
        INTERACT_LOG_WARN(LogCategory::Core, std::string(applied.error().message()));
    }
}

}  // namespace interact::plugin
