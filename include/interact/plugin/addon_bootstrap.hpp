#pragma once

/// @file addon_bootstrap.hpp
/// @brief AddonBootstrap: lifecycle of the injected addon module.
///
/// The host drives it in this order:
///
///   Load() → [SysMsgInitialize] OnSystemInitialized()
///          → [LoadScriptFunctions] OnScriptFunctionsLoaded()*  → Unload()
///
/// Load() runs under the loader lock of the host process and therefore
/// only installs the first detour.  Everything else, file I/O included,
/// waits for OnSystemInitialized().

#include <array>
#include <atomic>
#include <filesystem>

#include "interact/foundation/config_manager.hpp"
#include "interact/foundation/game_result.hpp"
#include "interact/game/world_accessor.hpp"
#include "interact/plugin/hook_types.hpp"
#include "interact/script/interact_command.hpp"
#include "interact/script/script_host.hpp"

namespace interact::plugin {

/// Configuration file looked up relative to the host's working directory.
inline constexpr const char* kDefaultConfigPath = "config/interact.yaml";

class AddonBootstrap {
public:
    /// All three collaborators must outlive the bootstrap.
    AddonBootstrap(IDetourInstaller& detours,
                   game::IWorldAccessor& world,
                   script::IScriptHost& host,
                   std::filesystem::path configPath = kDefaultConfigPath);

    AddonBootstrap(const AddonBootstrap&) = delete;
    AddonBootstrap& operator=(const AddonBootstrap&) = delete;

    /// Install the SysMsgInitialize detour.
    foundation::GameResult<void> Load();

    /// One-time secondary initialization.
    ///
    /// The first call loads the configuration, applies log levels, logs
    /// the version banner and installs the LoadScriptFunctions detour.
    /// Every later call returns immediately.  Failures are logged.
    void OnSystemInitialized();

    /// Register the script functions with the host.
    foundation::GameResult<void> OnScriptFunctionsLoaded();

    /// Log shutdown and flush the logger.
    foundation::GameResult<void> Unload();

    [[nodiscard]] bool IsInitialized() const noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool IsHookInstalled(HookPoint point) const noexcept {
        return hooksInstalled_[static_cast<std::size_t>(point)];
    }

    [[nodiscard]] const foundation::ConfigManager& GetConfig() const noexcept { return config_; }

    [[nodiscard]] script::InteractNearestCommand& GetCommand() noexcept { return command_; }

private:
    foundation::GameResult<void> installHook(HookPoint point, DetourCallback callback);
    void loadConfiguration();

    IDetourInstaller& detours_;
    script::IScriptHost& host_;
    std::filesystem::path configPath_;

    foundation::ConfigManager config_;
    script::InteractNearestCommand command_;

    std::atomic<bool> initialized_{false};
    std::array<bool, kHookPointCount> hooksInstalled_{};
};

}  // namespace interact::plugin
