#pragma once

/// @file script_host.hpp
/// @brief Seams between the addon and the host's embedded scripting engine.
///
/// The host links its own Lua 5.0 runtime and exposes only raw function
/// addresses.  The addon talks to it through these two interfaces; the
/// in-process implementation forwards to those addresses, and tests use
/// ValueScriptStack and a recording host.

#include <functional>
#include <string>
#include <string_view>

#include "interact/foundation/game_result.hpp"

namespace interact::script {

/// Argument and return-value view of one script function call.
///
/// Indices are 1-based, as in the scripting language.
class IScriptStack {
public:
    virtual ~IScriptStack() = default;

    /// Number of arguments on the stack.
    [[nodiscard]] virtual int GetTop() const = 0;

    /// True if the value at @p index is a number or a string that
    /// converts to one.  False for a missing index.
    [[nodiscard]] virtual bool IsNumber(int index) const = 0;

    /// Numeric value at @p index; 0 if it is not convertible.
    [[nodiscard]] virtual double ToNumber(int index) const = 0;

    virtual void PushBoolean(bool value) = 0;
    virtual void PushNil() = 0;

    /// Raise a script error carrying @p message to the script caller.
    ///
    /// The live host never returns from this call.  Callers still return
    /// normally afterwards so that non-unwinding stacks behave the same.
    virtual void RaiseError(std::string_view message) = 0;
};

/// Native function callable from scripts.  Returns the number of values
/// it pushed.
using ScriptFunction = std::function<int(IScriptStack&)>;

/// The host's global function table.
class IScriptHost {
public:
    virtual ~IScriptHost() = default;

    /// Expose @p fn to scripts under the global name @p name.
    ///
    /// Registering an existing name replaces it; the host calls the
    /// registration path again every time it reloads its UI scripts.
    virtual foundation::GameResult<void> RegisterFunction(const std::string& name,
                                                          ScriptFunction fn) = 0;
};

}  // namespace interact::script
