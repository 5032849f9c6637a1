#pragma once

/// @file value_script_stack.hpp
/// @brief ValueScriptStack: IScriptStack over plain C++ values.

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "interact/script/script_host.hpp"

namespace interact::script {

/// Nil, boolean, number or string.
using ScriptValue = std::variant<std::monostate, bool, double, std::string>;

/// Script stack holding its arguments by value and recording whatever
/// the callee pushes or raises.
///
/// Number coercion follows the host's scripting language: a string
/// counts as a number when all of it (surrounding whitespace aside)
/// parses as a decimal or hexadecimal literal.
class ValueScriptStack final : public IScriptStack {
public:
    ValueScriptStack() = default;
    ValueScriptStack(std::initializer_list<ScriptValue> args);
    explicit ValueScriptStack(std::vector<ScriptValue> args);

    [[nodiscard]] int GetTop() const override;
    [[nodiscard]] bool IsNumber(int index) const override;
    [[nodiscard]] double ToNumber(int index) const override;
    void PushBoolean(bool value) override;
    void PushNil() override;
    void RaiseError(std::string_view message) override;

    /// Values pushed by the callee, in push order.
    [[nodiscard]] const std::vector<ScriptValue>& GetResults() const noexcept {
        return results_;
    }

    /// Message passed to RaiseError, if any.
    [[nodiscard]] const std::optional<std::string>& GetRaisedError() const noexcept {
        return raisedError_;
    }

    /// Render a value the way the scripting language's tostring() would.
    [[nodiscard]] static std::string Describe(const ScriptValue& value);

private:
    [[nodiscard]] const ScriptValue* argAt(int index) const noexcept;

    std::vector<ScriptValue> args_;
    std::vector<ScriptValue> results_;
    std::optional<std::string> raisedError_;
};

/// Parse @p text as a script number literal.
[[nodiscard]] std::optional<double> ParseScriptNumber(const std::string& text);

}  // namespace interact::script
