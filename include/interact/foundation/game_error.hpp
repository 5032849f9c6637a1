#pragma once

/// @file game_error.hpp
/// @brief Error type used with Result<T, GameError> across the addon.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "interact/foundation/error_code.hpp"

namespace interact::foundation {

/// Error carrying a categorized code, a human-readable message and
/// optional type-erased context (e.g. the HookPoint that failed).
///
/// The message of a ScriptUsage error is surfaced verbatim to the
/// script caller, so it must stay short and user-facing.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace interact::foundation
