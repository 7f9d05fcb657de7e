#pragma once

/// @file game_error.hpp
/// @brief Engine error type used with Result<T, GameError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "evolve/foundation/error_code.hpp"

namespace evolve::foundation {

/// Error code plus a message and optional payload.
///
/// Rejections that carry a number the caller can act on attach it as
/// context: OnCooldown carries the remaining seconds as a float.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message, std::any context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }
    [[nodiscard]] ErrorClass errorClass() const noexcept { return classifyError(code_); }

    /// Payload of type T, or null when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for precondition failures; the AI scores these as a failed
    /// action instead of surfacing them.
    [[nodiscard]] bool isRecoverable() const noexcept {
        return errorClass() == ErrorClass::Precondition;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace evolve::foundation
