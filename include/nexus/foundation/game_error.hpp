#pragma once

/// @file game_error.hpp
/// @brief Error value carried by GameResult<T>.
///
/// Every failure in the simulation core (maze generation, path search,
/// config validation, logger access) is reported as a GameError. The
/// optional context slot holds a typed payload that callers may inspect,
/// e.g. the GridCell a path search could not reach.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "nexus/foundation/error_code.hpp"

namespace nexus::foundation {

class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Name of the subsystem owning code(), e.g. "Maze" or "Config".
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// "[Subsystem] message", the form used in log lines.
    [[nodiscard]] std::string describe() const {
        std::string text;
        text.reserve(message_.size() + 16);
        text += '[';
        text += subsystem();
        text += "] ";
        text += message_;
        return text;
    }

    /// Typed payload, or nullptr when absent or of another type.
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

} // namespace nexus::foundation
