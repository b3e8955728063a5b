#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// wscls Error
// ═══════════════════════════════════════════════════════════════════════════
// Shared error type returned by the variable store, the connection engine and
// the profile layer. Every recoverable condition is reported through
// Result<T>; nothing in the core throws across its public API.

#include <tl/expected.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace wscls {

/// Error codes for wscls operations
enum class ErrorCode {
    InvalidState,     ///< Command not accepted in the current connection state
    AlreadyActive,    ///< Connect issued while already connecting or open
    TransportError,   ///< Transport open/send/read failure
    InvalidArgument,  ///< Empty names, malformed values
    ConfigError       ///< Profile file unreadable or malformed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidState:    return "InvalidState";
        case ErrorCode::AlreadyActive:   return "AlreadyActive";
        case ErrorCode::TransportError:  return "TransportError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ConfigError:     return "ConfigError";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error invalid_state(std::string msg) {
        return {ErrorCode::InvalidState, std::move(msg)};
    }

    [[nodiscard]] static Error already_active() {
        return {ErrorCode::AlreadyActive, "A connection is already connecting or open"};
    }

    [[nodiscard]] static Error transport_error(std::string msg) {
        return {ErrorCode::TransportError, std::move(msg)};
    }

    [[nodiscard]] static Error invalid_argument(std::string msg) {
        return {ErrorCode::InvalidArgument, std::move(msg)};
    }

    [[nodiscard]] static Error config_error(std::string msg) {
        return {ErrorCode::ConfigError, std::move(msg)};
    }
};

template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace wscls
