#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wscls {

enum class Direction : std::uint8_t {
    Outbound,
    Inbound
};

enum class FrameKind : std::uint8_t {
    Text,
    Binary,
    Ping,
    Pong
};

[[nodiscard]] constexpr std::string_view to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Outbound: return "Outbound";
        case Direction::Inbound:  return "Inbound";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view to_string(FrameKind kind) noexcept {
    switch (kind) {
        case FrameKind::Text:   return "Text";
        case FrameKind::Binary: return "Binary";
        case FrameKind::Ping:   return "Ping";
        case FrameKind::Pong:   return "Pong";
    }
    return "Unknown";
}

/// One frame that crossed the connection boundary. Immutable once emitted.
struct Message {
    Direction direction{Direction::Outbound};
    FrameKind kind{FrameKind::Text};
    std::string payload;
    std::chrono::system_clock::time_point timestamp{};

    /// Set on inbound pongs that echo a ping sent by the engine
    std::optional<std::chrono::microseconds> round_trip;
};

}  // namespace wscls
