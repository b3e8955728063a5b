#pragma once

#include <cstdint>
#include <string_view>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────
//
//   Idle ──Connect──► Connecting ──opened──► Open ──Disconnect──► Closing
//                        │  ▲                  │                     │
//                  failed│  │reconnect   dropped│          closed or  │
//                        ▼  │                  ▼          deadline   ▼
//                       Failed ◄───────────────┘                  Closed
//
// Closed and Failed are resting states; Connect starts over from either.

enum class ConnectionState : std::uint8_t {
    Idle,
    Connecting,
    Open,
    Closing,
    Closed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle:       return "Idle";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Open:       return "Open";
        case ConnectionState::Closing:    return "Closing";
        case ConnectionState::Closed:     return "Closed";
        case ConnectionState::Failed:     return "Failed";
    }
    return "Unknown";
}

}  // namespace wscls
