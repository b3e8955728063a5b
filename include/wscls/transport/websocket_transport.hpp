#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// The connection engine never speaks the WebSocket protocol itself. It drives
// an IWebSocketTransport and consumes the events the transport reports.
//
// Contract for implementations:
// - open() starts one asynchronous attempt and returns immediately. Errors it
//   can detect up front (bad URL, attempt already running) are returned;
//   everything later arrives as a TransportEvent.
// - The event handler must not be invoked from inside open(), send_*(),
//   close() or abort(); the engine holds its transition lock while calling
//   those.
// - Events are delivered in the order they happen: at most one
//   TransportOpened, then frames, then exactly one TransportClosed or
//   TransportFailed.
// - abort() releases resources promptly; events already in flight may still
//   be delivered and are discarded by the engine.

#include "wscls/channel/message.hpp"
#include "wscls/transport/transport_error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace wscls {

struct Header {
    std::string name;
    std::string value;

    friend bool operator==(const Header&, const Header&) = default;
};

/// Ordered header list sent with the upgrade request
using HeaderList = std::vector<Header>;

/// Everything a transport needs to open one connection
struct OpenRequest {
    std::string url;
    HeaderList headers;
    bool ssl_verify{true};
    std::chrono::milliseconds handshake_timeout{10'000};
};

// ─────────────────────────────────────────────────────────────────────────────
// Transport Events
// ─────────────────────────────────────────────────────────────────────────────

struct TransportOpened {};

struct FrameReceived {
    FrameKind kind{FrameKind::Text};  // Text or Binary
    std::string payload;
};

struct PongReceived {
    std::string payload;
};

/// Peer completed a close handshake or the stream ended cleanly
struct TransportClosed {
    std::uint16_t code{1000};
    std::string reason;
};

struct TransportFailed {
    TransportError error;
};

using TransportEvent = std::variant<
    TransportOpened,
    FrameReceived,
    PongReceived,
    TransportClosed,
    TransportFailed
>;

// ─────────────────────────────────────────────────────────────────────────────
// IWebSocketTransport
// ─────────────────────────────────────────────────────────────────────────────

class IWebSocketTransport {
public:
    using EventHandler = std::function<void(TransportEvent)>;

    virtual ~IWebSocketTransport() = default;

    /// Begin opening a connection; outcome reported through `handler`.
    [[nodiscard]] virtual TransportResult<void> open(OpenRequest request, EventHandler handler) = 0;

    [[nodiscard]] virtual TransportResult<void> send_text(std::string payload) = 0;

    [[nodiscard]] virtual TransportResult<void> send_binary(std::string payload) = 0;

    [[nodiscard]] virtual TransportResult<void> send_ping(std::string payload) = 0;

    /// Request a graceful close; a TransportClosed (or TransportFailed) follows.
    virtual void close() = 0;

    /// Drop the connection without a close handshake and detach the handler.
    virtual void abort() noexcept = 0;
};

}  // namespace wscls
