#pragma once

#include "wscls/connection/connection_config.hpp"
#include "wscls/transport/websocket_transport.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────────────────────────────
// Every input to the connection engine, whether it comes from the operator,
// a timer or the transport, is one of these. ConnectionEngine::handle() is
// the only place they are consumed.

namespace command {

// Operator
struct Connect {
    ConnectionConfig config;
};

struct Send {
    std::string text;
};

struct Ping {};

struct Disconnect {};

// Timers; `generation` identifies the arm that fired
struct PingTimerFired {
    std::uint64_t generation{0};
};

struct ReconnectTimerFired {
    std::uint64_t generation{0};
};

struct CloseDeadlineExpired {
    std::uint64_t generation{0};
};

// Transport; `attempt` identifies the open() that produced the event
struct TransportNotification {
    std::uint64_t attempt{0};
    TransportEvent event;
};

}  // namespace command

using Command = std::variant<
    command::Connect,
    command::Send,
    command::Ping,
    command::Disconnect,
    command::PingTimerFired,
    command::ReconnectTimerFired,
    command::CloseDeadlineExpired,
    command::TransportNotification
>;

}  // namespace wscls
