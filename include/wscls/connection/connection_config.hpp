#pragma once

#include "wscls/error.hpp"
#include "wscls/liveness/liveness_scheduler.hpp"
#include "wscls/transport/websocket_transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace wscls {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Configuration
// ═══════════════════════════════════════════════════════════════════════════
// What the operator chose for one connection. The engine snapshots it on
// Connect; later edits only apply to the next Connect.
//
// Usage:
//   auto config = ConnectionConfig{}
//       .with_endpoint("wss://$host/stream")
//       .with_header("Authorization", "Bearer $token")
//       .with_url_templating(true)
//       .with_auto_ping(true);

struct ConnectionConfig {
    std::string endpoint;
    HeaderList headers;

    bool ssl_verify{true};
    bool auto_ping{false};
    bool auto_reconnect{true};
    bool use_template_for_url{false};
    bool use_template_for_data{false};

    /// Context used for template lookups; nullopt = global scope only
    std::optional<std::string> active_context;

    ConnectionConfig& with_endpoint(std::string url) {
        endpoint = std::move(url);
        return *this;
    }

    ConnectionConfig& with_header(std::string name, std::string value) {
        headers.push_back(Header{std::move(name), std::move(value)});
        return *this;
    }

    /// Replace the first header with the same name (case-insensitive) and
    /// drop any later duplicates; append if there is none.
    ConnectionConfig& set_header(std::string name, std::string value);

    ConnectionConfig& with_ssl_verify(bool enabled) {
        ssl_verify = enabled;
        return *this;
    }

    ConnectionConfig& with_auto_ping(bool enabled) {
        auto_ping = enabled;
        return *this;
    }

    ConnectionConfig& with_auto_reconnect(bool enabled) {
        auto_reconnect = enabled;
        return *this;
    }

    ConnectionConfig& with_url_templating(bool enabled) {
        use_template_for_url = enabled;
        return *this;
    }

    ConnectionConfig& with_data_templating(bool enabled) {
        use_template_for_data = enabled;
        return *this;
    }

    ConnectionConfig& with_context(std::optional<std::string> context) {
        active_context = std::move(context);
        return *this;
    }
};

/// Reject configurations that can never connect (empty endpoint, empty
/// header names). URL syntax is checked by the transport after templating.
[[nodiscard]] Result<void> validate(const ConnectionConfig& config);

// ─────────────────────────────────────────────────────────────────────────────
// Engine Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct EngineConfig {
    LivenessConfig liveness;

    /// Upper bound on the close handshake before the transport is aborted
    std::chrono::milliseconds close_timeout{5'000};

    /// Passed to the transport for TCP connect + TLS + upgrade
    std::chrono::milliseconds handshake_timeout{10'000};

    EngineConfig& with_liveness(LivenessConfig config) {
        liveness = std::move(config);
        return *this;
    }

    EngineConfig& with_close_timeout(std::chrono::milliseconds timeout) {
        close_timeout = timeout;
        return *this;
    }

    EngineConfig& with_handshake_timeout(std::chrono::milliseconds timeout) {
        handshake_timeout = timeout;
        return *this;
    }
};

}  // namespace wscls
