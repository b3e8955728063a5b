#ifndef WSCLS_TRANSPORT_WS_URL_HPP
#define WSCLS_TRANSPORT_WS_URL_HPP

#include "wscls/transport/transport_error.hpp"

#include <string>
#include <string_view>

namespace wscls {

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket URL
// ═══════════════════════════════════════════════════════════════════════════
// Components needed to open a socket and send the upgrade request.
//
//   wss://user.example.com:8443/feed?x=1
//   secure = true, host = "user.example.com", port = "8443",
//   target = "/feed?x=1", host_header = "user.example.com:8443"

struct WsUrl {
    bool secure{false};
    std::string host;         // Without IPv6 brackets
    std::string port;         // Defaults to 80 / 443
    std::string target;       // Path plus query, never empty
    std::string host_header;  // Value for the Host header
};

/// Parse and validate a ws:// or wss:// URL (WHATWG rules via ada).
/// Rejects other schemes, empty hosts and embedded credentials.
[[nodiscard]] TransportResult<WsUrl> parse_ws_url(std::string_view url);

}  // namespace wscls

#endif  // WSCLS_TRANSPORT_WS_URL_HPP
