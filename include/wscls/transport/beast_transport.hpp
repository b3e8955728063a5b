#pragma once

#include "wscls/transport/websocket_transport.hpp"

#include <memory>
#include <string>

namespace wscls {

// ═══════════════════════════════════════════════════════════════════════════
// BeastWebSocketTransport
// ═══════════════════════════════════════════════════════════════════════════
// IWebSocketTransport over Boost.Beast, with OpenSSL for wss://.
//
// Owns a private io_context and the thread that runs it; events are
// delivered on that thread. Each open() starts a fresh session and detaches
// the previous one, so the transport can be reused across reconnects.
//
// Sequence per attempt:
//   resolve -> TCP connect -> TLS handshake (wss only) -> HTTP upgrade
//   -> read loop until close or error
//
// Certificate checks when ssl_verify is set: system trust store, peer
// verification and host name matching. With ssl_verify off the peer is not
// verified at all.

class BeastWebSocketTransport final : public IWebSocketTransport {
public:
    BeastWebSocketTransport();
    ~BeastWebSocketTransport() override;

    BeastWebSocketTransport(const BeastWebSocketTransport&) = delete;
    BeastWebSocketTransport& operator=(const BeastWebSocketTransport&) = delete;

    [[nodiscard]] TransportResult<void> open(OpenRequest request, EventHandler handler) override;

    [[nodiscard]] TransportResult<void> send_text(std::string payload) override;
    [[nodiscard]] TransportResult<void> send_binary(std::string payload) override;
    [[nodiscard]] TransportResult<void> send_ping(std::string payload) override;

    void close() override;
    void abort() noexcept override;

    /// True between the completed upgrade and the start of closing.
    [[nodiscard]] bool is_open() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace wscls
