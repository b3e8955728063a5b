#ifndef WSCLS_TRANSPORT_TRANSPORT_ERROR_HPP
#define WSCLS_TRANSPORT_TRANSPORT_ERROR_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Error Types
// ─────────────────────────────────────────────────────────────────────────────

struct TransportError {
    enum class Code {
        InvalidUrl,        // URL malformed or not ws:// / wss://
        ResolveFailed,     // Host name resolution failed
        ConnectFailed,     // TCP connect failed
        TlsError,          // TLS handshake or certificate verification failed
        HandshakeFailed,   // WebSocket upgrade rejected
        ReadFailed,        // Error while reading frames
        WriteFailed,       // Error while writing frames
        Timeout,           // Operation did not complete in time
        Closed             // Transport is not open
    };

    Code code;
    std::string message;

    static TransportError invalid_url(const std::string& msg) {
        return {Code::InvalidUrl, msg};
    }

    static TransportError resolve_failed(const std::string& msg) {
        return {Code::ResolveFailed, msg};
    }

    static TransportError connect_failed(const std::string& msg) {
        return {Code::ConnectFailed, msg};
    }

    static TransportError tls_error(const std::string& msg) {
        return {Code::TlsError, msg};
    }

    static TransportError handshake_failed(const std::string& msg) {
        return {Code::HandshakeFailed, msg};
    }

    static TransportError read_failed(const std::string& msg) {
        return {Code::ReadFailed, msg};
    }

    static TransportError write_failed(const std::string& msg) {
        return {Code::WriteFailed, msg};
    }

    static TransportError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }

    static TransportError closed() {
        return {Code::Closed, "Transport is not open"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Code code) noexcept {
    switch (code) {
        case TransportError::Code::InvalidUrl:      return "InvalidUrl";
        case TransportError::Code::ResolveFailed:   return "ResolveFailed";
        case TransportError::Code::ConnectFailed:   return "ConnectFailed";
        case TransportError::Code::TlsError:        return "TlsError";
        case TransportError::Code::HandshakeFailed: return "HandshakeFailed";
        case TransportError::Code::ReadFailed:      return "ReadFailed";
        case TransportError::Code::WriteFailed:     return "WriteFailed";
        case TransportError::Code::Timeout:         return "Timeout";
        case TransportError::Code::Closed:          return "Closed";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace wscls

#endif  // WSCLS_TRANSPORT_TRANSPORT_ERROR_HPP
