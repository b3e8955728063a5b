#include "wscls/transport/ws_url.hpp"

#include <ada.h>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// WebSocket URL Parser (using ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// ws and wss are WHATWG special schemes, so ada already knows their default
// ports and normalizes the path to at least "/".

TransportResult<WsUrl> parse_ws_url(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);

    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return tl::unexpected(TransportError::invalid_url(
            "Malformed URL: " + std::string(url)));
    }

    const auto& ada_url = parsed.value();

    // ada returns "wss:" - remove the colon
    std::string scheme = std::string(ada_url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_ws = (scheme == "ws");
    const bool is_wss = (scheme == "wss");
    if ((is_ws || is_wss) == false) {
        return tl::unexpected(TransportError::invalid_url(
            "Unsupported scheme '" + scheme + "' (expected ws or wss)"));
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return tl::unexpected(TransportError::invalid_url("URL has no host"));
    }

    const bool has_credentials =
        (ada_url.get_username().empty() == false) ||
        (ada_url.get_password().empty() == false);
    if (has_credentials) {
        return tl::unexpected(TransportError::invalid_url(
            "Credentials in URL are not supported; use an Authorization header"));
    }

    // Host header keeps the bracketed IPv6 form and any explicit port
    std::string host_header = std::string(ada_url.get_host());

    const bool is_ipv6 = (host.size() >= 2) && (host.front() == '[') && (host.back() == ']');
    if (is_ipv6) {
        host = host.substr(1, host.size() - 2);
    }

    std::string port = std::string(ada_url.get_port());
    if (port.empty()) {
        port = is_wss ? "443" : "80";
    }

    std::string target = std::string(ada_url.get_pathname());
    if (target.empty()) {
        target = "/";
    }
    target += std::string(ada_url.get_search());

    WsUrl result;
    result.secure = is_wss;
    result.host = std::move(host);
    result.port = std::move(port);
    result.target = std::move(target);
    result.host_header = std::move(host_header);
    return result;
}

}  // namespace wscls
