#include "wscls/transport/beast_transport.hpp"
#include "wscls/log/logger.hpp"
#include "wscls/transport/ws_url.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace wscls {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kUserAgent = "wscls";

struct OutboundFrame {
    FrameKind kind{FrameKind::Text};
    std::string payload;
};

bool is_timeout(const beast::error_code& ec) {
    return ec == beast::error::timeout;
}

// ─────────────────────────────────────────────────────────────────────────────
// SessionBase
// ─────────────────────────────────────────────────────────────────────────────
// The part of a session that does not depend on the stream type: the event
// handler and the flags readable from outside the io thread.

class SessionBase {
public:
    explicit SessionBase(IWebSocketTransport::EventHandler handler)
        : handler_(std::move(handler))
    {}

    virtual ~SessionBase() = default;

    virtual void start() = 0;
    virtual void enqueue(OutboundFrame frame) = 0;
    virtual void close() = 0;
    virtual void abort() = 0;

    [[nodiscard]] bool writable() const noexcept {
        return writable_.load(std::memory_order_acquire);
    }

    /// Stop delivering events. Safe from any thread.
    void detach() noexcept {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = nullptr;
    }

protected:
    void deliver(TransportEvent event) {
        IWebSocketTransport::EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(std::move(event));
        }
    }

    std::atomic<bool> writable_{false};

private:
    std::mutex handler_mutex_;
    IWebSocketTransport::EventHandler handler_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Session<Secure>
// ─────────────────────────────────────────────────────────────────────────────
// One connection attempt. Every completion handler runs on the session
// strand; `finished_` and the write queue are only touched there.

template <bool Secure>
struct StreamFor;

template <>
struct StreamFor<false> {
    using type = websocket::stream<beast::tcp_stream>;
};

template <>
struct StreamFor<true> {
    using type = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
};

template <bool Secure>
class Session final : public SessionBase, public std::enable_shared_from_this<Session<Secure>> {
public:
    using Stream = typename StreamFor<Secure>::type;
    using Strand = net::strand<net::io_context::executor_type>;

    Session(net::io_context& ioc,
            std::shared_ptr<ssl::context> ssl_ctx,
            WsUrl url,
            OpenRequest request,
            IWebSocketTransport::EventHandler handler)
        : SessionBase(std::move(handler))
        , ssl_ctx_(std::move(ssl_ctx))
        , strand_(net::make_strand(ioc))
        , resolver_(strand_)
        , ws_(make_stream(strand_, ssl_ctx_.get()))
        , url_(std::move(url))
        , request_(std::move(request))
    {}

    void start() override {
        net::post(strand_, [self = this->shared_from_this()]() { self->do_resolve(); });
    }

    void enqueue(OutboundFrame frame) override {
        net::post(strand_, [self = this->shared_from_this(), frame = std::move(frame)]() mutable {
            if (self->finished_ || self->closing_) {
                return;
            }
            self->queue_.push_back(std::move(frame));
            if (self->queue_.size() == 1) {
                self->do_write();
            }
        });
    }

    void close() override {
        writable_.store(false, std::memory_order_release);
        net::post(strand_, [self = this->shared_from_this()]() { self->do_close(); });
    }

    void abort() override {
        writable_.store(false, std::memory_order_release);
        detach();
        net::post(strand_, [self = this->shared_from_this()]() {
            self->finished_ = true;
            self->shutdown_socket();
        });
    }

private:
    static Stream make_stream(Strand& strand, ssl::context* ssl_ctx) {
        if constexpr (Secure) {
            return Stream(strand, *ssl_ctx);
        } else {
            return Stream(strand);
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Opening
    // ─────────────────────────────────────────────────────────────────────────

    void do_resolve() {
        if (finished_) {
            return;
        }
        get_logger().debug_fmt("Resolving {}:{}", url_.host, url_.port);
        resolver_.async_resolve(url_.host, url_.port,
            beast::bind_front_handler(&Session::on_resolve, this->shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(TransportError::resolve_failed(url_.host + ": " + ec.message()));
            return;
        }

        beast::get_lowest_layer(ws_).expires_after(request_.handshake_timeout);
        beast::get_lowest_layer(ws_).async_connect(results,
            beast::bind_front_handler(&Session::on_connect, this->shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(is_timeout(ec)
                ? TransportError::timeout("Connect to " + url_.host + " timed out")
                : TransportError::connect_failed(ec.message()));
            return;
        }
        get_logger().debug_fmt("TCP connected to {}", endpoint.address().to_string());

        if constexpr (Secure) {
            auto* native = ws_.next_layer().native_handle();

            // SNI
            if (SSL_set_tlsext_host_name(native, url_.host.c_str()) == 0) {
                fail(TransportError::tls_error("Failed to set SNI: " + last_ssl_error()));
                return;
            }

            if (request_.ssl_verify) {
                if (SSL_set1_host(native, url_.host.c_str()) == 0) {
                    fail(TransportError::tls_error("Failed to set host name check: " + last_ssl_error()));
                    return;
                }
                ws_.next_layer().set_verify_mode(ssl::verify_peer);
            } else {
                ws_.next_layer().set_verify_mode(ssl::verify_none);
            }

            ws_.next_layer().async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&Session::on_tls_handshake, this->shared_from_this()));
        } else {
            do_upgrade();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(is_timeout(ec)
                ? TransportError::timeout("TLS handshake timed out")
                : TransportError::tls_error(ec.message()));
            return;
        }
        do_upgrade();
    }

    void do_upgrade() {
        // The websocket stream enforces its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();

        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = request_.handshake_timeout;
        ws_.set_option(timeouts);

        ws_.set_option(websocket::stream_base::decorator(
            [headers = request_.headers](websocket::request_type& req) {
                bool has_user_agent = false;
                for (const auto& header : headers) {
                    if (beast::iequals(header.name, "User-Agent")) {
                        has_user_agent = true;
                    }
                }
                if (has_user_agent == false) {
                    req.set(http::field::user_agent, kUserAgent);
                }
                for (const auto& header : headers) {
                    req.insert(header.name, header.value);
                }
            }));

        ws_.control_callback([this](websocket::frame_type kind, beast::string_view payload) {
            if (kind == websocket::frame_type::pong) {
                deliver(PongReceived{std::string(payload)});
            }
        });

        ws_.async_handshake(url_.host_header, url_.target,
            beast::bind_front_handler(&Session::on_upgrade, this->shared_from_this()));
    }

    void on_upgrade(beast::error_code ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(is_timeout(ec)
                ? TransportError::timeout("WebSocket handshake timed out")
                : TransportError::handshake_failed(ec.message()));
            return;
        }

        writable_.store(true, std::memory_order_release);
        deliver(TransportOpened{});
        do_read();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Reading
    // ─────────────────────────────────────────────────────────────────────────

    void do_read() {
        ws_.async_read(buffer_,
            beast::bind_front_handler(&Session::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        if (finished_) {
            return;
        }

        if (ec == websocket::error::closed) {
            const auto& reason = ws_.reason();
            finish(TransportClosed{
                static_cast<std::uint16_t>(reason.code),
                std::string(reason.reason.data(), reason.reason.size())
            });
            return;
        }

        if (ec) {
            fail(TransportError::read_failed(ec.message()));
            return;
        }

        const FrameKind kind = ws_.got_text() ? FrameKind::Text : FrameKind::Binary;
        std::string payload = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        deliver(FrameReceived{kind, std::move(payload)});
        do_read();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Writing
    // ─────────────────────────────────────────────────────────────────────────

    void do_write() {
        auto& front = queue_.front();

        if (front.kind == FrameKind::Ping) {
            websocket::ping_data data;
            const auto size = std::min(front.payload.size(), data.max_size());
            data.assign(front.payload.data(), size);
            ws_.async_ping(data,
                [self = this->shared_from_this()](beast::error_code ec) { self->on_write(ec); });
            return;
        }

        ws_.text(front.kind == FrameKind::Text);
        ws_.async_write(net::buffer(front.payload),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t /*bytes*/) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec) {
        if (finished_) {
            return;
        }
        if (ec) {
            fail(TransportError::write_failed(ec.message()));
            return;
        }
        queue_.pop_front();
        const bool more = (queue_.empty() == false) && (closing_ == false);
        if (more) {
            do_write();
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Closing
    // ─────────────────────────────────────────────────────────────────────────

    void do_close() {
        if (finished_ || closing_) {
            return;
        }
        closing_ = true;

        if (ws_.is_open() == false) {
            // Still opening: nothing to hand-shake with
            finish(TransportClosed{static_cast<std::uint16_t>(websocket::close_code::normal), ""});
            return;
        }

        // The pending read completes with error::closed once the peer answers
        ws_.async_close(websocket::close_code::normal,
            [self = this->shared_from_this()](beast::error_code ec) {
                if (self->finished_) {
                    return;
                }
                if (ec == websocket::error::closed) {
                    return;
                }
                if (ec) {
                    self->fail(TransportError::write_failed("Close failed: " + ec.message()));
                }
            });
    }

    void finish(TransportEvent event) {
        finished_ = true;
        writable_.store(false, std::memory_order_release);
        deliver(std::move(event));
        detach();
        shutdown_socket();
    }

    void fail(TransportError error) {
        get_logger().debug_fmt("Transport {}: {}", to_string(error.code), error.message);
        finish(TransportFailed{std::move(error)});
    }

    void shutdown_socket() {
        beast::error_code ignored;
        resolver_.cancel();
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

    static std::string last_ssl_error() {
        const beast::error_code ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return ec.message();
    }

    std::shared_ptr<ssl::context> ssl_ctx_;  // Must outlive ws_
    Strand strand_;
    tcp::resolver resolver_;
    Stream ws_;
    beast::flat_buffer buffer_;
    std::deque<OutboundFrame> queue_;

    WsUrl url_;
    OpenRequest request_;

    bool finished_{false};
    bool closing_{false};
};

TransportResult<std::shared_ptr<ssl::context>> make_ssl_context(bool verify) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);

    if (verify) {
        beast::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            return tl::unexpected(TransportError::tls_error(
                "Cannot load system trust store: " + ec.message()));
        }
    }

    return ctx;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// BeastWebSocketTransport
// ═══════════════════════════════════════════════════════════════════════════

struct BeastWebSocketTransport::Impl {
    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> work;
    std::thread thread;

    std::mutex mutex;
    std::shared_ptr<SessionBase> session;

    Impl()
        : work(net::make_work_guard(ioc))
    {
        thread = std::thread([this]() { run(); });
    }

    ~Impl() {
        work.reset();
        ioc.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }

    void run() {
        for (;;) {
            try {
                ioc.run();
                return;
            } catch (const std::exception& e) {
                get_logger().error_fmt("WebSocket io thread: {}", e.what());
            }
        }
    }

    std::shared_ptr<SessionBase> current() {
        std::lock_guard<std::mutex> lock(mutex);
        return session;
    }
};

BeastWebSocketTransport::BeastWebSocketTransport()
    : impl_(std::make_unique<Impl>())
{}

BeastWebSocketTransport::~BeastWebSocketTransport() {
    abort();
}

TransportResult<void> BeastWebSocketTransport::open(OpenRequest request, EventHandler handler) {
    auto url = parse_ws_url(request.url);
    if (url.has_value() == false) {
        return tl::unexpected(url.error());
    }

    std::shared_ptr<SessionBase> session;
    if (url->secure) {
        auto ctx = make_ssl_context(request.ssl_verify);
        if (ctx.has_value() == false) {
            return tl::unexpected(ctx.error());
        }
        session = std::make_shared<Session<true>>(
            impl_->ioc, std::move(*ctx), std::move(*url), std::move(request), std::move(handler));
    } else {
        session = std::make_shared<Session<false>>(
            impl_->ioc, nullptr, std::move(*url), std::move(request), std::move(handler));
    }

    std::shared_ptr<SessionBase> previous;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        previous = std::exchange(impl_->session, session);
    }
    if (previous != nullptr) {
        previous->abort();
    }

    session->start();
    return {};
}

TransportResult<void> BeastWebSocketTransport::send_text(std::string payload) {
    auto session = impl_->current();
    if ((session == nullptr) || (session->writable() == false)) {
        return tl::unexpected(TransportError::closed());
    }
    session->enqueue(OutboundFrame{FrameKind::Text, std::move(payload)});
    return {};
}

TransportResult<void> BeastWebSocketTransport::send_binary(std::string payload) {
    auto session = impl_->current();
    if ((session == nullptr) || (session->writable() == false)) {
        return tl::unexpected(TransportError::closed());
    }
    session->enqueue(OutboundFrame{FrameKind::Binary, std::move(payload)});
    return {};
}

TransportResult<void> BeastWebSocketTransport::send_ping(std::string payload) {
    auto session = impl_->current();
    if ((session == nullptr) || (session->writable() == false)) {
        return tl::unexpected(TransportError::closed());
    }
    session->enqueue(OutboundFrame{FrameKind::Ping, std::move(payload)});
    return {};
}

void BeastWebSocketTransport::close() {
    auto session = impl_->current();
    if (session != nullptr) {
        session->close();
    }
}

void BeastWebSocketTransport::abort() noexcept {
    std::shared_ptr<SessionBase> session;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        session = std::move(impl_->session);
    }
    if (session != nullptr) {
        session->abort();
    }
}

bool BeastWebSocketTransport::is_open() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return (impl_->session != nullptr) && impl_->session->writable();
}

}  // namespace wscls
