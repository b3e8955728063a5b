#include <catch2/catch_test_macros.hpp>

#include "wscls/connection/connection_engine.hpp"
#include "mocks/io_runner.hpp"
#include "mocks/mock_websocket_transport.hpp"
#include "mocks/test_logger.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace wscls;
using namespace wscls::testing;

using namespace std::chrono_literals;

namespace {

using Transition = std::pair<ConnectionState, ConnectionState>;

EngineConfig fast_engine_config(std::chrono::milliseconds reconnect_delay = 10ms) {
    LivenessConfig liveness;
    liveness.with_ping_interval(20ms)
            .with_reconnect_delays(1ms, 1'000ms)
            .with_backoff_policy(std::make_shared<ConstantBackoff>(reconnect_delay));

    EngineConfig config;
    config.with_liveness(std::move(liveness))
          .with_close_timeout(50ms)
          .with_handshake_timeout(250ms);
    return config;
}

ConnectionConfig echo_config() {
    return ConnectionConfig{}.with_endpoint("ws://localhost:9000/echo");
}

// ─────────────────────────────────────────────────────────────────────────────
// Fixture
// ─────────────────────────────────────────────────────────────────────────────
// Member order matters: the logger and io thread outlive the engine.

struct EngineFixture {
    ScopedTestLogger logger;
    IoRunner io;
    std::shared_ptr<VariableStore> variables = std::make_shared<VariableStore>();
    std::shared_ptr<MessageChannel> channel = std::make_shared<MessageChannel>();
    MockWebSocketTransport* transport{nullptr};
    std::unique_ptr<ConnectionEngine> engine;

    std::mutex mutex;
    std::vector<Transition> transitions;
    std::vector<ReconnectSchedule> schedules;
    std::vector<std::size_t> exhausted;

    explicit EngineFixture(EngineConfig config = fast_engine_config()) {
        auto mock = std::make_unique<MockWebSocketTransport>();
        transport = mock.get();
        engine = std::make_unique<ConnectionEngine>(
            io.executor(), variables, std::move(mock), channel, std::move(config));

        engine->on_state_change([this](ConnectionState old_state, ConnectionState new_state) {
            std::lock_guard<std::mutex> lock(mutex);
            transitions.emplace_back(old_state, new_state);
        });
        engine->on_reconnect_scheduled([this](const ReconnectSchedule& schedule) {
            std::lock_guard<std::mutex> lock(mutex);
            schedules.push_back(schedule);
        });
        engine->on_reconnect_exhausted([this](std::size_t attempts) {
            std::lock_guard<std::mutex> lock(mutex);
            exhausted.push_back(attempts);
        });
    }

    ~EngineFixture() {
        engine.reset();
    }

    void open(ConnectionConfig config = echo_config()) {
        REQUIRE(engine->connect(std::move(config)).has_value());
        transport->emit_opened();
        REQUIRE(engine->state() == ConnectionState::Open);
    }

    std::vector<Transition> recorded_transitions() {
        std::lock_guard<std::mutex> lock(mutex);
        return transitions;
    }

    std::vector<ReconnectSchedule> recorded_schedules() {
        std::lock_guard<std::mutex> lock(mutex);
        return schedules;
    }

    std::vector<std::size_t> recorded_exhausted() {
        std::lock_guard<std::mutex> lock(mutex);
        return exhausted;
    }

    bool in_state(ConnectionState state) const {
        return engine->state() == state;
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine rejects missing collaborators", "[engine]") {
    IoRunner io;
    auto variables = std::make_shared<VariableStore>();
    auto channel = std::make_shared<MessageChannel>();

    SECTION("null transport") {
        REQUIRE_THROWS_AS(
            ConnectionEngine(io.executor(), variables, nullptr, channel),
            std::invalid_argument);
    }

    SECTION("null variable store") {
        REQUIRE_THROWS_AS(
            ConnectionEngine(io.executor(), nullptr, std::make_unique<MockWebSocketTransport>(), channel),
            std::invalid_argument);
    }

    SECTION("null channel") {
        REQUIRE_THROWS_AS(
            ConnectionEngine(io.executor(), variables, std::make_unique<MockWebSocketTransport>(), nullptr),
            std::invalid_argument);
    }
}

TEST_CASE("ConnectionEngine starts idle", "[engine]") {
    EngineFixture f;

    REQUIRE(f.engine->state() == ConnectionState::Idle);
    REQUIRE(f.engine->last_error().empty());
    REQUIRE(f.engine->current_url().empty());
    REQUIRE(f.engine->ping_timer_active() == false);
    REQUIRE(f.engine->reconnect_timer_pending() == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rejected commands
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine rejects commands that need an open connection", "[engine][state]") {
    EngineFixture f;

    auto sent = f.engine->send("hello");
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().code == ErrorCode::InvalidState);

    auto pinged = f.engine->ping();
    REQUIRE_FALSE(pinged.has_value());
    REQUIRE(pinged.error().code == ErrorCode::InvalidState);

    auto disconnected = f.engine->disconnect();
    REQUIRE_FALSE(disconnected.has_value());
    REQUIRE(disconnected.error().code == ErrorCode::InvalidState);

    REQUIRE(f.engine->state() == ConnectionState::Idle);
    REQUIRE(f.transport->open_count() == 0);
    REQUIRE(f.transport->sent().empty());
    REQUIRE(f.channel->stats().emitted == 0);
}

TEST_CASE("ConnectionEngine rejects a second connect while active", "[engine][state]") {
    EngineFixture f;
    REQUIRE(f.engine->connect(echo_config()).has_value());

    SECTION("while connecting") {
        auto again = f.engine->connect(echo_config());
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::AlreadyActive);
        REQUIRE(f.engine->state() == ConnectionState::Connecting);
    }

    SECTION("while open") {
        f.transport->emit_opened();
        auto again = f.engine->connect(echo_config());
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::AlreadyActive);
        REQUIRE(f.engine->state() == ConnectionState::Open);
    }

    REQUIRE(f.transport->open_count() == 1);
}

TEST_CASE("ConnectionEngine rejects connect while closing", "[engine][state]") {
    EngineFixture f;
    f.open();
    REQUIRE(f.engine->disconnect().has_value());

    auto again = f.engine->connect(echo_config());

    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ErrorCode::InvalidState);
    REQUIRE(f.engine->state() == ConnectionState::Closing);
}

TEST_CASE("ConnectionEngine validates the configuration", "[engine][config]") {
    EngineFixture f;

    SECTION("empty endpoint") {
        auto result = f.engine->connect(ConnectionConfig{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("empty header name") {
        auto result = f.engine->connect(echo_config().with_header("", "value"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("empty context name") {
        auto result = f.engine->connect(echo_config().with_context(std::string{}));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidArgument);
    }

    REQUIRE(f.engine->state() == ConnectionState::Idle);
    REQUIRE(f.transport->open_count() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Connecting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine connect opens the transport", "[engine][connect]") {
    EngineFixture f;

    auto config = echo_config()
        .with_header("Authorization", "Bearer abc")
        .with_ssl_verify(false);
    REQUIRE(f.engine->connect(config).has_value());

    REQUIRE(f.engine->state() == ConnectionState::Connecting);
    REQUIRE(f.transport->open_count() == 1);

    const auto request = f.transport->last_request();
    REQUIRE(request.url == "ws://localhost:9000/echo");
    REQUIRE(request.headers.size() == 1);
    REQUIRE(request.headers[0] == Header{"Authorization", "Bearer abc"});
    REQUIRE(request.ssl_verify == false);
    REQUIRE(request.handshake_timeout == 250ms);

    f.transport->emit_opened();

    REQUIRE(f.engine->state() == ConnectionState::Open);
    const std::vector<Transition> expected{
        {ConnectionState::Idle, ConnectionState::Connecting},
        {ConnectionState::Connecting, ConnectionState::Open}
    };
    REQUIRE(f.recorded_transitions() == expected);
    REQUIRE(f.logger->contains(LogLevel::Info, "Connected to ws://localhost:9000/echo"));
}

TEST_CASE("ConnectionEngine renders the URL template on connect", "[engine][template]") {
    EngineFixture f;
    REQUIRE(f.variables->set_global("host", "localhost:9000").has_value());
    REQUIRE(f.variables->set_global("user", "guest").has_value());
    REQUIRE(f.variables->set_context("prod", "host", "api.example.com").has_value());

    auto config = ConnectionConfig{}.with_endpoint("ws://$host/u/$user");

    SECTION("templating enabled with a context") {
        REQUIRE(f.engine->connect(config.with_url_templating(true).with_context("prod")).has_value());
        REQUIRE(f.transport->last_request().url == "ws://api.example.com/u/guest");
        REQUIRE(f.engine->current_url() == "ws://api.example.com/u/guest");
        REQUIRE(f.engine->active_context() == "prod");
    }

    SECTION("templating enabled without a context") {
        REQUIRE(f.engine->connect(config.with_url_templating(true)).has_value());
        REQUIRE(f.transport->last_request().url == "ws://localhost:9000/u/guest");
    }

    SECTION("templating disabled sends the URL verbatim") {
        REQUIRE(f.engine->connect(config).has_value());
        REQUIRE(f.transport->last_request().url == "ws://$host/u/$user");
    }
}

TEST_CASE("ConnectionEngine warns about unresolved URL variables", "[engine][template]") {
    EngineFixture f;

    auto config = ConnectionConfig{}
        .with_endpoint("ws://localhost/$missing")
        .with_url_templating(true);
    REQUIRE(f.engine->connect(config).has_value());

    REQUIRE(f.transport->last_request().url == "ws://localhost/$missing");
    REQUIRE(f.logger->contains(LogLevel::Warn, "missing"));
}

TEST_CASE("ConnectionEngine does not template header values", "[engine][template]") {
    EngineFixture f;
    REQUIRE(f.variables->set_global("token", "abc").has_value());

    auto config = echo_config()
        .with_header("Authorization", "Bearer $token")
        .with_url_templating(true);
    REQUIRE(f.engine->connect(config).has_value());

    REQUIRE(f.transport->last_request().headers[0].value == "Bearer $token");
}

TEST_CASE("ConnectionEngine snapshots the configuration on connect", "[engine][connect]") {
    EngineFixture f;

    auto config = echo_config().with_data_templating(false);
    REQUIRE(f.engine->connect(config).has_value());
    f.transport->emit_opened();

    // Later edits to the caller's copy do not reach the live connection
    config.with_data_templating(true);
    REQUIRE(f.variables->set_global("x", "1").has_value());
    REQUIRE(f.engine->send("$x").has_value());

    REQUIRE(f.transport->sent().back().payload == "$x");
}

// ═══════════════════════════════════════════════════════════════════════════
// Synchronous open failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine reports an invalid URL without retrying", "[engine][connect][error]") {
    EngineFixture f;
    f.transport->fail_open_with(TransportError::invalid_url("Unsupported scheme 'http'"));

    auto result = f.engine->connect(ConnectionConfig{}.with_endpoint("http://localhost"));

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::TransportError);
    REQUIRE(f.engine->state() == ConnectionState::Failed);
    REQUIRE(f.engine->last_error().find("Unsupported scheme") != std::string::npos);
    REQUIRE(f.engine->reconnect_timer_pending() == false);
    REQUIRE(f.recorded_schedules().empty());
}

TEST_CASE("ConnectionEngine retries a failed open", "[engine][connect][reconnect]") {
    EngineFixture f;
    f.transport->fail_open_with(TransportError::connect_failed("Connection refused"));

    auto result = f.engine->connect(echo_config());

    REQUIRE_FALSE(result.has_value());
    REQUIRE(f.engine->state() == ConnectionState::Failed);
    REQUIRE(f.recorded_schedules().size() == 1);

    f.transport->fail_open_with(std::nullopt);
    REQUIRE(eventually([&]() { return f.transport->open_count() == 2; }));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));
}

// ═══════════════════════════════════════════════════════════════════════════
// Sending
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine sends text and records it", "[engine][send]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->send("hello").has_value());

    const auto sent = f.transport->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].kind == FrameKind::Text);
    REQUIRE(sent[0].payload == "hello");

    auto message = f.channel->try_receive();
    REQUIRE(message.has_value());
    REQUIRE(message->direction == Direction::Outbound);
    REQUIRE(message->kind == FrameKind::Text);
    REQUIRE(message->payload == "hello");
}

TEST_CASE("ConnectionEngine renders data templates with the active context", "[engine][send][template]") {
    EngineFixture f;
    REQUIRE(f.variables->set_global("user", "guest").has_value());
    REQUIRE(f.variables->set_context("admin", "user", "root").has_value());

    f.open(echo_config().with_data_templating(true));

    REQUIRE(f.engine->send("{\"user\":\"$user\"}").has_value());
    REQUIRE(f.transport->sent().back().payload == "{\"user\":\"guest\"}");

    SECTION("context switch applies to the next message") {
        f.engine->set_active_context("admin");
        REQUIRE(f.engine->send("{\"user\":\"$user\"}").has_value());
        REQUIRE(f.transport->sent().back().payload == "{\"user\":\"root\"}");
    }

    SECTION("variable edits apply to the next message") {
        REQUIRE(f.variables->set_global("user", "alice").has_value());
        REQUIRE(f.engine->send("$user").has_value());
        REQUIRE(f.transport->sent().back().payload == "alice");
    }

    SECTION("recorded message carries the rendered text") {
        const auto messages = f.channel->drain();
        REQUIRE(messages.back().payload == "{\"user\":\"guest\"}");
    }
}

TEST_CASE("ConnectionEngine send failure drops the connection", "[engine][send][error]") {
    EngineFixture f;
    f.open();
    f.transport->fail_sends_with(TransportError::write_failed("Broken pipe"));

    auto result = f.engine->send("hello");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ErrorCode::TransportError);
    REQUIRE(f.engine->state() == ConnectionState::Failed);
    REQUIRE(f.transport->abort_count() == 1);
    REQUIRE(f.engine->last_error().find("Broken pipe") != std::string::npos);
    REQUIRE(f.channel->stats().emitted == 0);

    f.transport->fail_sends_with(std::nullopt);
    REQUIRE(eventually([&]() { return f.transport->open_count() == 2; }));
}

// ═══════════════════════════════════════════════════════════════════════════
// Receiving
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine records inbound frames in order", "[engine][receive]") {
    EngineFixture f;
    f.open();

    f.transport->emit_text("one");
    f.transport->emit(FrameReceived{FrameKind::Binary, std::string("\x01\x02", 2)});
    f.transport->emit_text("three");

    const auto messages = f.channel->drain();
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0].direction == Direction::Inbound);
    REQUIRE(messages[0].payload == "one");
    REQUIRE(messages[1].kind == FrameKind::Binary);
    REQUIRE(messages[1].payload.size() == 2);
    REQUIRE(messages[2].payload == "three");
}

TEST_CASE("ConnectionEngine interleaves sent and received messages", "[engine][receive]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->send("request").has_value());
    f.transport->emit_text("response");

    const auto messages = f.channel->drain();
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0].direction == Direction::Outbound);
    REQUIRE(messages[1].direction == Direction::Inbound);
}

TEST_CASE("ConnectionEngine ignores frames while connecting", "[engine][receive]") {
    EngineFixture f;
    REQUIRE(f.engine->connect(echo_config()).has_value());

    f.transport->emit_text("early");

    REQUIRE(f.channel->stats().emitted == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Ping / pong
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine manual ping and matching pong", "[engine][ping]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->ping().has_value());

    const auto sent = f.transport->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].kind == FrameKind::Ping);
    REQUIRE(sent[0].payload.empty() == false);

    auto ping_message = f.channel->try_receive();
    REQUIRE(ping_message.has_value());
    REQUIRE(ping_message->direction == Direction::Outbound);
    REQUIRE(ping_message->kind == FrameKind::Ping);

    std::this_thread::sleep_for(2ms);
    f.transport->emit_pong(sent[0].payload);

    auto pong = f.channel->try_receive();
    REQUIRE(pong.has_value());
    REQUIRE(pong->direction == Direction::Inbound);
    REQUIRE(pong->kind == FrameKind::Pong);
    REQUIRE(pong->round_trip.has_value());
    REQUIRE(pong->round_trip->count() >= 1'000);
}

TEST_CASE("ConnectionEngine records unsolicited pongs without a round trip", "[engine][ping]") {
    EngineFixture f;
    f.open();

    f.transport->emit_pong("heartbeat");

    auto pong = f.channel->try_receive();
    REQUIRE(pong.has_value());
    REQUIRE(pong->kind == FrameKind::Pong);
    REQUIRE(pong->payload == "heartbeat");
    REQUIRE(pong->round_trip.has_value() == false);
}

TEST_CASE("ConnectionEngine auto ping runs only while open", "[engine][ping]") {
    EngineFixture f;

    SECTION("disabled by default") {
        f.open();
        REQUIRE(f.engine->ping_timer_active() == false);
        std::this_thread::sleep_for(60ms);
        REQUIRE(f.transport->sent_count(FrameKind::Ping) == 0);
    }

    SECTION("enabled pings periodically until disconnect") {
        f.open(echo_config().with_auto_ping(true));
        REQUIRE(f.engine->ping_timer_active());
        REQUIRE(eventually([&]() { return f.transport->sent_count(FrameKind::Ping) >= 2; }));

        REQUIRE(f.engine->disconnect().has_value());
        REQUIRE(f.engine->ping_timer_active() == false);

        // Allow an in-flight tick to land
        std::this_thread::sleep_for(10ms);
        const auto pings = f.transport->sent_count(FrameKind::Ping);
        std::this_thread::sleep_for(60ms);
        REQUIRE(f.transport->sent_count(FrameKind::Ping) == pings);
    }

    SECTION("stops when the peer closes") {
        f.open(echo_config().with_auto_ping(true).with_auto_reconnect(false));
        f.transport->emit_closed(1001, "going away");
        REQUIRE(f.engine->ping_timer_active() == false);
    }
}

TEST_CASE("ConnectionEngine ignores stale ping timer firings", "[engine][ping]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->handle(command::PingTimerFired{999}).has_value());

    REQUIRE(f.transport->sent_count(FrameKind::Ping) == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Disconnecting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine graceful disconnect", "[engine][disconnect]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->disconnect().has_value());
    REQUIRE(f.engine->state() == ConnectionState::Closing);
    REQUIRE(f.transport->close_count() == 1);

    SECTION("frames arriving during the close handshake are still recorded") {
        f.transport->emit_text("last words");
        REQUIRE(f.channel->stats().emitted == 1);
    }

    f.transport->emit_closed(1000, "bye");

    REQUIRE(f.engine->state() == ConnectionState::Closed);
    REQUIRE(f.engine->reconnect_timer_pending() == false);

    const auto transitions = f.recorded_transitions();
    REQUIRE(transitions.back() == Transition{ConnectionState::Closing, ConnectionState::Closed});

    std::this_thread::sleep_for(30ms);
    REQUIRE(f.transport->open_count() == 1);
}

TEST_CASE("ConnectionEngine aborts when the close handshake times out", "[engine][disconnect]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->disconnect().has_value());
    REQUIRE(f.transport->abort_count() == 0);

    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Closed); }));
    REQUIRE(f.transport->abort_count() == 1);
    REQUIRE(f.logger->contains(LogLevel::Warn, "Close handshake did not finish"));
}

TEST_CASE("ConnectionEngine treats a failure while closing as closed", "[engine][disconnect]") {
    EngineFixture f;
    f.open();
    REQUIRE(f.engine->disconnect().has_value());

    f.transport->emit_failed(TransportError::read_failed("Connection reset"));

    REQUIRE(f.engine->state() == ConnectionState::Closed);
    REQUIRE(f.recorded_schedules().empty());
}

TEST_CASE("ConnectionEngine disconnect while connecting never reaches Open", "[engine][disconnect]") {
    EngineFixture f;
    REQUIRE(f.engine->connect(echo_config()).has_value());
    auto stale_handler = f.transport->current_handler();
    REQUIRE(stale_handler != nullptr);

    REQUIRE(f.engine->disconnect().has_value());

    REQUIRE(f.engine->state() == ConnectionState::Closed);
    REQUIRE(f.transport->abort_count() == 1);

    // The handshake completes after the cancel
    stale_handler(TransportOpened{});
    stale_handler(FrameReceived{FrameKind::Text, "late"});

    REQUIRE(f.engine->state() == ConnectionState::Closed);
    REQUIRE(f.channel->stats().emitted == 0);
    for (const auto& [old_state, new_state] : f.recorded_transitions()) {
        REQUIRE(new_state != ConnectionState::Open);
    }
}

TEST_CASE("ConnectionEngine disconnect while failed cancels the reconnect", "[engine][disconnect][reconnect]") {
    EngineFixture f(fast_engine_config(40ms));
    f.open();
    f.transport->emit_failed(TransportError::read_failed("Connection reset"));
    REQUIRE(f.engine->state() == ConnectionState::Failed);
    REQUIRE(f.engine->reconnect_timer_pending());

    REQUIRE(f.engine->disconnect().has_value());

    REQUIRE(f.engine->state() == ConnectionState::Closed);
    REQUIRE(f.engine->reconnect_timer_pending() == false);
    std::this_thread::sleep_for(100ms);
    REQUIRE(f.transport->open_count() == 1);
}

TEST_CASE("ConnectionEngine can reconnect after a manual disconnect", "[engine][disconnect]") {
    EngineFixture f;
    f.open();
    REQUIRE(f.engine->disconnect().has_value());
    f.transport->emit_closed();
    REQUIRE(f.engine->state() == ConnectionState::Closed);

    REQUIRE(f.engine->connect(echo_config()).has_value());
    REQUIRE(f.engine->state() == ConnectionState::Connecting);
    REQUIRE(f.transport->open_count() == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection loss and reconnect
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine reconnects after the peer closes", "[engine][reconnect]") {
    EngineFixture f;
    f.open();

    f.transport->emit_closed(1001, "going away");

    REQUIRE(f.engine->state() == ConnectionState::Failed);
    REQUIRE(f.engine->last_error().find("1001") != std::string::npos);
    REQUIRE(f.engine->last_error().find("going away") != std::string::npos);

    const auto schedules = f.recorded_schedules();
    REQUIRE(schedules.size() == 1);
    REQUIRE(schedules[0].attempt == 1);
    REQUIRE(schedules[0].delay == 10ms);

    REQUIRE(eventually([&]() { return f.transport->open_count() == 2; }));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));

    f.transport->emit_opened();
    REQUIRE(f.engine->state() == ConnectionState::Open);
    REQUIRE(f.engine->reconnect_attempts() == 0);
}

TEST_CASE("ConnectionEngine stays failed without auto reconnect", "[engine][reconnect]") {
    EngineFixture f;
    f.open(echo_config().with_auto_reconnect(false));

    f.transport->emit_failed(TransportError::read_failed("Connection reset"));

    REQUIRE(f.engine->state() == ConnectionState::Failed);
    REQUIRE(f.engine->reconnect_timer_pending() == false);
    std::this_thread::sleep_for(50ms);
    REQUIRE(f.transport->open_count() == 1);
}

TEST_CASE("ConnectionEngine gives up after the attempt limit", "[engine][reconnect]") {
    EngineConfig config = fast_engine_config();
    config.liveness.with_max_reconnect_attempts(2);
    EngineFixture f(std::move(config));
    f.open();

    f.transport->emit_failed(TransportError::read_failed("reset"));
    REQUIRE(eventually([&]() { return f.transport->open_count() == 2; }));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));

    f.transport->emit_failed(TransportError::connect_failed("refused"));
    REQUIRE(eventually([&]() { return f.transport->open_count() == 3; }));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));

    f.transport->emit_failed(TransportError::connect_failed("refused"));

    REQUIRE(f.engine->state() == ConnectionState::Failed);
    const std::vector<std::size_t> expected{2};
    REQUIRE(f.recorded_exhausted() == expected);
    REQUIRE(f.recorded_schedules().size() == 2);

    std::this_thread::sleep_for(50ms);
    REQUIRE(f.transport->open_count() == 3);
}

TEST_CASE("ConnectionEngine backoff resets after a successful open", "[engine][reconnect]") {
    EngineFixture f;
    f.open();

    f.transport->emit_failed(TransportError::read_failed("reset"));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));
    f.transport->emit_failed(TransportError::connect_failed("refused"));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));
    REQUIRE(f.engine->reconnect_attempts() == 2);

    f.transport->emit_opened();
    REQUIRE(f.engine->reconnect_attempts() == 0);

    f.transport->emit_failed(TransportError::read_failed("reset"));
    REQUIRE(f.recorded_schedules().back().attempt == 1);
}

TEST_CASE("ConnectionEngine drops events from a superseded attempt", "[engine][reconnect]") {
    EngineFixture f;
    REQUIRE(f.engine->connect(echo_config()).has_value());
    auto first_handler = f.transport->current_handler();

    f.transport->emit_failed(TransportError::connect_failed("refused"));
    REQUIRE(eventually([&]() { return f.transport->open_count() == 2; }));
    REQUIRE(eventually([&]() { return f.in_state(ConnectionState::Connecting); }));

    first_handler(TransportOpened{});
    first_handler(TransportClosed{1006, "abnormal"});

    REQUIRE(f.engine->state() == ConnectionState::Connecting);

    f.transport->emit_opened();
    REQUIRE(f.engine->state() == ConnectionState::Open);
}

TEST_CASE("ConnectionEngine manual connect while failed restarts the backoff", "[engine][reconnect]") {
    EngineFixture f(fast_engine_config(200ms));
    f.open();
    f.transport->emit_failed(TransportError::read_failed("reset"));
    REQUIRE(f.engine->reconnect_timer_pending());

    REQUIRE(f.engine->connect(echo_config()).has_value());

    REQUIRE(f.engine->state() == ConnectionState::Connecting);
    REQUIRE(f.engine->reconnect_timer_pending() == false);
    REQUIRE(f.engine->reconnect_attempts() == 0);
    REQUIRE(f.transport->open_count() == 2);

    // The cancelled timer must not start a third attempt
    std::this_thread::sleep_for(300ms);
    REQUIRE(f.transport->open_count() == 2);
}

TEST_CASE("ConnectionEngine ignores stale reconnect firings", "[engine][reconnect]") {
    EngineFixture f;
    f.open();

    REQUIRE(f.engine->handle(command::ReconnectTimerFired{12345}).has_value());
    REQUIRE(f.engine->handle(command::CloseDeadlineExpired{12345}).has_value());

    REQUIRE(f.engine->state() == ConnectionState::Open);
    REQUIRE(f.transport->open_count() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine shutdown returns to idle from any state", "[engine][shutdown]") {
    EngineFixture f;

    SECTION("from open") {
        f.open(echo_config().with_auto_ping(true));
        f.engine->shutdown();
        REQUIRE(f.transport->abort_count() == 1);
        REQUIRE(f.engine->ping_timer_active() == false);
    }

    SECTION("from failed with a reconnect pending") {
        f.open();
        f.transport->emit_failed(TransportError::read_failed("reset"));
        f.engine->shutdown();
        REQUIRE(f.engine->reconnect_timer_pending() == false);
    }

    SECTION("from idle") {
        f.engine->shutdown();
        REQUIRE(f.recorded_transitions().empty());
    }

    REQUIRE(f.engine->state() == ConnectionState::Idle);
}

TEST_CASE("ConnectionEngine state callbacks may call back into the engine", "[engine][callbacks]") {
    EngineFixture f;
    std::atomic<bool> observed_open{false};

    f.engine->on_state_change([&](ConnectionState, ConnectionState new_state) {
        if (new_state == ConnectionState::Open) {
            observed_open = (f.engine->state() == ConnectionState::Open);
        }
    });

    f.open();
    REQUIRE(observed_open.load());
}

TEST_CASE("ConnectionEngine delivers state changes in transition order across threads",
          "[engine][callbacks][concurrency]") {
    EngineFixture f;
    std::promise<void> entered;
    std::promise<void> release;
    auto release_signal = release.get_future().share();

    f.engine->on_state_change([&entered, release_signal](ConnectionState, ConnectionState new_state) {
        if (new_state == ConnectionState::Connecting) {
            entered.set_value();
            release_signal.wait_for(2s);
        }
    });

    std::thread connecting([&f]() {
        (void)f.engine->connect(echo_config());
    });
    REQUIRE(entered.get_future().wait_for(2s) == std::future_status::ready);

    // The connecting thread is still inside its callback, so the Open change
    // queues behind it instead of overtaking it
    f.transport->emit_opened();
    REQUIRE(f.engine->state() == ConnectionState::Open);
    REQUIRE(f.recorded_transitions().size() == 1);

    release.set_value();
    connecting.join();

    const std::vector<Transition> expected{
        {ConnectionState::Idle, ConnectionState::Connecting},
        {ConnectionState::Connecting, ConnectionState::Open},
    };
    REQUIRE(f.recorded_transitions() == expected);
}

// ═══════════════════════════════════════════════════════════════════════════
// Destruction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ConnectionEngine can be destroyed while its timers are firing", "[engine][shutdown][concurrency]") {
    ScopedTestLogger logger;
    IoRunner io;
    auto variables = std::make_shared<VariableStore>();
    auto channel = std::make_shared<MessageChannel>();

    LivenessConfig liveness;
    liveness.with_ping_interval(1ms).with_reconnect_delays(1ms, 10ms);

    for (int i = 0; i < 200; ++i) {
        EngineConfig config;
        config.with_liveness(liveness).with_close_timeout(1ms);

        auto mock = std::make_unique<MockWebSocketTransport>();
        MockWebSocketTransport* transport = mock.get();
        auto engine = std::make_unique<ConnectionEngine>(
            io.executor(), variables, std::move(mock), channel, std::move(config));

        REQUIRE(engine->connect(echo_config().with_auto_ping(true)).has_value());
        transport->emit_opened();
        if (i % 2 == 0) {
            (void)engine->disconnect();
        }
        std::this_thread::sleep_for(std::chrono::microseconds(200 * (i % 5)));

        engine.reset();
    }

    SUCCEED();
}

TEST_CASE("ConnectionEngine drops transport events that arrive after destruction", "[engine][shutdown]") {
    EngineFixture f;
    f.open();
    std::size_t callbacks_after_reset = 0;

    auto handler = f.transport->current_handler();
    REQUIRE(handler);

    f.engine->on_state_change([&callbacks_after_reset](ConnectionState, ConnectionState) {
        ++callbacks_after_reset;
    });
    f.engine.reset();
    f.transport = nullptr;
    callbacks_after_reset = 0;

    handler(TransportFailed{TransportError::read_failed("late")});
    handler(TransportClosed{1000, "late"});

    REQUIRE(callbacks_after_reset == 0);
}
