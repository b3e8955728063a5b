// Example 01: Basic WebSocket Session
//
// Connects to an echo server, sends a few messages and a ping, then prints
// everything the connection recorded.
//
// Usage: 01_basic_session [ws://localhost:9000/echo]

#include <wscls/connection/connection_engine.hpp>
#include <wscls/transport/beast_transport.hpp>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace wscls;
using namespace std::chrono_literals;

namespace {

bool wait_for_state(const ConnectionEngine& engine, ConnectionState wanted,
                    std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (engine.state() == wanted) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return engine.state() == wanted;
}

void print(const Message& message) {
    std::cout << "  [" << to_string(message.direction) << " " << to_string(message.kind) << "] ";
    if (message.kind == FrameKind::Pong && message.round_trip) {
        std::cout << "RTT " << message.round_trip->count() << " us";
    } else {
        std::cout << message.payload;
    }
    std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== Basic WebSocket Session Example ===\n\n";

    const std::string url = (argc > 1) ? argv[1] : "ws://localhost:9000/echo";

    // 1. Timers run on an io_context thread
    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread io_thread([&io]() { io.run(); });

    // 2. Create the engine
    auto variables = std::make_shared<VariableStore>();
    auto channel = std::make_shared<MessageChannel>();

    auto engine = std::make_unique<ConnectionEngine>(
        io.get_executor(), variables, std::make_unique<BeastWebSocketTransport>(), channel);

    engine->on_state_change([](ConnectionState old_state, ConnectionState new_state) {
        std::cout << "State: " << to_string(old_state) << " -> " << to_string(new_state) << "\n";
    });

    // 3. Connect
    std::cout << "Connecting to " << url << "...\n";
    auto config = ConnectionConfig{}
        .with_endpoint(url)
        .with_auto_reconnect(false);

    int exit_code = 0;
    auto connected = engine->connect(config);
    if (!connected) {
        std::cerr << "ERROR: " << connected.error().message << "\n";
        exit_code = 1;
    } else if (wait_for_state(*engine, ConnectionState::Open, 5s) == false) {
        std::cerr << "ERROR: Could not connect: " << engine->last_error() << "\n";
        exit_code = 1;
    } else {
        // 4. Send a few messages and a ping
        for (const char* text : {"hello", "from", "wscls"}) {
            auto sent = engine->send(text);
            if (!sent) {
                std::cerr << "ERROR: " << sent.error().message << "\n";
            }
        }
        auto pinged = engine->ping();
        if (!pinged) {
            std::cerr << "ERROR: " << pinged.error().message << "\n";
        }

        // Give the echoes time to arrive
        std::this_thread::sleep_for(500ms);

        // 5. Close gracefully
        auto closed = engine->disconnect();
        if (!closed) {
            std::cerr << "ERROR: " << closed.error().message << "\n";
        }
        wait_for_state(*engine, ConnectionState::Closed, 6s);
    }

    // 6. Everything that crossed the connection, in order
    std::cout << "\n=== Messages ===\n";
    for (const auto& message : channel->drain()) {
        print(message);
    }

    engine.reset();
    work.reset();
    io_thread.join();

    std::cout << "\nDone.\n";
    return exit_code;
}
