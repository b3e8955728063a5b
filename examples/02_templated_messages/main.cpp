// Example 02: Templated URLs and Messages
//
// Demonstrates variables with global and per-context scopes, the template
// resolver on its own, and an engine that renders the URL and every outgoing
// message against the active context. Logs go to the console and to
// wscls_example.log.
//
// Usage: 02_templated_messages [host:port]

#include <wscls/connection/connection_engine.hpp>
#include <wscls/log/spdlog_logger.hpp>
#include <wscls/template/template_resolver.hpp>
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

int main(int argc, char* argv[]) {
    std::cout << "=== Templated Messages Example ===\n\n";

    set_logger(make_spdlog_console_file_logger("wscls_example.log", LogLevel::Debug));

    // 1. Variables: globals apply everywhere, contexts override them
    auto variables = std::make_shared<VariableStore>();
    const std::string local_host = (argc > 1) ? argv[1] : "localhost:9000";

    auto ok = variables->set_global("host", local_host)
        .and_then([&]() { return variables->set_global("user", "guest"); })
        .and_then([&]() { return variables->set_context("alice", "user", "alice"); })
        .and_then([&]() { return variables->set_context("alice", "greeting", "hi from ${user}"); });
    if (!ok) {
        std::cerr << "ERROR: " << ok.error().message << "\n";
        return 1;
    }

    // 2. Render a few templates directly
    TemplateResolver resolver(*variables);
    std::cout << "Global:  " << resolver.render("ws://$host/u/$user") << "\n";
    std::cout << "alice:   " << resolver.render("ws://$host/u/$user", "alice") << "\n";
    std::cout << "Escaped: " << resolver.render("costs $$5") << "\n";

    auto detailed = resolver.render_detailed("$greeting to $nobody");
    std::cout << "Partial: " << detailed.text << " (unresolved:";
    for (const auto& name : detailed.unresolved) {
        std::cout << " " << name;
    }
    std::cout << ")\n\n";

    // 3. Engine with URL and data templating
    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread io_thread([&io]() { io.run(); });

    auto channel = std::make_shared<MessageChannel>();
    auto engine = std::make_unique<ConnectionEngine>(
        io.get_executor(), variables, std::make_unique<BeastWebSocketTransport>(), channel);

    auto config = ConnectionConfig{}
        .with_endpoint("ws://$host/echo?user=$user")
        .with_url_templating(true)
        .with_data_templating(true)
        .with_auto_reconnect(false)
        .with_context("alice");

    auto connected = engine->connect(config);
    if (!connected) {
        std::cerr << "ERROR: " << connected.error().message << "\n";
    } else {
        std::cout << "Connecting to " << engine->current_url() << "...\n";

        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while ((engine->state() == ConnectionState::Connecting) &&
               (std::chrono::steady_clock::now() < deadline)) {
            std::this_thread::sleep_for(10ms);
        }

        if (engine->state() == ConnectionState::Open) {
            // Same template, two contexts
            auto sent = engine->send("$greeting");
            engine->set_active_context(std::nullopt);
            if (sent) {
                sent = engine->send("hello as $user");
            }
            if (!sent) {
                std::cerr << "ERROR: " << sent.error().message << "\n";
            }
            std::this_thread::sleep_for(500ms);
            auto closed = engine->disconnect();
            if (!closed) {
                std::cerr << "ERROR: " << closed.error().message << "\n";
            }
            std::this_thread::sleep_for(200ms);
        } else {
            std::cerr << "ERROR: Could not connect: " << engine->last_error() << "\n";
        }
    }

    std::cout << "\n=== Messages ===\n";
    for (const auto& message : channel->drain()) {
        std::cout << "  [" << to_string(message.direction) << " " << to_string(message.kind) << "] "
                  << message.payload << "\n";
    }

    engine.reset();
    work.reset();
    io_thread.join();
    set_logger(nullptr);

    std::cout << "\nDone.\n";
    return 0;
}
