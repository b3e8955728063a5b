// ─────────────────────────────────────────────────────────────────────────────
// wscls-cli - Interactive WebSocket Client
// ─────────────────────────────────────────────────────────────────────────────
// Connects to a WebSocket endpoint, sends what you type and prints every frame
// that crosses the connection.
//
// Usage:
//   wscls-cli --url ws://localhost:9000/echo
//   wscls-cli --profile prod --context prod --template-url
//   wscls-cli --url 'wss://$host/feed' --template-url \
//             --header 'Authorization: Bearer $token' --auto-ping
//
// In the REPL, plain lines are sent as text frames and commands start with
// '/'. Type /help for the list.
//
// Profiles, variables and the active context live in ~/.wscls.json (or the
// file given with --config) and are saved on exit.

#include <cxxopts.hpp>

#include "wscls/config/profile_store.hpp"
#include "wscls/connection/connection_engine.hpp"
#include "wscls/log/spdlog_logger.hpp"
#include "wscls/transport/beast_transport.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace wscls;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* blue    = "\033[34m";
    const char* magenta = "\033[35m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════
// The printer thread and the REPL both write to the terminal.

std::mutex output_mutex;

void print_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_status(const char* code, const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << color::c(code) << msg << color::c(color::reset) << "\n";
}

void print_message(const Message& message) {
    std::ostringstream line;

    switch (message.kind) {
        case FrameKind::Text:
            if (message.direction == Direction::Outbound) {
                line << color::c(color::blue) << "Sent: " << color::c(color::reset) << message.payload;
            } else {
                line << color::c(color::magenta) << "Received: " << color::c(color::reset) << message.payload;
            }
            break;

        case FrameKind::Binary:
            line << color::c(color::magenta)
                 << (message.direction == Direction::Outbound ? "Sent: " : "Received: ")
                 << color::c(color::reset) << color::c(color::dim)
                 << "[binary, " << message.payload.size() << " bytes]" << color::c(color::reset);
            break;

        case FrameKind::Ping:
            line << color::c(color::dim) << "Ping sent" << color::c(color::reset);
            break;

        case FrameKind::Pong:
            line << color::c(color::dim) << "Pong received";
            if (message.round_trip.has_value()) {
                const double ms = static_cast<double>(message.round_trip->count()) / 1000.0;
                line << ", RTT: " << ms << " ms";
            }
            line << color::c(color::reset);
            break;
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line.str() << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Parse header string "Name: Value" into pair
std::pair<std::string, std::string> parse_header(const std::string& header) {
    auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    // Trim leading whitespace from value
    auto start = value.find_first_not_of(" \t");
    if (start != std::string::npos) {
        value = value.substr(start);
    } else {
        value.clear();
    }
    return {name, value};
}

std::string trim(const std::string& text) {
    const auto start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

std::string rest_of(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    return trim(rest);
}

// ═══════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════
// Everything the REPL works on: the loaded workspace, the engine and the
// threads that drive timers and print traffic.

class CliSession {
public:
    CliSession(Workspace& workspace, EngineConfig config)
        : workspace_(workspace)
        , channel_(std::make_shared<MessageChannel>())
        , work_(asio::make_work_guard(io_))
    {
        io_thread_ = std::thread([this]() { io_.run(); });

        engine_ = std::make_unique<ConnectionEngine>(
            io_.get_executor(),
            workspace_.variables,
            std::make_unique<BeastWebSocketTransport>(),
            channel_,
            std::move(config)
        );
        engine_->set_active_context(workspace_.active_context);

        // engine_ is already null while the engine drains its last callbacks
        engine_->on_state_change([engine = engine_.get()](ConnectionState, ConnectionState new_state) {
            report_state(*engine, new_state);
        });
        engine_->on_reconnect_scheduled([](const ReconnectSchedule& schedule) {
            print_status(color::yellow, "Reconnecting in " + std::to_string(schedule.delay.count()) +
                                        " ms (attempt " + std::to_string(schedule.attempt) + ")");
        });
        engine_->on_reconnect_exhausted([](std::size_t attempts) {
            print_status(color::red, "Giving up after " + std::to_string(attempts) + " reconnect attempt(s)");
        });

        printer_ = std::thread([this]() { print_loop(); });
    }

    ~CliSession() {
        engine_->shutdown();
        engine_.reset();
        channel_->close();
        if (printer_.joinable()) {
            printer_.join();
        }
        work_.reset();
        io_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    CliSession(const CliSession&) = delete;
    CliSession& operator=(const CliSession&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Commands
    // ─────────────────────────────────────────────────────────────────────────

    void connect(const std::string& url_override) {
        auto& profile = workspace_.profiles.selected();
        if (url_override.empty() == false) {
            profile.connection.endpoint = url_override;
        }
        if (profile.connection.endpoint.empty()) {
            print_error("No URL set. Use /connect <url> or --url");
            return;
        }

        auto config = profile.connection;
        config.with_context(workspace_.active_context);

        auto result = engine_->connect(std::move(config));
        if (result.has_value() == false) {
            print_error(result.error().message);
        }
    }

    void disconnect() {
        auto result = engine_->disconnect();
        if (result.has_value() == false) {
            print_error(result.error().message);
        }
    }

    void ping() {
        auto result = engine_->ping();
        if (result.has_value() == false) {
            print_error(result.error().message);
        }
    }

    void send(const std::string& text) {
        workspace_.profiles.selected().draft_text = text;
        auto result = engine_->send(text);
        if (result.has_value() == false) {
            print_error(result.error().message);
        }
    }

    void show_state() {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << color::c(color::bold) << "State:    " << color::c(color::reset)
                  << to_string(engine_->state()) << "\n";
        std::cout << color::c(color::bold) << "Profile:  " << color::c(color::reset)
                  << workspace_.profiles.selected_name() << "\n";
        std::cout << color::c(color::bold) << "URL:      " << color::c(color::reset)
                  << workspace_.profiles.selected().connection.endpoint << "\n";

        const auto current = engine_->current_url();
        if (current.empty() == false) {
            std::cout << color::c(color::bold) << "Resolved: " << color::c(color::reset) << current << "\n";
        }
        std::cout << color::c(color::bold) << "Context:  " << color::c(color::reset)
                  << workspace_.active_context.value_or("(global)") << "\n";

        const auto error = engine_->last_error();
        if (error.empty() == false) {
            std::cout << color::c(color::bold) << "Error:    " << color::c(color::reset) << error << "\n";
        }
        const auto attempts = engine_->reconnect_attempts();
        if (attempts > 0) {
            std::cout << color::c(color::bold) << "Retries:  " << color::c(color::reset) << attempts << "\n";
        }
    }

    void set_global(const std::string& name, const std::string& value) {
        auto result = workspace_.variables->set_global(name, value);
        if (result.has_value() == false) {
            print_error(result.error().message);
            return;
        }
        print_success(name + " = " + value);
    }

    void set_context(const std::string& context, const std::string& name, const std::string& value) {
        auto result = workspace_.variables->set_context(context, name, value);
        if (result.has_value() == false) {
            print_error(result.error().message);
            return;
        }
        print_success("[" + context + "] " + name + " = " + value);
    }

    void delete_context(const std::string& context) {
        if (workspace_.variables->delete_context(context) == false) {
            print_error("No context named '" + context + "'");
            return;
        }
        if (workspace_.active_context == context) {
            use_context(std::nullopt);
        }
        print_success("Deleted context " + context);
    }

    void use_context(std::optional<std::string> context) {
        workspace_.active_context = context;
        engine_->set_active_context(context);
        print_success("Active context: " + context.value_or("(global)"));
    }

    void show_variables() {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "\n" << color::c(color::bold) << "Global:" << color::c(color::reset) << "\n";
        for (const auto& [name, value] : workspace_.variables->globals()) {
            std::cout << "  " << color::c(color::yellow) << name << color::c(color::reset) << " = " << value << "\n";
        }
        for (const auto& context : workspace_.variables->context_names()) {
            const bool active = (workspace_.active_context == context);
            std::cout << "\n" << color::c(color::bold) << context << (active ? " (active)" : "") << ":"
                      << color::c(color::reset) << "\n";
            const auto mapping = workspace_.variables->context(context);
            if (mapping.has_value() == false) {
                continue;
            }
            for (const auto& [name, value] : *mapping) {
                std::cout << "  " << color::c(color::yellow) << name << color::c(color::reset) << " = " << value << "\n";
            }
        }
        std::cout << "\n";
    }

private:
    static void report_state(const ConnectionEngine& engine, ConnectionState new_state) {
        switch (new_state) {
            case ConnectionState::Open:
                print_status(color::green, "Connected to " + engine.current_url());
                break;
            case ConnectionState::Closed:
                print_status(color::dim, "Disconnected");
                break;
            case ConnectionState::Failed:
                print_status(color::red, "Connection failed: " + engine.last_error());
                break;
            case ConnectionState::Connecting:
                print_status(color::dim, "Connecting to " + engine.current_url() + "...");
                break;
            case ConnectionState::Idle:
            case ConnectionState::Closing:
                break;
        }
    }

    void print_loop() {
        for (;;) {
            auto message = channel_->receive_for(std::chrono::milliseconds{200});
            if (message.has_value()) {
                print_message(*message);
                continue;
            }
            if (channel_->is_closed()) {
                return;
            }
        }
    }

    Workspace& workspace_;
    std::shared_ptr<MessageChannel> channel_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread io_thread_;
    std::thread printer_;

    std::unique_ptr<ConnectionEngine> engine_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Interactive REPL
// ═══════════════════════════════════════════════════════════════════════════

void print_repl_help() {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "\n" << color::c(color::bold) << "Available commands:" << color::c(color::reset) << "\n";
    std::cout << "  " << color::c(color::yellow) << "<text>" << color::c(color::reset) << "                    - Send a text frame\n";
    std::cout << "  " << color::c(color::yellow) << "/connect [url]" << color::c(color::reset) << "            - Connect (optionally to a new URL)\n";
    std::cout << "  " << color::c(color::yellow) << "/disconnect" << color::c(color::reset) << "               - Close the connection\n";
    std::cout << "  " << color::c(color::yellow) << "/ping" << color::c(color::reset) << "                     - Send a ping\n";
    std::cout << "  " << color::c(color::yellow) << "/state" << color::c(color::reset) << "                    - Show connection state\n";
    std::cout << "  " << color::c(color::yellow) << "/set NAME VALUE" << color::c(color::reset) << "           - Set a global variable\n";
    std::cout << "  " << color::c(color::yellow) << "/setctx CTX NAME VALUE" << color::c(color::reset) << "    - Set a variable in a context\n";
    std::cout << "  " << color::c(color::yellow) << "/delctx CTX" << color::c(color::reset) << "               - Delete a context\n";
    std::cout << "  " << color::c(color::yellow) << "/use [CTX]" << color::c(color::reset) << "                - Switch context (none = global)\n";
    std::cout << "  " << color::c(color::yellow) << "/vars" << color::c(color::reset) << "                     - List variables\n";
    std::cout << "  " << color::c(color::yellow) << "/help" << color::c(color::reset) << "                     - Show this help\n";
    std::cout << "  " << color::c(color::yellow) << "/quit" << color::c(color::reset) << "                     - Exit\n\n";
}

void run_repl(CliSession& session) {
    print_status(color::dim, "Type /help for available commands, /quit to exit.");

    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << color::c(color::cyan) << "wscls> " << color::c(color::reset) << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() != '/') {
            session.send(line);
            continue;
        }

        // Parse command
        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "/quit" || cmd == "/exit" || cmd == "/q") {
            break;
        } else if (cmd == "/help" || cmd == "/?") {
            print_repl_help();
        } else if (cmd == "/connect") {
            session.connect(rest_of(iss));
        } else if (cmd == "/disconnect") {
            session.disconnect();
        } else if (cmd == "/ping") {
            session.ping();
        } else if (cmd == "/state") {
            session.show_state();
        } else if (cmd == "/set") {
            std::string name;
            iss >> name;
            if (name.empty()) {
                print_error("Usage: /set NAME VALUE");
                continue;
            }
            session.set_global(name, rest_of(iss));
        } else if (cmd == "/setctx") {
            std::string context;
            std::string name;
            iss >> context >> name;
            if (context.empty() || name.empty()) {
                print_error("Usage: /setctx CTX NAME VALUE");
                continue;
            }
            session.set_context(context, name, rest_of(iss));
        } else if (cmd == "/delctx") {
            std::string context;
            iss >> context;
            if (context.empty()) {
                print_error("Usage: /delctx CTX");
                continue;
            }
            session.delete_context(context);
        } else if (cmd == "/use") {
            std::string context;
            iss >> context;
            session.use_context(context.empty() ? std::nullopt : std::optional<std::string>(context));
        } else if (cmd == "/vars") {
            session.show_variables();
        } else {
            print_error("Unknown command: " + cmd + ". Type /help for available commands.");
        }
    }

    print_status(color::dim, "Goodbye!");
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("wscls-cli", "Interactive WebSocket client");

    options.add_options()
        // Profile file
        ("c,config", "Profile file (default: ~/.wscls.json)", cxxopts::value<std::string>())
        ("p,profile", "Profile to use (created if missing)", cxxopts::value<std::string>())

        // Connection overrides
        ("u,url", "WebSocket URL (ws:// or wss://)", cxxopts::value<std::string>())
        ("H,header", "Handshake header (can be repeated, format: 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("no-ssl-verify", "Do not verify the server certificate")
        ("auto-ping", "Ping periodically while connected")
        ("no-reconnect", "Do not reconnect after the connection drops")
        ("ping-interval", "Auto-ping interval in seconds", cxxopts::value<int>()->default_value("20"))

        // Templating
        ("context", "Variable context for templates", cxxopts::value<std::string>())
        ("template-url", "Substitute $variables in the URL")
        ("template-data", "Substitute $variables in sent messages")

        // Output options
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write logs to this file instead of stderr", cxxopts::value<std::string>())
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    wscls-cli --url ws://localhost:9000/echo\n";
            std::cout << "    wscls-cli --url 'wss://$host/feed' --template-url --context prod\n";
            std::cout << "    wscls-cli --profile staging --auto-ping --ping-interval 10\n";
            return 0;
        }

        // Setup
        color::enabled = !result.count("no-color");

        const LogLevel level = parse_log_level(result["log-level"].as<std::string>());
        if (result.count("log-file")) {
            set_logger(make_spdlog_async_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_console_logger(level));
        }

        // Workspace
        const std::filesystem::path profile_path = result.count("config")
            ? std::filesystem::path(result["config"].as<std::string>())
            : default_profile_path();

        Workspace workspace;
        auto loaded = load_workspace(profile_path, workspace);
        if (!loaded) {
            print_error(loaded.error().message);
            return 1;
        }

        if (result.count("profile")) {
            const auto name = result["profile"].as<std::string>();
            if (workspace.profiles.contains(name) == false) {
                auto added = workspace.profiles.add(name);
                if (!added) {
                    print_error(added.error().message);
                    return 1;
                }
            }
            auto selected = workspace.profiles.select(name);
            if (!selected) {
                print_error(selected.error().message);
                return 1;
            }
        }

        // Command-line overrides go into the selected profile and are saved
        auto& connection = workspace.profiles.selected().connection;
        if (result.count("url")) {
            connection.endpoint = result["url"].as<std::string>();
        }
        auto headers = result["header"].as<std::vector<std::string>>();
        for (const auto& header : headers) {
            if (!header.empty()) {
                auto [name, value] = parse_header(header);
                connection.set_header(name, value);
            }
        }
        if (result.count("no-ssl-verify")) {
            connection.with_ssl_verify(false);
        }
        if (result.count("auto-ping")) {
            connection.with_auto_ping(true);
        }
        if (result.count("no-reconnect")) {
            connection.with_auto_reconnect(false);
        }
        if (result.count("template-url")) {
            connection.with_url_templating(true);
        }
        if (result.count("template-data")) {
            connection.with_data_templating(true);
        }
        if (result.count("context")) {
            workspace.active_context = result["context"].as<std::string>();
        }

        const int ping_seconds = result["ping-interval"].as<int>();
        if (ping_seconds <= 0) {
            print_error("--ping-interval must be positive");
            return 1;
        }

        LivenessConfig liveness;
        liveness.with_ping_interval(std::chrono::seconds{ping_seconds});

        EngineConfig engine_config;
        engine_config.with_liveness(std::move(liveness));

        {
            CliSession session(workspace, std::move(engine_config));
            print_status(color::bold, "wscls - profile '" + workspace.profiles.selected_name() + "'");
            if (connection.endpoint.empty() == false) {
                print_status(color::dim, "URL: " + connection.endpoint + " (use /connect)");
            }
            run_repl(session);
        }

        auto saved = save_workspace(profile_path, workspace);
        if (!saved) {
            print_error(saved.error().message);
            set_logger(nullptr);
            return 1;
        }

        set_logger(nullptr);
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
