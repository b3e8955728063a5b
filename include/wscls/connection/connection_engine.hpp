#pragma once

#include "wscls/channel/message_channel.hpp"
#include "wscls/connection/command.hpp"
#include "wscls/connection/connection_config.hpp"
#include "wscls/connection/connection_state.hpp"
#include "wscls/error.hpp"
#include "wscls/liveness/liveness_scheduler.hpp"
#include "wscls/template/template_resolver.hpp"
#include "wscls/transport/websocket_transport.hpp"
#include "wscls/variables/variable_store.hpp"

#include <asio/any_io_executor.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wscls {

// ═══════════════════════════════════════════════════════════════════════════
// ConnectionEngine
// ═══════════════════════════════════════════════════════════════════════════
// Owns the lifecycle of one logical WebSocket connection.
//
// Operator commands, timer firings and transport events all go through
// handle(), which runs the whole transition under one mutex. State-change
// callbacks are collected during the transition and invoked after the lock
// is released, so they may call back into the engine.
//
// Callbacks are delivered one at a time, in transition order. If another
// thread is already delivering, a transition's callbacks are queued behind
// the current ones and run on that thread, so handle() may return before
// its own callbacks have fired.
//
// Usage:
//   asio::io_context io;
//   auto variables = std::make_shared<VariableStore>();
//   auto channel = std::make_shared<MessageChannel>();
//   ConnectionEngine engine(io.get_executor(), variables,
//                           std::make_unique<BeastWebSocketTransport>(), channel);
//
//   engine.on_state_change([](ConnectionState old_state, ConnectionState new_state) {
//       std::cout << to_string(old_state) << " -> " << to_string(new_state) << "\n";
//   });
//
//   auto result = engine.connect(ConnectionConfig{}.with_endpoint("wss://echo.example"));
//   // ... io.run() on some thread drives the timers ...
//   result = engine.send("hello");
//
// The executor must keep running for timers to fire, and must outlive the
// engine. Destroying the engine waits for timer and transport callbacks
// already inside it, drops any later ones, aborts the transport and resets
// to Idle. It must not be destroyed from inside one of its own callbacks.

class ConnectionEngine {
public:
    using StateChangeCallback = std::function<void(ConnectionState old_state, ConnectionState new_state)>;
    using ReconnectScheduledCallback = std::function<void(const ReconnectSchedule& schedule)>;
    using ReconnectExhaustedCallback = std::function<void(std::size_t attempts)>;

    ConnectionEngine(
        asio::any_io_executor executor,
        std::shared_ptr<VariableStore> variables,
        std::unique_ptr<IWebSocketTransport> transport,
        std::shared_ptr<MessageChannel> channel,
        EngineConfig config = {}
    );

    ~ConnectionEngine();

    ConnectionEngine(const ConnectionEngine&) = delete;
    ConnectionEngine& operator=(const ConnectionEngine&) = delete;
    ConnectionEngine(ConnectionEngine&&) = delete;
    ConnectionEngine& operator=(ConnectionEngine&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Commands
    // ─────────────────────────────────────────────────────────────────────────

    /// The single transition function. Thread-safe.
    [[nodiscard]] Result<void> handle(Command command);

    [[nodiscard]] Result<void> connect(ConnectionConfig config);
    [[nodiscard]] Result<void> send(std::string text);
    [[nodiscard]] Result<void> ping();
    [[nodiscard]] Result<void> disconnect();

    /// Abort everything and return to Idle. Always succeeds.
    void shutdown();

    /// Context for template lookups; read each time a message is sent.
    void set_active_context(std::optional<std::string> context);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries (Thread-Safe)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] std::optional<std::string> active_context() const;

    /// URL of the current or most recent attempt, after templating
    [[nodiscard]] std::string current_url() const;

    /// Reconnects scheduled since the last successful open or manual connect
    [[nodiscard]] std::size_t reconnect_attempts() const;

    [[nodiscard]] bool ping_timer_active() const;
    [[nodiscard]] bool reconnect_timer_pending() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Callbacks
    // ─────────────────────────────────────────────────────────────────────────

    void on_state_change(StateChangeCallback callback);
    void on_reconnect_scheduled(ReconnectScheduledCallback callback);
    void on_reconnect_exhausted(ReconnectExhaustedCallback callback);

private:
    /// Side effects of one transition, fired after the lock is released
    struct Effects {
        std::vector<std::pair<ConnectionState, ConnectionState>> changes;
        std::optional<ReconnectSchedule> reconnect;
        std::optional<std::size_t> exhausted_after;
    };

    // One overload per command; all called with mutex_ held
    Result<void> apply(command::Connect& cmd, Effects& effects);
    Result<void> apply(command::Send& cmd, Effects& effects);
    Result<void> apply(command::Ping& cmd, Effects& effects);
    Result<void> apply(command::Disconnect& cmd, Effects& effects);
    Result<void> apply(command::PingTimerFired& cmd, Effects& effects);
    Result<void> apply(command::ReconnectTimerFired& cmd, Effects& effects);
    Result<void> apply(command::CloseDeadlineExpired& cmd, Effects& effects);
    Result<void> apply(command::TransportNotification& cmd, Effects& effects);

    Result<void> start_attempt_locked(Effects& effects);
    Result<void> send_ping_locked(Effects& effects);
    void on_pong_locked(std::string payload);
    void connection_lost_locked(std::string reason, bool allow_reconnect, Effects& effects);
    void schedule_reconnect_locked(Effects& effects);
    void finish_close_locked(Effects& effects);
    void reset_timers_locked();
    void set_state_locked(ConnectionState new_state, Effects& effects);

    struct Lifetime;

    /// Entry point for timers and the transport, which have nobody to
    /// return a result to.
    void notify(Command command);

    /// Timer and transport callbacks go through here; a no-op once the
    /// engine has started destruction.
    static void notify_guarded(const std::shared_ptr<Lifetime>& lifetime,
                               ConnectionEngine* engine, Command command);

    void enqueue_locked(Effects effects);
    void deliver_pending();

    std::shared_ptr<VariableStore> variables_;
    TemplateResolver resolver_;
    std::shared_ptr<MessageChannel> channel_;
    EngineConfig config_;
    LivenessScheduler scheduler_;

    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Idle};
    std::optional<ConnectionConfig> snapshot_;
    std::optional<std::string> active_context_;
    std::string current_url_;
    std::string last_error_;

    // 0 = no transport attempt outstanding
    std::uint64_t next_attempt_{0};
    std::uint64_t current_attempt_{0};

    // 0 = timer not armed
    std::uint64_t ping_generation_{0};
    std::uint64_t reconnect_generation_{0};
    std::uint64_t close_generation_{0};

    // Payloads of pings sent by this engine that have not been answered
    std::deque<std::string> outstanding_pings_;

    std::vector<StateChangeCallback> state_change_callbacks_;
    std::vector<ReconnectScheduledCallback> reconnect_scheduled_callbacks_;
    std::vector<ReconnectExhaustedCallback> reconnect_exhausted_callbacks_;

    // Effects of finished transitions not yet delivered, oldest first
    std::deque<Effects> pending_effects_;
    bool delivering_{false};

    std::shared_ptr<Lifetime> lifetime_;

    // Declared last: destroyed first, so its thread is joined while the
    // mutex above is still alive
    std::unique_ptr<IWebSocketTransport> transport_;
};

}  // namespace wscls
