#include "wscls/connection/connection_engine.hpp"
#include "wscls/log/logger.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <format>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace wscls {

namespace {

constexpr std::size_t kMaxOutstandingPings = 16;

template <typename T>
std::shared_ptr<T> require(std::shared_ptr<T> ptr, const char* what) {
    if (ptr == nullptr) {
        throw std::invalid_argument(std::string("ConnectionEngine: ") + what + " must not be null");
    }
    return ptr;
}

std::int64_t now_micros() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
}

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (out.empty() == false) {
            out += ", ";
        }
        out += name;
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lifetime
// ─────────────────────────────────────────────────────────────────────────────
// Shared with every timer and transport callback. close() stops new calls from
// entering the engine and waits for the ones already inside.

struct ConnectionEngine::Lifetime {
    std::mutex mutex;
    std::condition_variable drained;
    std::size_t in_flight{0};
    bool alive{true};

    bool enter() {
        std::lock_guard<std::mutex> lock(mutex);
        if (alive == false) {
            return false;
        }
        ++in_flight;
        return true;
    }

    void leave() {
        std::lock_guard<std::mutex> lock(mutex);
        --in_flight;
        if (in_flight == 0) {
            drained.notify_all();
        }
    }

    void close() {
        std::unique_lock<std::mutex> lock(mutex);
        alive = false;
        drained.wait(lock, [this]() { return in_flight == 0; });
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

ConnectionEngine::ConnectionEngine(
    asio::any_io_executor executor,
    std::shared_ptr<VariableStore> variables,
    std::unique_ptr<IWebSocketTransport> transport,
    std::shared_ptr<MessageChannel> channel,
    EngineConfig config
)
    : variables_(require(std::move(variables), "variable store"))
    , resolver_(*variables_)
    , channel_(require(std::move(channel), "message channel"))
    , config_(std::move(config))
    , scheduler_(std::move(executor), config_.liveness)
    , lifetime_(std::make_shared<Lifetime>())
    , transport_(std::move(transport))
{
    if (transport_ == nullptr) {
        throw std::invalid_argument("ConnectionEngine: transport must not be null");
    }
}

ConnectionEngine::~ConnectionEngine() {
    lifetime_->close();
    shutdown();
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

Result<void> ConnectionEngine::handle(Command command) {
    Result<void> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Effects effects;
        result = std::visit([this, &effects](auto& cmd) { return apply(cmd, effects); }, command);
        enqueue_locked(std::move(effects));
    }
    deliver_pending();
    return result;
}

Result<void> ConnectionEngine::connect(ConnectionConfig config) {
    return handle(command::Connect{std::move(config)});
}

Result<void> ConnectionEngine::send(std::string text) {
    return handle(command::Send{std::move(text)});
}

Result<void> ConnectionEngine::ping() {
    return handle(command::Ping{});
}

Result<void> ConnectionEngine::disconnect() {
    return handle(command::Disconnect{});
}

void ConnectionEngine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_attempt_ != 0) {
            transport_->abort();
            current_attempt_ = 0;
        }
        reset_timers_locked();
        outstanding_pings_.clear();

        Effects effects;
        set_state_locked(ConnectionState::Idle, effects);
        enqueue_locked(std::move(effects));
    }
    deliver_pending();
}

void ConnectionEngine::set_active_context(std::optional<std::string> context) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_context_ = std::move(context);
}

void ConnectionEngine::notify(Command command) {
    auto result = handle(std::move(command));
    if (result.has_value() == false) {
        get_logger().debug_fmt("Internal command rejected: {}", result.error().message);
    }
}

void ConnectionEngine::notify_guarded(const std::shared_ptr<Lifetime>& lifetime,
                                      ConnectionEngine* engine, Command command) {
    if (lifetime->enter() == false) {
        return;
    }

    struct Leave {
        Lifetime& lifetime;
        ~Leave() { lifetime.leave(); }
    } leave{*lifetime};

    engine->notify(std::move(command));
}

// ─────────────────────────────────────────────────────────────────────────────
// Operator commands
// ─────────────────────────────────────────────────────────────────────────────

Result<void> ConnectionEngine::apply(command::Connect& cmd, Effects& effects) {
    switch (state_) {
        case ConnectionState::Connecting:
        case ConnectionState::Open:
            return tl::unexpected(Error::already_active());
        case ConnectionState::Closing:
            return tl::unexpected(Error::invalid_state("Cannot connect while the connection is closing"));
        case ConnectionState::Idle:
        case ConnectionState::Closed:
        case ConnectionState::Failed:
            break;
    }

    auto valid = validate(cmd.config);
    if (valid.has_value() == false) {
        return valid;
    }

    // A manual connect starts the backoff curve over
    scheduler_.cancel_reconnect();
    reconnect_generation_ = 0;
    scheduler_.reset_backoff();

    active_context_ = cmd.config.active_context;
    snapshot_ = std::move(cmd.config);
    last_error_.clear();

    return start_attempt_locked(effects);
}

Result<void> ConnectionEngine::apply(command::Send& cmd, Effects& effects) {
    if (state_ != ConnectionState::Open) {
        return tl::unexpected(Error::invalid_state(
            std::format("Cannot send while {}", to_string(state_))));
    }

    std::string payload = std::move(cmd.text);
    if (snapshot_->use_template_for_data) {
        auto rendered = resolver_.render_detailed(payload, active_context_);
        if (rendered.unresolved.empty() == false) {
            get_logger().warn_fmt("Unresolved variables left in message: {}", join(rendered.unresolved));
        }
        payload = std::move(rendered.text);
    }

    auto sent = transport_->send_text(payload);
    if (sent.has_value() == false) {
        const std::string reason = "Send failed: " + sent.error().message;
        transport_->abort();
        current_attempt_ = 0;
        connection_lost_locked(reason, true, effects);
        return tl::unexpected(Error::transport_error(reason));
    }

    channel_->emit(Direction::Outbound, FrameKind::Text, std::move(payload));
    return {};
}

Result<void> ConnectionEngine::apply(command::Ping& /*cmd*/, Effects& effects) {
    if (state_ != ConnectionState::Open) {
        return tl::unexpected(Error::invalid_state(
            std::format("Cannot ping while {}", to_string(state_))));
    }
    return send_ping_locked(effects);
}

Result<void> ConnectionEngine::apply(command::Disconnect& /*cmd*/, Effects& effects) {
    switch (state_) {
        case ConnectionState::Idle:
        case ConnectionState::Closed:
        case ConnectionState::Closing:
            return tl::unexpected(Error::invalid_state(
                std::format("Nothing to disconnect while {}", to_string(state_))));

        case ConnectionState::Connecting:
            // The in-flight attempt never reaches Open
            transport_->abort();
            current_attempt_ = 0;
            reset_timers_locked();
            set_state_locked(ConnectionState::Closed, effects);
            WSCLS_LOG_INFO("Connection attempt cancelled");
            return {};

        case ConnectionState::Failed:
            scheduler_.cancel_reconnect();
            reconnect_generation_ = 0;
            set_state_locked(ConnectionState::Closed, effects);
            return {};

        case ConnectionState::Open:
            break;
    }

    scheduler_.stop_ping();
    ping_generation_ = 0;

    transport_->close();
    close_generation_ = scheduler_.arm_close_deadline(config_.close_timeout,
        [this, lifetime = lifetime_](std::uint64_t generation) {
            notify_guarded(lifetime, this, command::CloseDeadlineExpired{generation});
        });

    set_state_locked(ConnectionState::Closing, effects);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Timer commands
// ─────────────────────────────────────────────────────────────────────────────
// Stale generations and firings in a state the timer does not govern are
// dropped silently.

Result<void> ConnectionEngine::apply(command::PingTimerFired& cmd, Effects& effects) {
    const bool current = (state_ == ConnectionState::Open) && (cmd.generation == ping_generation_);
    if (current == false) {
        return {};
    }
    return send_ping_locked(effects);
}

Result<void> ConnectionEngine::apply(command::ReconnectTimerFired& cmd, Effects& effects) {
    const bool current = (state_ == ConnectionState::Failed) && (cmd.generation == reconnect_generation_);
    if (current == false) {
        return {};
    }
    reconnect_generation_ = 0;
    WSCLS_LOG_INFO("Reconnecting");
    return start_attempt_locked(effects);
}

Result<void> ConnectionEngine::apply(command::CloseDeadlineExpired& cmd, Effects& effects) {
    const bool current = (state_ == ConnectionState::Closing) && (cmd.generation == close_generation_);
    if (current == false) {
        return {};
    }
    get_logger().warn_fmt("Close handshake did not finish within {} ms, aborting",
                          config_.close_timeout.count());
    transport_->abort();
    current_attempt_ = 0;
    finish_close_locked(effects);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Transport events
// ─────────────────────────────────────────────────────────────────────────────

Result<void> ConnectionEngine::apply(command::TransportNotification& cmd, Effects& effects) {
    const bool stale = (current_attempt_ == 0) || (cmd.attempt != current_attempt_);
    if (stale) {
        WSCLS_LOG_TRACE("Dropping event from a superseded transport attempt");
        return {};
    }

    std::visit([this, &effects](auto& event) {
        using Event = std::decay_t<decltype(event)>;

        if constexpr (std::is_same_v<Event, TransportOpened>) {
            if (state_ != ConnectionState::Connecting) {
                return;
            }
            set_state_locked(ConnectionState::Open, effects);
            scheduler_.reset_backoff();
            if (snapshot_->auto_ping) {
                ping_generation_ = scheduler_.start_ping(
                    [this, lifetime = lifetime_](std::uint64_t generation) {
                        notify_guarded(lifetime, this, command::PingTimerFired{generation});
                    });
            }
            get_logger().info_fmt("Connected to {}", current_url_);

        } else if constexpr (std::is_same_v<Event, FrameReceived>) {
            const bool receiving = (state_ == ConnectionState::Open) || (state_ == ConnectionState::Closing);
            if (receiving) {
                channel_->emit(Direction::Inbound, event.kind, std::move(event.payload));
            }

        } else if constexpr (std::is_same_v<Event, PongReceived>) {
            const bool receiving = (state_ == ConnectionState::Open) || (state_ == ConnectionState::Closing);
            if (receiving) {
                on_pong_locked(std::move(event.payload));
            }

        } else if constexpr (std::is_same_v<Event, TransportClosed>) {
            current_attempt_ = 0;
            if (state_ == ConnectionState::Closing) {
                finish_close_locked(effects);
                return;
            }
            std::string reason = std::format("Connection closed by peer (code {})", event.code);
            if (event.reason.empty() == false) {
                reason += ": " + event.reason;
            }
            connection_lost_locked(std::move(reason), true, effects);

        } else if constexpr (std::is_same_v<Event, TransportFailed>) {
            current_attempt_ = 0;
            if (state_ == ConnectionState::Closing) {
                get_logger().debug_fmt("Transport failed while closing: {}", event.error.message);
                finish_close_locked(effects);
                return;
            }
            connection_lost_locked(event.error.message, true, effects);
        }
    }, cmd.event);

    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers (mutex_ held)
// ─────────────────────────────────────────────────────────────────────────────

Result<void> ConnectionEngine::start_attempt_locked(Effects& effects) {
    std::string url = snapshot_->endpoint;
    if (snapshot_->use_template_for_url) {
        auto rendered = resolver_.render_detailed(url, active_context_);
        if (rendered.unresolved.empty() == false) {
            get_logger().warn_fmt("Unresolved variables left in URL: {}", join(rendered.unresolved));
        }
        url = std::move(rendered.text);
    }
    current_url_ = url;

    OpenRequest request;
    request.url = std::move(url);
    request.headers = snapshot_->headers;
    request.ssl_verify = snapshot_->ssl_verify;
    request.handshake_timeout = config_.handshake_timeout;

    const std::uint64_t attempt = ++next_attempt_;
    current_attempt_ = attempt;
    outstanding_pings_.clear();
    set_state_locked(ConnectionState::Connecting, effects);
    get_logger().info_fmt("Connecting to {}", current_url_);

    auto opened = transport_->open(std::move(request),
        [this, lifetime = lifetime_, attempt](TransportEvent event) {
            notify_guarded(lifetime, this, command::TransportNotification{attempt, std::move(event)});
        });

    if (opened.has_value() == false) {
        current_attempt_ = 0;
        // A malformed URL fails the same way on every retry
        const bool retryable = (opened.error().code != TransportError::Code::InvalidUrl);
        connection_lost_locked(opened.error().message, retryable, effects);
        return tl::unexpected(Error::transport_error(opened.error().message));
    }

    return {};
}

Result<void> ConnectionEngine::send_ping_locked(Effects& effects) {
    std::string payload = std::to_string(now_micros());

    auto sent = transport_->send_ping(payload);
    if (sent.has_value() == false) {
        const std::string reason = "Ping failed: " + sent.error().message;
        transport_->abort();
        current_attempt_ = 0;
        connection_lost_locked(reason, true, effects);
        return tl::unexpected(Error::transport_error(reason));
    }

    outstanding_pings_.push_back(payload);
    if (outstanding_pings_.size() > kMaxOutstandingPings) {
        outstanding_pings_.pop_front();
    }

    channel_->emit(Direction::Outbound, FrameKind::Ping, std::move(payload));
    return {};
}

void ConnectionEngine::on_pong_locked(std::string payload) {
    std::optional<std::chrono::microseconds> round_trip;

    auto it = std::find(outstanding_pings_.begin(), outstanding_pings_.end(), payload);
    if (it != outstanding_pings_.end()) {
        std::int64_t sent_at = 0;
        const char* first = payload.data();
        const char* last = payload.data() + payload.size();
        const auto [ptr, ec] = std::from_chars(first, last, sent_at);
        const bool parsed = (ec == std::errc{}) && (ptr == last);
        if (parsed) {
            const auto elapsed = now_micros() - sent_at;
            round_trip = std::chrono::microseconds{std::max<std::int64_t>(elapsed, 0)};
        }
        outstanding_pings_.erase(outstanding_pings_.begin(), it + 1);
    }

    channel_->emit(Direction::Inbound, FrameKind::Pong, std::move(payload), round_trip);
}

void ConnectionEngine::connection_lost_locked(std::string reason, bool allow_reconnect, Effects& effects) {
    scheduler_.stop_ping();
    ping_generation_ = 0;
    outstanding_pings_.clear();

    get_logger().warn_fmt("Connection to {} failed: {}", current_url_, reason);
    last_error_ = std::move(reason);
    set_state_locked(ConnectionState::Failed, effects);

    const bool reconnect = allow_reconnect && snapshot_.has_value() && snapshot_->auto_reconnect;
    if (reconnect) {
        schedule_reconnect_locked(effects);
    }
}

void ConnectionEngine::schedule_reconnect_locked(Effects& effects) {
    auto schedule = scheduler_.schedule_reconnect(
        [this, lifetime = lifetime_](std::uint64_t generation) {
            notify_guarded(lifetime, this, command::ReconnectTimerFired{generation});
        });

    if (schedule.has_value() == false) {
        reconnect_generation_ = 0;
        const auto attempts = scheduler_.reconnect_attempt();
        get_logger().warn_fmt("Giving up after {} reconnect attempt(s)", attempts);
        effects.exhausted_after = attempts;
        return;
    }

    reconnect_generation_ = schedule->generation;
    get_logger().info_fmt("Reconnecting in {} ms (attempt {})",
                          schedule->delay.count(), schedule->attempt);
    effects.reconnect = *schedule;
}

void ConnectionEngine::finish_close_locked(Effects& effects) {
    reset_timers_locked();
    outstanding_pings_.clear();
    set_state_locked(ConnectionState::Closed, effects);
    WSCLS_LOG_INFO("Disconnected");
}

void ConnectionEngine::reset_timers_locked() {
    scheduler_.cancel_all();
    ping_generation_ = 0;
    reconnect_generation_ = 0;
    close_generation_ = 0;
}

void ConnectionEngine::set_state_locked(ConnectionState new_state, Effects& effects) {
    if (state_ == new_state) {
        return;
    }
    get_logger().debug_fmt("Connection state {} -> {}", to_string(state_), to_string(new_state));
    effects.changes.emplace_back(state_, new_state);
    state_ = new_state;
}

// ─────────────────────────────────────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionEngine::enqueue_locked(Effects effects) {
    const bool nothing_to_fire = effects.changes.empty() &&
                                 (effects.reconnect.has_value() == false) &&
                                 (effects.exhausted_after.has_value() == false);
    if (nothing_to_fire) {
        return;
    }
    pending_effects_.push_back(std::move(effects));
}

void ConnectionEngine::deliver_pending() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (delivering_) {
            return;  // The delivering thread runs these after its current batch
        }
        delivering_ = true;
    }

    for (;;) {
        Effects effects;
        std::vector<StateChangeCallback> state_callbacks;
        std::vector<ReconnectScheduledCallback> scheduled_callbacks;
        std::vector<ReconnectExhaustedCallback> exhausted_callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_effects_.empty()) {
                delivering_ = false;
                return;
            }
            effects = std::move(pending_effects_.front());
            pending_effects_.pop_front();
            state_callbacks = state_change_callbacks_;
            scheduled_callbacks = reconnect_scheduled_callbacks_;
            exhausted_callbacks = reconnect_exhausted_callbacks_;
        }

        try {
            for (const auto& [old_state, new_state] : effects.changes) {
                for (const auto& callback : state_callbacks) {
                    callback(old_state, new_state);
                }
            }

            if (effects.reconnect.has_value()) {
                for (const auto& callback : scheduled_callbacks) {
                    callback(*effects.reconnect);
                }
            }

            if (effects.exhausted_after.has_value()) {
                for (const auto& callback : exhausted_callbacks) {
                    callback(*effects.exhausted_after);
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            delivering_ = false;
            throw;
        }
    }
}

void ConnectionEngine::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

void ConnectionEngine::on_reconnect_scheduled(ReconnectScheduledCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_scheduled_callbacks_.push_back(std::move(callback));
}

void ConnectionEngine::on_reconnect_exhausted(ReconnectExhaustedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_exhausted_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

ConnectionState ConnectionEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ConnectionEngine::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::optional<std::string> ConnectionEngine::active_context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_context_;
}

std::string ConnectionEngine::current_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_url_;
}

std::size_t ConnectionEngine::reconnect_attempts() const {
    return scheduler_.reconnect_attempt();
}

bool ConnectionEngine::ping_timer_active() const {
    return scheduler_.ping_active();
}

bool ConnectionEngine::reconnect_timer_pending() const {
    return scheduler_.reconnect_pending();
}

}  // namespace wscls
