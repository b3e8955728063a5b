#include "wscls/liveness/liveness_scheduler.hpp"
#include "wscls/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <array>
#include <mutex>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// Shared timer state
// ─────────────────────────────────────────────────────────────────────────────
// Pending handlers hold a shared_ptr to this, never to the scheduler, so a
// handler completing after the scheduler is gone only sees `stopped`.

struct LivenessScheduler::State : std::enable_shared_from_this<LivenessScheduler::State> {
    struct TimerSlot {
        std::shared_ptr<asio::steady_timer> timer;
        std::uint64_t generation{0};
        bool active{false};
    };

    explicit State(asio::any_io_executor executor)
        : strand(asio::make_strand(std::move(executor)))
    {}

    TimerSlot& slot(TimerKind kind) {
        return slots[static_cast<std::size_t>(kind)];
    }

    void post_cancel(std::shared_ptr<asio::steady_timer> timer) {
        if (timer == nullptr) {
            return;
        }
        asio::post(strand, [timer = std::move(timer)]() { timer->cancel(); });
    }

    void await_fire(TimerKind kind, std::uint64_t generation, std::chrono::milliseconds interval,
                    bool periodic, std::shared_ptr<asio::steady_timer> timer,
                    TimerCallback callback) {
        auto self = shared_from_this();
        timer->async_wait(asio::bind_executor(strand,
            [self, kind, generation, interval, periodic, timer, callback](asio::error_code ec) {
                if (ec) {
                    return;  // Cancelled
                }

                {
                    std::lock_guard<std::mutex> lock(self->mutex);
                    if (self->stopped) {
                        return;
                    }
                    auto& current = self->slot(kind);
                    const bool is_current = current.active && (current.generation == generation);
                    if (is_current == false) {
                        return;
                    }
                    if (periodic == false) {
                        current.active = false;
                        current.timer.reset();
                    }
                }

                if (periodic) {
                    // Anchor on the previous expiry so ticks do not drift
                    timer->expires_at(timer->expiry() + interval);
                    self->await_fire(kind, generation, interval, periodic, timer, callback);
                }

                callback(generation);
            }));
    }

    asio::strand<asio::any_io_executor> strand;

    std::mutex mutex;
    std::array<TimerSlot, 3> slots{};
    std::uint64_t next_generation{0};
    std::size_t reconnect_attempt{0};
    bool stopped{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

LivenessScheduler::LivenessScheduler(asio::any_io_executor executor, LivenessConfig config)
    : config_(std::move(config))
    , state_(std::make_shared<State>(std::move(executor)))
{
    if (config_.ping_interval < kMinPingInterval) {
        get_logger().warn_fmt("Ping interval of {} ms raised to {} ms",
                              config_.ping_interval.count(), kMinPingInterval.count());
        config_.ping_interval = kMinPingInterval;
    }

    config_.reconnect_min_delay = std::max(config_.reconnect_min_delay, std::chrono::milliseconds{0});
    config_.reconnect_max_delay = std::max(config_.reconnect_max_delay, config_.reconnect_min_delay);

    backoff_ = config_.backoff_policy;
    if (backoff_ == nullptr) {
        backoff_ = std::make_shared<ExponentialBackoff>(
            config_.reconnect_min_delay,
            config_.reconnect_multiplier,
            config_.reconnect_max_delay,
            config_.reconnect_jitter
        );
    }
}

LivenessScheduler::~LivenessScheduler() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopped = true;
    }
    cancel_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Ping
// ─────────────────────────────────────────────────────────────────────────────

std::uint64_t LivenessScheduler::start_ping(TimerCallback on_tick) {
    const auto generation = arm(TimerKind::Ping, config_.ping_interval, true, std::move(on_tick));
    get_logger().debug_fmt("Ping timer started (every {} ms, generation {})",
                           config_.ping_interval.count(), generation);
    return generation;
}

void LivenessScheduler::stop_ping() {
    cancel(TimerKind::Ping);
}

// ─────────────────────────────────────────────────────────────────────────────
// Reconnect
// ─────────────────────────────────────────────────────────────────────────────

std::optional<ReconnectSchedule> LivenessScheduler::schedule_reconnect(TimerCallback on_fire) {
    std::size_t attempt = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const bool limited = (config_.max_reconnect_attempts > 0);
        const bool exhausted = limited && (state_->reconnect_attempt >= config_.max_reconnect_attempts);
        if (exhausted) {
            return std::nullopt;
        }
        attempt = state_->reconnect_attempt++;
    }

    const auto delay = std::clamp(
        backoff_->next_delay(attempt),
        config_.reconnect_min_delay,
        config_.reconnect_max_delay
    );

    const auto generation = arm(TimerKind::Reconnect, delay, false, std::move(on_fire));
    get_logger().debug_fmt("Reconnect #{} scheduled in {} ms", attempt + 1, delay.count());

    return ReconnectSchedule{
        .generation = generation,
        .delay = delay,
        .attempt = attempt + 1
    };
}

void LivenessScheduler::cancel_reconnect() {
    cancel(TimerKind::Reconnect);
}

void LivenessScheduler::reset_backoff() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->reconnect_attempt = 0;
    }
    backoff_->reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Close deadline
// ─────────────────────────────────────────────────────────────────────────────

std::uint64_t LivenessScheduler::arm_close_deadline(std::chrono::milliseconds delay,
                                                    TimerCallback on_expire) {
    return arm(TimerKind::CloseDeadline, delay, false, std::move(on_expire));
}

void LivenessScheduler::cancel_close_deadline() {
    cancel(TimerKind::CloseDeadline);
}

void LivenessScheduler::cancel_all() {
    cancel(TimerKind::Ping);
    cancel(TimerKind::Reconnect);
    cancel(TimerKind::CloseDeadline);
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

bool LivenessScheduler::ping_active() const {
    return is_active(TimerKind::Ping);
}

bool LivenessScheduler::reconnect_pending() const {
    return is_active(TimerKind::Reconnect);
}

bool LivenessScheduler::close_deadline_armed() const {
    return is_active(TimerKind::CloseDeadline);
}

std::size_t LivenessScheduler::reconnect_attempt() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reconnect_attempt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

std::uint64_t LivenessScheduler::arm(TimerKind kind, std::chrono::milliseconds delay,
                                     bool periodic, TimerCallback callback) {
    std::uint64_t generation = 0;
    std::shared_ptr<asio::steady_timer> previous;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto& slot = state_->slot(kind);
        previous = std::move(slot.timer);
        generation = ++state_->next_generation;
        slot.generation = generation;
        slot.active = true;
    }
    state_->post_cancel(std::move(previous));

    // The timer is created and armed on the strand; a cancel issued before
    // this runs leaves the generation stale and nothing is armed.
    auto state = state_;
    asio::post(state->strand,
        [state, kind, generation, delay, periodic, callback = std::move(callback)]() {
            auto timer = std::make_shared<asio::steady_timer>(state->strand);
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                auto& slot = state->slot(kind);
                const bool still_wanted = slot.active && (slot.generation == generation);
                if (still_wanted == false) {
                    return;
                }
                slot.timer = timer;
            }
            timer->expires_after(delay);
            state->await_fire(kind, generation, delay, periodic, timer, callback);
        });

    return generation;
}

void LivenessScheduler::cancel(TimerKind kind) {
    std::shared_ptr<asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto& slot = state_->slot(kind);
        slot.active = false;
        slot.generation = 0;
        timer = std::move(slot.timer);
    }
    state_->post_cancel(std::move(timer));
}

bool LivenessScheduler::is_active(TimerKind kind) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->slot(kind).active;
}

}  // namespace wscls
