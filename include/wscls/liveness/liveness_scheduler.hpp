#pragma once

#include "wscls/liveness/backoff_policy.hpp"

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace wscls {

// ═══════════════════════════════════════════════════════════════════════════
// Liveness Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct LivenessConfig {
    /// Interval between automatic pings while the connection is open.
    /// Raised to LivenessScheduler::kMinPingInterval if shorter.
    std::chrono::milliseconds ping_interval{20'000};

    /// Reconnect delays are clamped into [min, max]
    std::chrono::milliseconds reconnect_min_delay{1'000};
    std::chrono::milliseconds reconnect_max_delay{30'000};
    double reconnect_multiplier{2.0};
    double reconnect_jitter{0.0};

    /// 0 = keep retrying forever
    std::size_t max_reconnect_attempts{0};

    /// Overrides the exponential curve built from the fields above
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    LivenessConfig& with_ping_interval(std::chrono::milliseconds interval) {
        ping_interval = interval;
        return *this;
    }

    LivenessConfig& with_reconnect_delays(std::chrono::milliseconds min_delay,
                                          std::chrono::milliseconds max_delay) {
        reconnect_min_delay = min_delay;
        reconnect_max_delay = max_delay;
        return *this;
    }

    LivenessConfig& with_max_reconnect_attempts(std::size_t attempts) {
        max_reconnect_attempts = attempts;
        return *this;
    }

    LivenessConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
        backoff_policy = std::move(policy);
        return *this;
    }
};

struct ReconnectSchedule {
    std::uint64_t generation{0};
    std::chrono::milliseconds delay{0};
    std::size_t attempt{0};  ///< 1-based count since the last backoff reset
};

// ═══════════════════════════════════════════════════════════════════════════
// LivenessScheduler
// ═══════════════════════════════════════════════════════════════════════════
// Owns the three timers that keep a connection alive: the periodic ping timer,
// the one-shot reconnect timer and the one-shot close deadline.
//
// Every arm hands out a generation number which is passed back to the
// callback. Cancelling or re-arming a timer invalidates its generation, so a
// firing that raced with a cancel is dropped here, and the caller can check
// the generation again under its own lock.
//
// All timer operations run on an internal strand; the public methods may be
// called from any thread. Callbacks run on the executor without any scheduler
// lock held. The executor must outlive the scheduler.

class LivenessScheduler {
public:
    using TimerCallback = std::function<void(std::uint64_t generation)>;

    /// Shorter ping intervals are raised to this
    static constexpr std::chrono::milliseconds kMinPingInterval{1};

    LivenessScheduler(asio::any_io_executor executor, LivenessConfig config);
    ~LivenessScheduler();

    LivenessScheduler(const LivenessScheduler&) = delete;
    LivenessScheduler& operator=(const LivenessScheduler&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Ping
    // ─────────────────────────────────────────────────────────────────────────

    /// Start (or restart) the periodic ping timer. Returns its generation.
    std::uint64_t start_ping(TimerCallback on_tick);
    void stop_ping();

    // ─────────────────────────────────────────────────────────────────────────
    // Reconnect
    // ─────────────────────────────────────────────────────────────────────────

    /// Arm the reconnect timer with the next backoff delay.
    /// Returns nullopt when max_reconnect_attempts is exhausted.
    [[nodiscard]] std::optional<ReconnectSchedule> schedule_reconnect(TimerCallback on_fire);
    void cancel_reconnect();

    /// Next schedule_reconnect() starts from the minimum delay again.
    void reset_backoff();

    // ─────────────────────────────────────────────────────────────────────────
    // Close deadline
    // ─────────────────────────────────────────────────────────────────────────

    std::uint64_t arm_close_deadline(std::chrono::milliseconds delay, TimerCallback on_expire);
    void cancel_close_deadline();

    void cancel_all();

    [[nodiscard]] bool ping_active() const;
    [[nodiscard]] bool reconnect_pending() const;
    [[nodiscard]] bool close_deadline_armed() const;
    [[nodiscard]] std::size_t reconnect_attempt() const;

    [[nodiscard]] const LivenessConfig& config() const noexcept { return config_; }

private:
    enum class TimerKind : std::size_t { Ping = 0, Reconnect = 1, CloseDeadline = 2 };

    struct State;

    std::uint64_t arm(TimerKind kind, std::chrono::milliseconds delay, bool periodic,
                      TimerCallback callback);
    void cancel(TimerKind kind);
    [[nodiscard]] bool is_active(TimerKind kind) const;

    LivenessConfig config_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    std::shared_ptr<State> state_;
};

}  // namespace wscls
